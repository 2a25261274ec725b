/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <stdexcept>
#include <fmt/chrono.h>

#include "shard_sync/bucket_window.hh"

namespace shard_sync {

bucket_window::bucket_window(size_t length)
        : _buckets(std::max<size_t>(length, 1)) {
}

size_t bucket_window::length_for(std::chrono::milliseconds delay, std::chrono::milliseconds frequency) {
    if (frequency.count() <= 0) {
        throw std::invalid_argument(fmt::format("sync frequency must be positive, got {}", frequency));
    }
    if (delay.count() < 0) {
        throw std::invalid_argument(fmt::format("sync delay must not be negative, got {}", delay));
    }
    return size_t(delay / frequency) + 1;
}

size_t bucket_window::queued() const noexcept {
    size_t n = 0;
    for (auto& b : _buckets) {
        n += b.size();
    }
    return n;
}

bool bucket_window::contains(const shard_id& id) const noexcept {
    return std::any_of(_buckets.begin(), _buckets.end(), [&id] (const bucket& b) {
        return b.contains(id);
    });
}

bool bucket_window::add(shard_id id) {
    if (contains(id)) {
        return false;
    }
    _buckets.front().insert(std::move(id));
    return true;
}

bucket_window::bucket bucket_window::rotate() {
    auto oldest = std::move(_buckets.back());
    _buckets.pop_back();
    _buckets.emplace_front();
    return oldest;
}

void bucket_window::resize(size_t new_length) {
    new_length = std::max<size_t>(new_length, 1);
    auto old_length = _buckets.size();
    if (new_length < old_length) {
        auto& target = _buckets[new_length - 1];
        for (auto i = new_length; i < old_length; ++i) {
            target.merge(_buckets[i]);
        }
        _buckets.resize(new_length);
    } else if (new_length > old_length) {
        // Built aside so that a failed allocation leaves the window as it was.
        std::deque<bucket> grown(new_length);
        std::move(_buckets.begin(), _buckets.end(), grown.begin() + (new_length - old_length));
        _buckets = std::move(grown);
    }
}

}
