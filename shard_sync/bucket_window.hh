/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <deque>
#include <unordered_set>

#include "shard_sync/shard_name.hh"

namespace shard_sync {

// Debounce queue of shards waiting to be pushed.
//
// The window is an ordered sequence of buckets, index 0 being the newest
// and index length()-1 the oldest, next to be flushed. A shard is kept in
// at most one bucket at a time: updates to a shard that is already queued
// are absorbed until its bucket is flushed. With a flush every `frequency`
// and length() == delay / frequency + 1, a queued shard waits at most
// length() flush periods.
class bucket_window {
public:
    using bucket = std::unordered_set<shard_id>;
private:
    std::deque<bucket> _buckets;
public:
    explicit bucket_window(size_t length);

    // Number of buckets needed so that a shard is pushed within `delay`
    // when the oldest bucket is flushed every `frequency`.
    // Throws std::invalid_argument if frequency is not positive.
    static size_t length_for(std::chrono::milliseconds delay, std::chrono::milliseconds frequency);

    size_t length() const noexcept {
        return _buckets.size();
    }

    // Total number of shards across all buckets.
    size_t queued() const noexcept;

    bool contains(const shard_id& id) const noexcept;

    // Queues the shard in the newest bucket unless it is queued already.
    // Returns true if the shard was added.
    bool add(shard_id id);

    // Removes and returns the oldest bucket, shifting the others one slot
    // older and starting a new, empty bucket at index 0.
    bucket rotate();

    // Changes the number of buckets without dropping any queued shard.
    // Shrinking merges the oldest (length() - new_length + 1) buckets into
    // one, which becomes the new oldest bucket. Growing adds empty buckets
    // at the newest end.
    void resize(size_t new_length);

    const bucket& operator[](size_t i) const {
        return _buckets.at(i);
    }

    auto begin() const noexcept { return _buckets.begin(); }
    auto end() const noexcept { return _buckets.end(); }
};

}
