/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "shard_sync/bucket_window.hh"

namespace shard_sync {

constexpr std::string_view sync_delay_option = "sync_delay_in_ms";
constexpr std::string_view sync_frequency_option = "sync_frequency_in_ms";

// Tunables of the push scheduler.
//
// `frequency` is how often the oldest bucket is flushed, `delay` bounds
// how long a queued shard may wait. `version` increases with every
// accepted change so stale settings can be told apart from newer ones.
struct sync_settings {
    static constexpr std::chrono::milliseconds default_delay{5000};
    static constexpr std::chrono::milliseconds default_frequency{500};
    // Upper bound on delay / frequency + 1.
    static constexpr size_t max_window_length = 10000;

    std::chrono::milliseconds delay = default_delay;
    std::chrono::milliseconds frequency = default_frequency;
    uint64_t version = 0;

    size_t window_length() const {
        return bucket_window::length_for(delay, frequency);
    }
};

}
