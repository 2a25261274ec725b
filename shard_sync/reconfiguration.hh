/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>

#include "shard_sync/sync_settings.hh"

namespace shard_sync {

// Validates changes to the scheduler tunables.
//
// Values arrive as raw strings from the configuration source. A value
// which is not a non-negative integer (or a zero frequency), or which
// would need more than sync_settings::max_window_length buckets, is logged
// and dropped, leaving the settings as they were.
class reconfiguration_handler {
    sync_settings _settings;
    uint64_t _bad_values = 0;
public:
    reconfiguration_handler() = default;
    explicit reconfiguration_handler(sync_settings initial)
            : _settings(initial) {
    }

    // Settings from the initial raw values, defaulting whatever is malformed.
    static sync_settings initial_settings(std::string_view delay, std::string_view frequency);

    static std::optional<std::chrono::milliseconds> parse_delay(std::string_view value) noexcept;
    static std::optional<std::chrono::milliseconds> parse_frequency(std::string_view value) noexcept;

    // Returns the new settings if `name` is one of the tunables and `value`
    // was accepted, std::nullopt otherwise.
    std::optional<sync_settings> on_config_change(std::string_view name, std::string_view value);

    const sync_settings& current() const noexcept {
        return _settings;
    }

    uint64_t bad_values() const noexcept {
        return _bad_values;
    }
};

}
