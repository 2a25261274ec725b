/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <charconv>
#include <fmt/chrono.h>

#include "shard_sync/reconfiguration.hh"
#include "log.hh"

namespace shard_sync {

extern logging::logger slogger;

static std::optional<std::chrono::milliseconds> parse_milliseconds(std::string_view value) noexcept {
    uint32_t ms = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
    if (ec != std::errc() || end != value.data() + value.size() || value.empty()) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(ms);
}

std::optional<std::chrono::milliseconds> reconfiguration_handler::parse_delay(std::string_view value) noexcept {
    return parse_milliseconds(value);
}

std::optional<std::chrono::milliseconds> reconfiguration_handler::parse_frequency(std::string_view value) noexcept {
    auto ms = parse_milliseconds(value);
    if (ms && ms->count() == 0) {
        return std::nullopt;
    }
    return ms;
}

sync_settings reconfiguration_handler::initial_settings(std::string_view delay, std::string_view frequency) {
    sync_settings s;
    if (auto d = parse_delay(delay)) {
        s.delay = *d;
    } else {
        slogger.warn("ignoring bad value for {}: {}, using {}", sync_delay_option, delay, s.delay);
    }
    if (auto f = parse_frequency(frequency)) {
        s.frequency = *f;
    } else {
        slogger.warn("ignoring bad value for {}: {}, using {}", sync_frequency_option, frequency, s.frequency);
    }
    if (s.window_length() > sync_settings::max_window_length) {
        slogger.warn("ignoring {}={} with {}={}: window exceeds {} buckets, using {} and {}",
                sync_delay_option, delay, sync_frequency_option, frequency, sync_settings::max_window_length,
                sync_settings::default_delay, sync_settings::default_frequency);
        s.delay = sync_settings::default_delay;
        s.frequency = sync_settings::default_frequency;
    }
    return s;
}

std::optional<sync_settings> reconfiguration_handler::on_config_change(std::string_view name, std::string_view value) {
    std::optional<std::chrono::milliseconds> parsed;
    std::chrono::milliseconds sync_settings::* field;
    if (name == sync_delay_option) {
        parsed = parse_delay(value);
        field = &sync_settings::delay;
    } else if (name == sync_frequency_option) {
        parsed = parse_frequency(value);
        field = &sync_settings::frequency;
    } else {
        return std::nullopt;
    }
    if (!parsed) {
        ++_bad_values;
        slogger.warn("ignoring bad value for {}: {}", name, value);
        return std::nullopt;
    }
    if (_settings.*field == *parsed) {
        return std::nullopt;
    }
    auto next = _settings;
    next.*field = *parsed;
    if (next.window_length() > sync_settings::max_window_length) {
        ++_bad_values;
        slogger.warn("ignoring bad value for {}: {} (window of {} buckets exceeds {})",
                name, value, next.window_length(), sync_settings::max_window_length);
        return std::nullopt;
    }
    _settings = next;
    ++_settings.version;
    return _settings;
}

}
