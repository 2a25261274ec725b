/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>

#include "shard_sync/reconfiguration.hh"

using namespace shard_sync;
using namespace std::chrono_literals;

SEASTAR_THREAD_TEST_CASE(test_parse_values) {
    BOOST_REQUIRE(reconfiguration_handler::parse_delay("5000") == 5000ms);
    BOOST_REQUIRE(reconfiguration_handler::parse_delay("0") == 0ms);
    BOOST_REQUIRE(reconfiguration_handler::parse_frequency("1") == 1ms);

    for (auto bad : {"abc", "-5", "", "12x", " 12", "1.5", "99999999999"}) {
        BOOST_REQUIRE(!reconfiguration_handler::parse_delay(bad));
        BOOST_REQUIRE(!reconfiguration_handler::parse_frequency(bad));
    }

    BOOST_REQUIRE(!reconfiguration_handler::parse_frequency("0"));
}

SEASTAR_THREAD_TEST_CASE(test_initial_settings) {
    auto s = reconfiguration_handler::initial_settings("2000", "100");
    BOOST_REQUIRE(s.delay == 2000ms);
    BOOST_REQUIRE(s.frequency == 100ms);
    BOOST_REQUIRE_EQUAL(s.window_length(), 21);

    s = reconfiguration_handler::initial_settings("abc", "0");
    BOOST_REQUIRE(s.delay == sync_settings::default_delay);
    BOOST_REQUIRE(s.frequency == sync_settings::default_frequency);
    BOOST_REQUIRE_EQUAL(s.window_length(), 11);
}

SEASTAR_THREAD_TEST_CASE(test_accepted_change_bumps_version) {
    reconfiguration_handler h;

    auto s = h.on_config_change(sync_delay_option, "1000");
    BOOST_REQUIRE(s);
    BOOST_REQUIRE(s->delay == 1000ms);
    BOOST_REQUIRE(s->frequency == 500ms);
    BOOST_REQUIRE_EQUAL(s->version, 1);

    s = h.on_config_change(sync_frequency_option, "250");
    BOOST_REQUIRE(s);
    BOOST_REQUIRE(s->delay == 1000ms);
    BOOST_REQUIRE(s->frequency == 250ms);
    BOOST_REQUIRE_EQUAL(s->version, 2);
    BOOST_REQUIRE_EQUAL(s->window_length(), 5);

    BOOST_REQUIRE_EQUAL(h.current().version, 2);
    BOOST_REQUIRE_EQUAL(h.bad_values(), 0);
}

SEASTAR_THREAD_TEST_CASE(test_bad_value_keeps_settings) {
    reconfiguration_handler h;

    BOOST_REQUIRE(!h.on_config_change(sync_delay_option, "abc"));
    BOOST_REQUIRE(!h.on_config_change(sync_frequency_option, "0"));
    BOOST_REQUIRE(!h.on_config_change(sync_frequency_option, "-5"));

    BOOST_REQUIRE(h.current().delay == 5000ms);
    BOOST_REQUIRE(h.current().frequency == 500ms);
    BOOST_REQUIRE_EQUAL(h.current().version, 0);
    BOOST_REQUIRE_EQUAL(h.bad_values(), 3);
}

SEASTAR_THREAD_TEST_CASE(test_unchanged_value_is_not_reported) {
    reconfiguration_handler h;
    BOOST_REQUIRE(!h.on_config_change(sync_delay_option, "5000"));
    BOOST_REQUIRE(!h.on_config_change(sync_frequency_option, "500"));
    BOOST_REQUIRE_EQUAL(h.current().version, 0);
    BOOST_REQUIRE_EQUAL(h.bad_values(), 0);
}

SEASTAR_THREAD_TEST_CASE(test_other_options_are_ignored) {
    reconfiguration_handler h;
    BOOST_REQUIRE(!h.on_config_change("users_db", "_users"));
    BOOST_REQUIRE(!h.on_config_change("sync_delay", "abc"));
    BOOST_REQUIRE_EQUAL(h.bad_values(), 0);
    BOOST_REQUIRE_EQUAL(h.current().version, 0);
}

SEASTAR_THREAD_TEST_CASE(test_oversized_window_is_rejected) {
    reconfiguration_handler h;

    // Parses, but 8000001 buckets at the current frequency is too many.
    BOOST_REQUIRE(!h.on_config_change(sync_delay_option, "4000000000"));
    BOOST_REQUIRE_EQUAL(h.bad_values(), 1);
    BOOST_REQUIRE(h.current().delay == 5000ms);
    BOOST_REQUIRE_EQUAL(h.current().version, 0);

    // A frequency that would blow up the current delay is rejected the same way.
    BOOST_REQUIRE(!h.on_config_change(sync_frequency_option, "1"));
    BOOST_REQUIRE_EQUAL(h.bad_values(), 2);
    BOOST_REQUIRE(h.current().frequency == 500ms);

    // The largest window is accepted.
    BOOST_REQUIRE(h.on_config_change(sync_delay_option, "4999"));
    auto s = h.on_config_change(sync_frequency_option, "1");
    BOOST_REQUIRE(s);
    BOOST_REQUIRE_EQUAL(s->window_length(), sync_settings::max_window_length / 2);

    BOOST_REQUIRE(h.on_config_change(sync_delay_option, "9999"));
    BOOST_REQUIRE_EQUAL(h.current().window_length(), sync_settings::max_window_length);
    BOOST_REQUIRE(!h.on_config_change(sync_delay_option, "10000"));
    BOOST_REQUIRE_EQUAL(h.bad_values(), 3);
    BOOST_REQUIRE_EQUAL(h.current().version, 3);
}

SEASTAR_THREAD_TEST_CASE(test_initial_oversized_window_uses_defaults) {
    auto s = reconfiguration_handler::initial_settings("4000000000", "1");
    BOOST_REQUIRE(s.delay == sync_settings::default_delay);
    BOOST_REQUIRE(s.frequency == sync_settings::default_frequency);
    BOOST_REQUIRE_EQUAL(s.window_length(), 11);
}
