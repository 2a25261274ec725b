/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <fmt/chrono.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/metrics.hh>
#include <seastar/core/sleep.hh>

#include "shard_sync/sync_service.hh"
#include "db/config.hh"
#include "log.hh"

namespace shard_sync {

extern logging::logger slogger;

sync_service::config sync_service::make_config(const db::config& cfg) {
    config c;
    c.control = control_databases{
        .nodes = cfg.nodes_db(),
        .shards = cfg.shards_db(),
        .users = cfg.users_db(),
    };
    c.settings = reconfiguration_handler::initial_settings(cfg.sync_delay_in_ms(), cfg.sync_frequency_in_ms());
    auto& retry = cfg.sync_subscription_retry_delay_in_ms;
    if (auto d = reconfiguration_handler::parse_delay(retry())) {
        c.subscription_retry_delay = *d;
    } else {
        slogger.warn("ignoring bad value for {}: {}, using {}", retry.name(), retry(), c.subscription_retry_delay);
    }
    return c;
}

sync_service::sync_service(config cfg,
        db_event_source& events,
        config_source& config_updates,
        shard_directory& directory,
        const membership& membership,
        push_transport& transport)
        : _subscription_retry_delay(cfg.subscription_retry_delay)
        , _max_pending_events(cfg.max_pending_events)
        , _events(events)
        , _config_updates(config_updates)
        , _classifier(cfg.control)
        , _reconfiguration(cfg.settings)
        , _executor(directory, membership, transport)
        , _scheduler(std::move(cfg.control), _executor, cfg.settings)
{
    namespace sm = seastar::metrics;

    _metrics.add_group("shard_sync", {
        sm::make_counter("bad_config_values", [this] { return _reconfiguration.bad_values(); },
                sm::description("Number of rejected values of sync delay or frequency.")),
        sm::make_counter("unknown_events", _unknown_events,
                sm::description("Number of database events of a kind not known to this node.")),
        sm::make_counter("dropped_events", _dropped_events,
                sm::description("Number of database events dropped because too many were waiting for the push scheduler.")),
    });
}

template <typename Listener>
future<> sync_service::keep_listening(notification_source<Listener>& source, Listener& listener, const char* what) {
    while (!_as.abort_requested()) {
        try {
            co_await source.listen(listener);
            if (_as.abort_requested()) {
                break;
            }
            slogger.warn("Lost {} subscription, resubscribing in {}", what, _subscription_retry_delay);
        } catch (...) {
            slogger.warn("Lost {} subscription: {}, resubscribing in {}", what, std::current_exception(), _subscription_retry_delay);
        }
        try {
            co_await sleep_abortable(_subscription_retry_delay, _as);
        } catch (const abort_requested_exception&) {
            break;
        }
    }
}

future<> sync_service::start() {
    slogger.info("Starting shard sync: control databases {}, {}, {}",
            _classifier.control().nodes, _classifier.control().shards, _classifier.control().users);
    _scheduler.start();
    _event_subscription = keep_listening<db_event_listener>(_events, *this, "database event");
    _config_subscription = keep_listening<config_listener>(_config_updates, *this, "configuration");
    return make_ready_future<>();
}

future<> sync_service::stop() {
    _as.request_abort();
    try {
        co_await _events.stop_listening(*this);
    } catch (...) {
        slogger.warn("Failed to unsubscribe from database events: {}", std::current_exception());
    }
    try {
        co_await _config_updates.stop_listening(*this);
    } catch (...) {
        slogger.warn("Failed to unsubscribe from configuration updates: {}", std::current_exception());
    }
    co_await std::move(_event_subscription);
    co_await std::move(_config_subscription);
    co_await _submissions.close();
    co_await _scheduler.stop();
    co_await _executor.stop();
    slogger.info("Stopped shard sync");
}

void sync_service::submit(push_scheduler<>::message m) {
    if (_submissions.is_closed()) {
        return;
    }
    (void)with_gate(_submissions, [this, m = std::move(m)] () mutable {
        return _scheduler.submit(std::move(m));
    }).handle_exception([] (std::exception_ptr ep) {
        slogger.warn("Failed to submit to push scheduler: {}", ep);
    });
}

void sync_service::submit_event(classified_event ev) {
    if (_submissions.is_closed()) {
        return;
    }
    if (_pending_events >= _max_pending_events) {
        ++_dropped_events;
        slogger.debug("Dropping {}: {} events already waiting", ev, _pending_events);
        return;
    }
    ++_pending_events;
    (void)with_gate(_submissions, [this, ev = std::move(ev)] () mutable {
        return _scheduler.submit(std::move(ev)).finally([this] {
            --_pending_events;
        });
    }).handle_exception([] (std::exception_ptr ep) {
        slogger.warn("Failed to submit to push scheduler: {}", ep);
    });
}

void sync_service::on_db_event(std::string_view db_name, std::string_view kind) {
    auto parsed = parse_db_event_kind(kind);
    if (!parsed) {
        ++_unknown_events;
        slogger.info("Unexpected event {} for {}, ignoring", kind, db_name);
        submit_event(ignored{});
        return;
    }
    submit_event(_classifier.classify(db_name, *parsed));
}

void sync_service::on_config_change(std::string_view name, std::string_view value) {
    if (auto settings = _reconfiguration.on_config_change(name, value)) {
        submit(push_scheduler<>::reconfigure{*settings});
    }
}

}
