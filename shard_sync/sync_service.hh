/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/metrics_registration.hh>

#include "shard_sync/event_classifier.hh"
#include "shard_sync/notification_source.hh"
#include "shard_sync/push_executor.hh"
#include "shard_sync/push_scheduler.hh"
#include "shard_sync/reconfiguration.hh"

namespace db {
class config;
}

namespace shard_sync {

// Pushes updated shards and cluster control databases to peer nodes.
//
// Listens for database events and for changes of the sync tunables, and
// feeds both to a push_scheduler running on the shard the service was
// created on. Notifications are expected on that shard as well. If either
// notification feed is lost, the service resubscribes after
// `subscription_retry_delay`.
class sync_service final : public db_event_listener, public config_listener {
public:
    struct config {
        control_databases control;
        sync_settings settings;
        std::chrono::milliseconds subscription_retry_delay{5000};
        // Database events waiting for room in the scheduler's mailbox
        // beyond this many are dropped.
        size_t max_pending_events = 4096;
    };

    static config make_config(const db::config& cfg);
private:
    const std::chrono::milliseconds _subscription_retry_delay;
    const size_t _max_pending_events;
    db_event_source& _events;
    config_source& _config_updates;
    event_classifier _classifier;
    reconfiguration_handler _reconfiguration;
    push_executor _executor;
    push_scheduler<> _scheduler;
    abort_source _as;
    seastar::gate _submissions;
    future<> _event_subscription = make_ready_future<>();
    future<> _config_subscription = make_ready_future<>();
    uint64_t _unknown_events = 0;
    size_t _pending_events = 0;
    uint64_t _dropped_events = 0;
    seastar::metrics::metric_groups _metrics;
public:
    sync_service(config cfg,
            db_event_source& events,
            config_source& config_updates,
            shard_directory& directory,
            const membership& membership,
            push_transport& transport);

    future<> start();
    future<> stop();

    void on_db_event(std::string_view db_name, std::string_view kind) override;
    void on_config_change(std::string_view name, std::string_view value) override;

    push_scheduler<>& scheduler() noexcept {
        return _scheduler;
    }

    const push_executor& executor() const noexcept {
        return _executor;
    }

    const reconfiguration_handler& reconfiguration() const noexcept {
        return _reconfiguration;
    }

    uint64_t unknown_events() const noexcept {
        return _unknown_events;
    }

    uint64_t dropped_events() const noexcept {
        return _dropped_events;
    }
private:
    void submit(push_scheduler<>::message m);
    void submit_event(classified_event ev);

    template <typename Listener>
    future<> keep_listening(notification_source<Listener>& source, Listener& listener, const char* what);
};

}
