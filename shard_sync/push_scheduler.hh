/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <variant>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/metrics_registration.hh>
#include <seastar/core/queue.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/timer.hh>

#include "shard_sync/bucket_window.hh"
#include "shard_sync/event_classifier.hh"
#include "shard_sync/push_executor.hh"
#include "shard_sync/sync_settings.hh"

namespace shard_sync {

// Turns the stream of database change events into rate-limited pushes.
//
// Updated shards are queued in a bucket_window; every `frequency` the
// oldest bucket is flushed to the push_executor, so a shard is pushed at
// most once per window rotation however often it is written, and at most
// window_length() * frequency after being queued. Updates of the control
// databases and shard deletions are acted upon immediately.
//
// All state is owned by a single fiber on the owner shard which processes
// messages one at a time, in submission order. Every message, including
// timer expiry, ends with the flush check which either flushes the oldest
// bucket or re-arms the flush timer for when the next flush is due.
template <typename Clock = seastar::lowres_clock>
class push_scheduler {
public:
    using clock_type = Clock;

    struct flush_tick {};
    struct reconfigure {
        sync_settings settings;
    };
    struct quiesce_request {
        promise<> processed;
    };
    using message = std::variant<classified_event, flush_tick, reconfigure, quiesce_request>;

    struct stats {
        uint64_t events_received = 0;
        uint64_t updates_coalesced = 0;
        uint64_t flushes = 0;
        uint64_t reconfigurations = 0;
    };

    static constexpr size_t mailbox_size = 1024;
private:
    const control_databases _control;
    push_executor& _executor;
    sync_settings _settings;
    bucket_window _window;
    std::optional<typename Clock::time_point> _last_flush;
    timer<Clock> _flush_timer;
    queue<message> _mailbox;
    // Serializes producers waiting for room in the mailbox.
    semaphore _producers{1};
    const unsigned _owner_shard;
    future<> _actor = make_ready_future<>();
    bool _started = false;
    bool _stopped = false;
    stats _stats;
    seastar::metrics::metric_groups _metrics;
public:
    push_scheduler(control_databases control, push_executor& executor, sync_settings settings);

    push_scheduler(const push_scheduler&) = delete;
    push_scheduler(push_scheduler&&) = delete;

    // Starts the actor fiber and arms the flush timer. Owner shard only.
    void start();

    // Stops the actor. Buckets not yet flushed are dropped.
    future<> stop();

    // Queues a message for the actor. May be called from any shard.
    future<> submit(message m);

    // Resolves once every message submitted before it was processed.
    // May be called from any shard.
    future<> quiesce();

    // The operations below are the actor's message handlers. They may also
    // be called directly on the owner shard.

    void on_event(const classified_event& ev);
    void on_flush_tick();
    void on_reconfigure(const sync_settings& settings);

    const bucket_window& window() const noexcept {
        return _window;
    }

    const sync_settings& settings() const noexcept {
        return _settings;
    }

    std::optional<typename Clock::time_point> last_flush() const noexcept {
        return _last_flush;
    }

    // Time at which the flush timer will expire, if armed.
    std::optional<typename Clock::time_point> next_wakeup() const noexcept;

    const stats& get_stats() const noexcept {
        return _stats;
    }
private:
    future<> enqueue(message m);
    future<> run();
    void process(message m);
    void maybe_push_shards();
    void push_oldest_bucket();
    void arm_flush_timer(typename Clock::time_point now, typename Clock::duration d);
    void on_flush_tick_expired();
};

}
