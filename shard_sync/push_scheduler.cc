/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <stdexcept>
#include <fmt/chrono.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/manual_clock.hh>
#include <seastar/core/metrics.hh>
#include <seastar/core/smp.hh>

#include "shard_sync/push_scheduler.hh"
#include "utils/assert.hh"
#include "log.hh"

namespace shard_sync {

logging::logger slogger("shard_sync");

class scheduler_stopped : public std::runtime_error {
public:
    scheduler_stopped() : std::runtime_error("push scheduler stopped") {}
};

template <typename Clock>
push_scheduler<Clock>::push_scheduler(control_databases control, push_executor& executor, sync_settings settings)
        : _control(std::move(control))
        , _executor(executor)
        , _settings(settings)
        , _window(settings.window_length())
        , _flush_timer([this] { on_flush_tick_expired(); })
        , _mailbox(mailbox_size)
        , _owner_shard(this_shard_id())
{
    namespace sm = seastar::metrics;

    _metrics.add_group("shard_sync", {
        sm::make_counter("events_received", _stats.events_received,
                sm::description("Number of database events processed by the push scheduler.")),
        sm::make_counter("updates_coalesced", _stats.updates_coalesced,
                sm::description("Number of shard updates absorbed because the shard was already queued.")),
        sm::make_counter("flushes", _stats.flushes,
                sm::description("Number of times the oldest bucket was flushed.")),
        sm::make_counter("reconfigurations", _stats.reconfigurations,
                sm::description("Number of applied changes of sync delay or frequency.")),
        sm::make_gauge("shards_queued", [this] { return _window.queued(); },
                sm::description("Number of shards waiting to be pushed.")),
        sm::make_gauge("window_length", [this] { return _window.length(); },
                sm::description("Number of buckets in the debounce window.")),
    });
}

template <typename Clock>
void push_scheduler<Clock>::start() {
    SHARD_SYNC_ASSERT(this_shard_id() == _owner_shard);
    SHARD_SYNC_ASSERT(!_started);
    _started = true;
    slogger.info("Starting push scheduler: delay={} frequency={} buckets={}", _settings.delay, _settings.frequency, _window.length());
    _actor = run();
    maybe_push_shards();
}

template <typename Clock>
future<> push_scheduler<Clock>::stop() {
    SHARD_SYNC_ASSERT(this_shard_id() == _owner_shard);
    if (_stopped) {
        co_return;
    }
    _stopped = true;
    _flush_timer.cancel();
    _producers.broken(std::make_exception_ptr(scheduler_stopped()));
    _mailbox.abort(std::make_exception_ptr(scheduler_stopped()));
    co_await std::move(_actor);
    if (auto dropped = _window.queued()) {
        slogger.info("Push scheduler stopped, dropping {} queued shards", dropped);
    } else {
        slogger.info("Push scheduler stopped");
    }
}

template <typename Clock>
future<> push_scheduler<Clock>::enqueue(message m) {
    return with_semaphore(_producers, 1, [this, m = std::move(m)] () mutable {
        return _mailbox.push_eventually(std::move(m));
    });
}

template <typename Clock>
future<> push_scheduler<Clock>::submit(message m) {
    if (this_shard_id() == _owner_shard) {
        return enqueue(std::move(m));
    }
    return smp::submit_to(_owner_shard, [this, m = std::move(m)] () mutable {
        return enqueue(std::move(m));
    });
}

template <typename Clock>
future<> push_scheduler<Clock>::quiesce() {
    // The promise must be created and resolved on the owner shard.
    if (this_shard_id() != _owner_shard) {
        co_await smp::submit_to(_owner_shard, [this] {
            return quiesce();
        });
        co_return;
    }
    promise<> p;
    auto f = p.get_future();
    co_await submit(quiesce_request{std::move(p)});
    co_await std::move(f);
}

template <typename Clock>
future<> push_scheduler<Clock>::run() {
    for (;;) {
        std::optional<message> m;
        try {
            m.emplace(co_await _mailbox.pop_eventually());
        } catch (const scheduler_stopped&) {
            co_return;
        }
        try {
            process(std::move(*m));
        } catch (...) {
            slogger.error("Push scheduler failed to process a message: {}", std::current_exception());
        }
    }
}

template <typename Clock>
void push_scheduler<Clock>::process(message m) {
    std::visit([this] (auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, classified_event>) {
            on_event(msg);
        } else if constexpr (std::is_same_v<T, flush_tick>) {
            on_flush_tick();
        } else if constexpr (std::is_same_v<T, reconfigure>) {
            on_reconfigure(msg.settings);
        } else {
            maybe_push_shards();
            msg.processed.set_value();
        }
    }, m);
}

template <typename Clock>
void push_scheduler<Clock>::on_event(const classified_event& ev) {
    ++_stats.events_received;
    slogger.trace("Processing {}", ev);
    std::visit([this] (const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, control_updated>) {
            auto& db = _control.name_of(e.db);
            if (e.db == control_db::nodes) {
                _executor.push_to_live_nodes(db);
            } else {
                _executor.push_to_next_node(db);
            }
        } else if constexpr (std::is_same_v<T, shard_updated>) {
            if (!_window.add(e.shard)) {
                ++_stats.updates_coalesced;
            }
        } else if constexpr (std::is_same_v<T, shard_deleted>) {
            _executor.forget_shard(e.shard);
        }
    }, ev);
    maybe_push_shards();
}

template <typename Clock>
void push_scheduler<Clock>::on_flush_tick() {
    maybe_push_shards();
}

template <typename Clock>
void push_scheduler<Clock>::on_reconfigure(const sync_settings& settings) {
    if (settings.version < _settings.version) {
        slogger.debug("Ignoring stale sync settings version {}, current is {}", settings.version, _settings.version);
        maybe_push_shards();
        return;
    }
    auto old_length = _window.length();
    try {
        auto new_length = settings.window_length();
        if (new_length > sync_settings::max_window_length) {
            throw std::invalid_argument(fmt::format("window of {} buckets exceeds the limit of {}",
                    new_length, sync_settings::max_window_length));
        }
        _window.resize(new_length);
    } catch (...) {
        slogger.warn("Rejecting sync settings delay={} frequency={}: {}", settings.delay, settings.frequency, std::current_exception());
        maybe_push_shards();
        return;
    }
    _settings = settings;
    ++_stats.reconfigurations;
    slogger.info("Reconfigured push scheduler: delay={} frequency={} buckets {} -> {}",
            _settings.delay, _settings.frequency, old_length, _window.length());
    maybe_push_shards();
}

template <typename Clock>
std::optional<typename Clock::time_point> push_scheduler<Clock>::next_wakeup() const noexcept {
    if (!_flush_timer.armed()) {
        return std::nullopt;
    }
    return _flush_timer.get_timeout();
}

template <typename Clock>
void push_scheduler<Clock>::maybe_push_shards() {
    if (_stopped) {
        return;
    }
    auto now = Clock::now();
    auto frequency = std::chrono::duration_cast<typename Clock::duration>(_settings.frequency);
    if (!_last_flush) {
        _last_flush = now;
        arm_flush_timer(now, frequency);
        return;
    }
    auto elapsed = now - *_last_flush;
    if (elapsed >= frequency) {
        push_oldest_bucket();
        _last_flush = now;
        arm_flush_timer(now, frequency);
    } else {
        arm_flush_timer(now, frequency - elapsed);
    }
}

template <typename Clock>
void push_scheduler<Clock>::push_oldest_bucket() {
    auto bucket = _window.rotate();
    ++_stats.flushes;
    if (!bucket.empty()) {
        slogger.debug("Flushing {} shards", bucket.size());
    }
    for (auto& shard : bucket) {
        _executor.push_shard(shard);
    }
}

template <typename Clock>
void push_scheduler<Clock>::arm_flush_timer(typename Clock::time_point now, typename Clock::duration d) {
    slogger.trace("Next flush check in {}", std::chrono::duration_cast<std::chrono::milliseconds>(d));
    _flush_timer.rearm(now + d);
}

template <typename Clock>
void push_scheduler<Clock>::on_flush_tick_expired() {
    // Every queued message ends with the flush check, so a tick which does
    // not fit in the mailbox is redundant.
    if (!_mailbox.push(flush_tick{})) {
        slogger.debug("Mailbox full, dropping flush tick");
    }
}

template class push_scheduler<seastar::lowres_clock>;
template class push_scheduler<seastar::manual_clock>;

}
