/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <seastar/core/coroutine.hh>
#include <seastar/core/loop.hh>
#include <seastar/core/metrics.hh>

#include "shard_sync/push_executor.hh"
#include "log.hh"

namespace shard_sync {

extern logging::logger slogger;

std::ostream& operator<<(std::ostream& os, push_result r) {
    switch (r) {
    case push_result::delivered: return os << "delivered";
    case push_result::target_gone: return os << "target_gone";
    case push_result::failed: return os << "failed";
    }
    return os << "unknown";
}

push_executor::push_executor(shard_directory& directory, const membership& membership, push_transport& transport)
        : _directory(directory)
        , _membership(membership)
        , _transport(transport)
{
    namespace sm = seastar::metrics;

    _metrics.add_group("shard_sync", {
        sm::make_counter("shard_pushes", _stats.shard_pushes,
                sm::description("Number of shard pushes issued to live replicas.")),
        sm::make_counter("control_pushes", _stats.control_pushes,
                sm::description("Number of pushes of cluster control databases.")),
        sm::make_counter("pushes_skipped_target_gone", _stats.pushes_skipped_target_gone,
                sm::description("Number of flushed shards not pushed because their database was deleted.")),
        sm::make_counter("push_failures", _stats.push_failures,
                sm::description("Number of pushes or replica lookups which failed.")),
    });
}

template <typename Func>
void push_executor::in_background(const char* what, Func&& func) {
    if (_pending.is_closed()) {
        slogger.debug("Not starting {}: stopping", what);
        return;
    }
    (void)with_gate(_pending, std::forward<Func>(func)).handle_exception([what] (std::exception_ptr ep) {
        slogger.warn("Failed to {}: {}", what, ep);
    });
}

future<> push_executor::do_push(sstring subject, node_id target) {
    slogger.trace("Pushing {} to {}", subject, target);
    try {
        co_await _transport.push(subject, target);
    } catch (...) {
        ++_stats.push_failures;
        slogger.warn("Push of {} to {} failed: {}", subject, target, std::current_exception());
    }
}

future<push_result> push_executor::do_push_shard(shard_id shard) {
    std::vector<shard_placement> replicas;
    try {
        replicas = co_await _directory.resolve(shard);
    } catch (const no_such_shard&) {
        ++_stats.pushes_skipped_target_gone;
        slogger.debug("Not pushing {}: database {} no longer exists", shard, shard_db_name(shard));
        co_return push_result::target_gone;
    } catch (...) {
        ++_stats.push_failures;
        slogger.warn("Could not resolve replicas of {}: {}", shard, std::current_exception());
        co_return push_result::failed;
    }

    auto live = _membership.live_nodes();
    co_await parallel_for_each(replicas, [this, &live] (const shard_placement& replica) {
        if (!live.contains(replica.node)) {
            return make_ready_future<>();
        }
        ++_stats.shard_pushes;
        return do_push(replica.shard, replica.node);
    });
    co_return push_result::delivered;
}

void push_executor::push_shard(shard_id shard) {
    in_background("push shard", [this, shard = std::move(shard)] () mutable {
        return do_push_shard(std::move(shard)).discard_result();
    });
}

void push_executor::push_to_live_nodes(sstring db) {
    auto live = _membership.live_nodes();
    for (auto& node : _membership.configured_nodes()) {
        if (!live.contains(node)) {
            continue;
        }
        ++_stats.control_pushes;
        in_background("push control database", [this, db, node] {
            return do_push(db, node);
        });
    }
}

void push_executor::push_to_next_node(sstring db) {
    auto node = _membership.next_node();
    ++_stats.control_pushes;
    in_background("push control database", [this, db = std::move(db), node = std::move(node)] {
        return do_push(db, node);
    });
}

void push_executor::forget_shard(shard_id shard) {
    slogger.debug("Forgetting deleted shard {}", shard);
    in_background("forget shard", [this, shard = std::move(shard)] {
        return _directory.forget(shard);
    });
}

future<> push_executor::stop() {
    return _pending.close();
}

}
