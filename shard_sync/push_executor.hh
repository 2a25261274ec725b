/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/metrics_registration.hh>

#include "shard_sync/membership.hh"
#include "shard_sync/push_transport.hh"
#include "shard_sync/shard_directory.hh"

namespace shard_sync {

enum class push_result {
    // Pushes were issued to every live replica.
    delivered,
    // The shard was deleted in the meantime, nothing to push.
    target_gone,
    // Resolving the shard's replicas failed; the failure was logged.
    failed,
};

std::ostream& operator<<(std::ostream& os, push_result r);

// Issues pushes on behalf of the push scheduler.
//
// The fire-and-forget entry points return immediately; the pushes run in
// the background, concurrently with each other and with the caller.
// Failures are logged and counted, never reported back.
class push_executor {
public:
    struct stats {
        uint64_t shard_pushes = 0;
        uint64_t control_pushes = 0;
        uint64_t pushes_skipped_target_gone = 0;
        uint64_t push_failures = 0;
    };
private:
    shard_directory& _directory;
    const membership& _membership;
    push_transport& _transport;
    seastar::gate _pending;
    stats _stats;
    seastar::metrics::metric_groups _metrics;
public:
    push_executor(shard_directory& directory, const membership& membership, push_transport& transport);

    // Pushes the shard to each of its replicas on a live peer.
    void push_shard(shard_id shard);

    // Pushes a control database to every live node of the cluster.
    void push_to_live_nodes(sstring db);

    // Pushes a control database to the node chosen by membership::next_node().
    void push_to_next_node(sstring db);

    // Lets the shard directory drop its state about a deleted shard.
    void forget_shard(shard_id shard);

    // Awaitable variant of push_shard().
    future<push_result> do_push_shard(shard_id shard);

    // Waits for in-flight pushes. No pushes are issued afterwards.
    future<> stop();

    const stats& get_stats() const noexcept {
        return _stats;
    }
private:
    future<> do_push(sstring subject, node_id target);

    template <typename Func>
    void in_background(const char* what, Func&& func);
};

}

template <> struct fmt::formatter<shard_sync::push_result> : fmt::ostream_formatter {};
