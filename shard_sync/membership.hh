/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <unordered_set>
#include <vector>

#include "shard_sync/shard_name.hh"

namespace shard_sync {

// Cluster membership as seen from this node.
class membership {
public:
    virtual ~membership() = default;

    // Every node in the cluster's node list, live or not.
    virtual std::vector<node_id> configured_nodes() const = 0;

    // Peers currently reachable from this node.
    virtual std::unordered_set<node_id> live_nodes() const = 0;

    virtual node_id local_node() const = 0;

    // Target for pushes of control databases which go to a single node.
    //
    // Picks the live node following this one in the sorted node list,
    // wrapping around, so that successive nodes forward the update around
    // the ring. Returns the local node when no other node is live.
    virtual node_id next_node() const;
};

}
