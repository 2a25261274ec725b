/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include "shard_sync/membership.hh"

namespace shard_sync {

node_id membership::next_node() const {
    auto self = local_node();
    auto live = live_nodes();
    auto nodes = configured_nodes();
    std::erase_if(nodes, [&] (const node_id& n) {
        return n != self && !live.contains(n);
    });
    if (std::find(nodes.begin(), nodes.end(), self) == nodes.end()) {
        nodes.push_back(self);
    }
    std::sort(nodes.begin(), nodes.end());
    auto it = std::upper_bound(nodes.begin(), nodes.end(), self);
    return it == nodes.end() ? nodes.front() : *it;
}

}
