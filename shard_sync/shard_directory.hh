/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <vector>
#include <fmt/format.h>
#include <seastar/core/future.hh>

#include "shard_sync/shard_name.hh"

namespace shard_sync {

// Thrown by a shard_directory when the database owning a shard is gone.
class no_such_shard : public std::runtime_error {
public:
    explicit no_such_shard(const shard_id& shard)
            : std::runtime_error(fmt::format("no such shard: {}", shard)) {
    }
};

struct shard_placement {
    shard_id shard;
    node_id node;

    bool operator==(const shard_placement&) const = default;
};

// Shard-to-node topology lookups.
class shard_directory {
public:
    virtual ~shard_directory() = default;

    // All replicas of the given shard.
    // Fails with no_such_shard if the shard's database no longer exists.
    virtual future<std::vector<shard_placement>> resolve(const shard_id& shard) = 0;

    // Drops any state kept about a deleted shard.
    virtual future<> forget(const shard_id& shard) = 0;
};

}
