/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <seastar/core/future.hh>

#include "shard_sync/shard_name.hh"

namespace shard_sync {

// Starts replication of a database or shard to a peer node.
//
// Retries and backoff, if any, are the transport's business; callers do
// not wait for the replication to complete beyond the returned future.
class push_transport {
public:
    virtual ~push_transport() = default;
    virtual future<> push(const sstring& subject, const node_id& target) = 0;
};

}
