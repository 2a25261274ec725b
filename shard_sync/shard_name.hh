/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string_view>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"

namespace shard_sync {

// Names one shard replica, e.g. "shards/00000000-1fffffff/db1.1634567890".
using shard_id = sstring;

// Names a cluster node.
using node_id = sstring;

constexpr std::string_view shard_name_prefix = "shards/";

// Length of the "<begin>-<end>/" range component which must follow the
// prefix for a name to identify a concrete shard.
constexpr size_t shard_range_length = 18;

bool is_shard_name(std::string_view name) noexcept;

// True when the name carries a complete range component after the prefix.
bool has_shard_range(std::string_view name) noexcept;

// "shards/00000000-1fffffff/db1.1634567890" -> "db1".
// Returns the name unchanged if it is not a shard name.
std::string_view shard_db_name(std::string_view name) noexcept;

}
