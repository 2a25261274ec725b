/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>

#include "shard_sync/shard_name.hh"

namespace shard_sync {

bool is_shard_name(std::string_view name) noexcept {
    return name.starts_with(shard_name_prefix);
}

bool has_shard_range(std::string_view name) noexcept {
    return is_shard_name(name) && name.size() >= shard_name_prefix.size() + shard_range_length;
}

std::string_view shard_db_name(std::string_view name) noexcept {
    if (!has_shard_range(name)) {
        return name;
    }
    auto db = name.substr(shard_name_prefix.size() + shard_range_length);
    auto dot = db.rfind('.');
    if (dot != std::string_view::npos && dot + 1 < db.size()
            && std::all_of(db.begin() + dot + 1, db.end(), [] (char c) { return c >= '0' && c <= '9'; })) {
        db = db.substr(0, dot);
    }
    return db;
}

}
