/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <ostream>
#include <string_view>
#include <variant>

#include "shard_sync/shard_name.hh"

namespace shard_sync {

// Kinds of database events delivered by the change notification source.
enum class db_event_kind {
    created,
    updated,
    deleted,
    compacted,
    ddoc_updated,
};

std::optional<db_event_kind> parse_db_event_kind(std::string_view name) noexcept;
std::string_view to_string(db_event_kind kind) noexcept;
std::ostream& operator<<(std::ostream& os, db_event_kind kind);

// The cluster metadata databases whose updates are pushed immediately.
enum class control_db {
    nodes,
    shards,
    users,
};

std::string_view to_string(control_db db) noexcept;
std::ostream& operator<<(std::ostream& os, control_db db);

struct control_databases {
    sstring nodes;
    sstring shards;
    sstring users;

    std::optional<control_db> find(std::string_view name) const noexcept;
    const sstring& name_of(control_db db) const;
};

struct control_updated {
    control_db db;
    bool operator==(const control_updated&) const = default;
};

struct shard_updated {
    shard_id shard;
    bool operator==(const shard_updated&) const = default;
};

struct shard_deleted {
    shard_id shard;
    bool operator==(const shard_deleted&) const = default;
};

struct ignored {
    bool operator==(const ignored&) const = default;
};

using classified_event = std::variant<control_updated, shard_updated, shard_deleted, ignored>;

std::ostream& operator<<(std::ostream& os, const classified_event& ev);

class event_classifier {
    control_databases _control;
public:
    explicit event_classifier(control_databases control)
            : _control(std::move(control)) {
    }

    classified_event classify(std::string_view subject, db_event_kind kind) const;

    const control_databases& control() const noexcept {
        return _control;
    }
};

}

template <> struct fmt::formatter<shard_sync::db_event_kind> : fmt::ostream_formatter {};
template <> struct fmt::formatter<shard_sync::control_db> : fmt::ostream_formatter {};
template <> struct fmt::formatter<shard_sync::classified_event> : fmt::ostream_formatter {};
