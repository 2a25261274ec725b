/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <array>
#include <seastar/core/on_internal_error.hh>

#include "shard_sync/event_classifier.hh"
#include "log.hh"

namespace shard_sync {

extern logging::logger slogger;

static constexpr std::array<std::pair<db_event_kind, std::string_view>, 5> db_event_kind_names = {{
    {db_event_kind::created, "created"},
    {db_event_kind::updated, "updated"},
    {db_event_kind::deleted, "deleted"},
    {db_event_kind::compacted, "compacted"},
    {db_event_kind::ddoc_updated, "ddoc_updated"},
}};

std::optional<db_event_kind> parse_db_event_kind(std::string_view name) noexcept {
    for (auto& [kind, kind_name] : db_event_kind_names) {
        if (kind_name == name) {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view to_string(db_event_kind kind) noexcept {
    for (auto& [k, kind_name] : db_event_kind_names) {
        if (k == kind) {
            return kind_name;
        }
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, db_event_kind kind) {
    return os << to_string(kind);
}

std::string_view to_string(control_db db) noexcept {
    switch (db) {
    case control_db::nodes: return "nodes";
    case control_db::shards: return "shards";
    case control_db::users: return "users";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, control_db db) {
    return os << to_string(db);
}

std::optional<control_db> control_databases::find(std::string_view name) const noexcept {
    if (name == nodes) {
        return control_db::nodes;
    } else if (name == shards) {
        return control_db::shards;
    } else if (name == users) {
        return control_db::users;
    }
    return std::nullopt;
}

const sstring& control_databases::name_of(control_db db) const {
    switch (db) {
    case control_db::nodes: return nodes;
    case control_db::shards: return shards;
    case control_db::users: return users;
    }
    on_internal_error(slogger, fmt::format("invalid control database {}", static_cast<int>(db)));
}

std::ostream& operator<<(std::ostream& os, const classified_event& ev) {
    std::visit([&os] (const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, control_updated>) {
            os << "control_updated{" << e.db << "}";
        } else if constexpr (std::is_same_v<T, shard_updated>) {
            os << "shard_updated{" << e.shard << "}";
        } else if constexpr (std::is_same_v<T, shard_deleted>) {
            os << "shard_deleted{" << e.shard << "}";
        } else {
            os << "ignored";
        }
    }, ev);
    return os;
}

classified_event event_classifier::classify(std::string_view subject, db_event_kind kind) const {
    if (auto db = _control.find(subject)) {
        // Deleting a control database is not something we can push.
        if (kind == db_event_kind::updated) {
            return control_updated{*db};
        }
        return ignored{};
    }
    if (kind == db_event_kind::updated && is_shard_name(subject)) {
        return shard_updated{shard_id(subject)};
    }
    if (kind == db_event_kind::deleted && has_shard_range(subject)) {
        return shard_deleted{shard_id(subject)};
    }
    return ignored{};
}

}
