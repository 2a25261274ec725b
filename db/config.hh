/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <list>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>

#include "seastarx.hh"
#include "shard_sync/notification_source.hh"
#include "utils/observable.hh"

namespace db {

class config_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class config final : public shard_sync::config_source {
public:
    // A configuration option. Values are kept as the strings they were
    // given as; consumers parse and validate them.
    class named_value {
        sstring _name;
        sstring _default;
        sstring _value;
        sstring _description;
        bool _set = false;
        utils::observable<sstring> _updates;
    public:
        named_value(config* cfg, sstring name, sstring default_value, sstring description);
        named_value(const named_value&) = delete;

        const sstring& name() const noexcept {
            return _name;
        }
        const sstring& description() const noexcept {
            return _description;
        }
        const sstring& operator()() const noexcept {
            return _value;
        }
        const sstring& default_value() const noexcept {
            return _default;
        }
        bool is_set() const noexcept {
            return _set;
        }

        // Notifies observers if the value changes.
        void set(sstring value);

        utils::observer<sstring> observe(noncopyable_function<void (sstring)> callback) {
            return _updates.observe(std::move(callback));
        }
    };
private:
    std::vector<named_value*> _values;

    struct subscription {
        shard_sync::config_listener* listener;
        std::vector<utils::observer<sstring>> observers;
        promise<> ended;
    };
    std::list<subscription> _subscriptions;
public:
    config();
    ~config();

    config(const config&) = delete;

    named_value sync_delay_in_ms;
    named_value sync_frequency_in_ms;
    named_value sync_subscription_retry_delay_in_ms;
    named_value nodes_db;
    named_value shards_db;
    named_value users_db;

    const std::vector<named_value*>& values() const noexcept {
        return _values;
    }

    named_value* find(std::string_view name) noexcept;

    // Throws config_error for unknown options.
    void set(std::string_view name, sstring value);

    // Applies the options found in a YAML document. Unknown options are
    // logged and skipped. Throws config_error if the document is invalid.
    void read_from_yaml(std::string_view yaml);

    future<> read_from_file(std::filesystem::path path);

    // shard_sync::config_source

    // Delivers changes of every option to the listener until
    // stop_listening() is called for it.
    future<> listen(shard_sync::config_listener& listener) override;
    future<> stop_listening(shard_sync::config_listener& listener) override;
private:
    void add(named_value* v) {
        _values.push_back(v);
    }
};

}
