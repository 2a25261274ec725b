/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <yaml-cpp/yaml.h>
#include <seastar/core/coroutine.hh>
#include <seastar/util/file.hh>

#include "db/config.hh"
#include "log.hh"

namespace db {

static logging::logger cfglogger("config");

config::named_value::named_value(config* cfg, sstring name, sstring default_value, sstring description)
        : _name(std::move(name))
        , _default(default_value)
        , _value(std::move(default_value))
        , _description(std::move(description))
{
    cfg->add(this);
}

void config::named_value::set(sstring value) {
    _set = true;
    if (value == _value) {
        return;
    }
    cfglogger.debug("Setting {} to {} (was {})", _name, value, _value);
    _value = std::move(value);
    _updates(_value);
}

config::config()
        : sync_delay_in_ms(this, "sync_delay_in_ms", "5000",
                "Upper bound, in milliseconds, on how long an updated shard waits before it is pushed to its replicas.")
        , sync_frequency_in_ms(this, "sync_frequency_in_ms", "500",
                "Interval, in milliseconds, at which queued shard pushes are issued.")
        , sync_subscription_retry_delay_in_ms(this, "sync_subscription_retry_delay_in_ms", "5000",
                "Delay, in milliseconds, before resubscribing to a lost event or configuration feed.")
        , nodes_db(this, "nodes_db", "_nodes", "Name of the database listing cluster nodes.")
        , shards_db(this, "shards_db", "_dbs", "Name of the database holding the shard map.")
        , users_db(this, "users_db", "_users", "Name of the authentication database.")
{
}

config::~config() {
    for (auto& s : _subscriptions) {
        s.ended.set_value();
    }
}

config::named_value* config::find(std::string_view name) noexcept {
    for (auto* v : _values) {
        if (v->name() == name) {
            return v;
        }
    }
    return nullptr;
}

void config::set(std::string_view name, sstring value) {
    auto* v = find(name);
    if (!v) {
        throw config_error(fmt::format("Unknown option {}", name));
    }
    v->set(std::move(value));
}

void config::read_from_yaml(std::string_view yaml) {
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        throw config_error(fmt::format("Invalid configuration: {}", e.what()));
    }
    if (doc.IsNull()) {
        return;
    }
    if (!doc.IsMap()) {
        throw config_error("Invalid configuration: expected a map of options");
    }
    for (const auto& node : doc) {
        auto name = node.first.as<std::string>();
        auto* v = find(name);
        if (!v) {
            cfglogger.warn("Unknown option {}, ignoring", name);
            continue;
        }
        if (!node.second.IsScalar()) {
            throw config_error(fmt::format("Invalid value for {}: expected a scalar", name));
        }
        v->set(sstring(node.second.Scalar()));
    }
}

future<> config::read_from_file(std::filesystem::path path) {
    sstring contents;
    try {
        contents = co_await seastar::util::read_entire_file_contiguous(path);
    } catch (...) {
        log_error_and_throw<config_error>(cfglogger, "Could not read configuration file {}: {}", path.native(), std::current_exception());
    }
    read_from_yaml(contents);
    cfglogger.info("Read configuration file {}", path.native());
}

future<> config::listen(shard_sync::config_listener& listener) {
    auto& s = _subscriptions.emplace_back(subscription{.listener = &listener});
    for (auto* v : _values) {
        s.observers.push_back(v->observe([&listener, name = v->name()] (sstring value) {
            listener.on_config_change(name, value);
        }));
    }
    return s.ended.get_future();
}

future<> config::stop_listening(shard_sync::config_listener& listener) {
    for (auto it = _subscriptions.begin(); it != _subscriptions.end(); ++it) {
        if (it->listener == &listener) {
            it->ended.set_value();
            _subscriptions.erase(it);
            break;
        }
    }
    return make_ready_future<>();
}

}
