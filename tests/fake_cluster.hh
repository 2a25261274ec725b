/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <seastar/core/future.hh>

#include "shard_sync/membership.hh"
#include "shard_sync/notification_source.hh"
#include "shard_sync/push_transport.hh"
#include "shard_sync/shard_directory.hh"

// In-memory stand-ins for the collaborators of the push machinery.

namespace tests {

using namespace shard_sync;

class fake_directory : public shard_directory {
    std::map<shard_id, std::vector<node_id>> _replicas;
public:
    std::vector<shard_id> forgotten;
    std::vector<shard_id> resolved;
    std::optional<shard_id> failing;

    // Registers the shard with replicas on the given nodes.
    void add(const shard_id& shard, std::vector<node_id> nodes) {
        _replicas[shard] = std::move(nodes);
    }

    void remove(const shard_id& shard) {
        _replicas.erase(shard);
    }

    future<std::vector<shard_placement>> resolve(const shard_id& shard) override {
        resolved.push_back(shard);
        if (failing && *failing == shard) {
            return make_exception_future<std::vector<shard_placement>>(std::runtime_error("directory unavailable"));
        }
        auto it = _replicas.find(shard);
        if (it == _replicas.end()) {
            return make_exception_future<std::vector<shard_placement>>(no_such_shard(shard));
        }
        std::vector<shard_placement> placements;
        for (auto& node : it->second) {
            placements.push_back(shard_placement{shard, node});
        }
        return make_ready_future<std::vector<shard_placement>>(std::move(placements));
    }

    future<> forget(const shard_id& shard) override {
        forgotten.push_back(shard);
        return make_ready_future<>();
    }
};

class fake_membership : public membership {
public:
    node_id local = "n1";
    std::vector<node_id> nodes = {"n1", "n2", "n3"};
    std::unordered_set<node_id> live = {"n2", "n3"};

    std::vector<node_id> configured_nodes() const override {
        return nodes;
    }
    std::unordered_set<node_id> live_nodes() const override {
        return live;
    }
    node_id local_node() const override {
        return local;
    }
};

class fake_transport : public push_transport {
public:
    std::vector<std::pair<sstring, node_id>> pushes;
    std::optional<node_id> unreachable;

    future<> push(const sstring& subject, const node_id& target) override {
        if (unreachable && *unreachable == target) {
            return make_exception_future<>(std::runtime_error("connection refused"));
        }
        pushes.emplace_back(subject, target);
        return make_ready_future<>();
    }

    size_t count(const sstring& subject) const {
        return std::count_if(pushes.begin(), pushes.end(), [&] (auto& p) { return p.first == subject; });
    }
};

template <typename Listener>
class fake_source : public notification_source<Listener> {
    std::optional<promise<>> _subscription;
public:
    Listener* listener = nullptr;
    unsigned subscriptions = 0;

    future<> listen(Listener& l) override {
        listener = &l;
        ++subscriptions;
        _subscription.emplace();
        return _subscription->get_future();
    }

    future<> stop_listening(Listener&) override {
        lose();
        return make_ready_future<>();
    }

    // Ends the subscription as if the channel was lost.
    void lose(std::exception_ptr ep = nullptr) {
        listener = nullptr;
        if (_subscription) {
            if (ep) {
                _subscription->set_exception(std::move(ep));
            } else {
                _subscription->set_value();
            }
            _subscription.reset();
        }
    }

    bool subscribed() const noexcept {
        return listener != nullptr;
    }
};

using fake_event_source = fake_source<db_event_listener>;
using fake_config_source = fake_source<config_listener>;

}
