/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string_view>
#include <seastar/core/future.hh>

#include "seastarx.hh"

namespace shard_sync {

// Receives database change events. `kind` is the event's wire name, which
// need not be one this node knows about.
class db_event_listener {
public:
    virtual ~db_event_listener() = default;
    virtual void on_db_event(std::string_view db_name, std::string_view kind) = 0;
};

// Receives changes of configuration values as raw strings.
class config_listener {
public:
    virtual ~config_listener() = default;
    virtual void on_config_change(std::string_view name, std::string_view value) = 0;
};

// A subscription-style notification channel.
//
// listen() delivers notifications to the listener until the subscription
// ends, which is when the returned future resolves. stop_listening() ends
// the subscription on request; any other end (or failure) of the future is
// a loss of the channel which the subscriber may recover from by calling
// listen() again.
template <typename Listener>
class notification_source {
public:
    virtual ~notification_source() = default;
    virtual future<> listen(Listener& listener) = 0;
    virtual future<> stop_listening(Listener& listener) = 0;
};

using db_event_source = notification_source<db_event_listener>;
using config_source = notification_source<config_listener>;

}
