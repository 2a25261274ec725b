/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <set>

#include <seastar/core/later.hh>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>

#include "shard_sync/push_executor.hh"
#include "tests/fake_cluster.hh"
#include "tests/eventually.hh"

using namespace shard_sync;
using namespace tests;

namespace {

struct executor_env {
    fake_directory directory;
    fake_membership members;
    fake_transport transport;
    push_executor executor{directory, members, transport};

    ~executor_env() {
        executor.stop().get();
    }
};

}

static const shard_id shard1("shards/00000000-1fffffff/db1.1634567890");

SEASTAR_THREAD_TEST_CASE(test_shard_pushed_to_live_replicas_only) {
    executor_env env;
    env.directory.add(shard1, {"n2", "n3", "n4"});

    auto r = env.executor.do_push_shard(shard1).get();

    BOOST_REQUIRE_EQUAL(r, push_result::delivered);
    BOOST_REQUIRE_EQUAL(env.transport.pushes.size(), 2);
    BOOST_REQUIRE_EQUAL(env.transport.count(shard1), 2);
    BOOST_REQUIRE_EQUAL(env.executor.get_stats().shard_pushes, 2);
}

SEASTAR_THREAD_TEST_CASE(test_deleted_shard_is_target_gone) {
    executor_env env;

    auto r = env.executor.do_push_shard(shard1).get();

    BOOST_REQUIRE_EQUAL(r, push_result::target_gone);
    BOOST_REQUIRE(env.transport.pushes.empty());
    BOOST_REQUIRE_EQUAL(env.executor.get_stats().pushes_skipped_target_gone, 1);
    BOOST_REQUIRE_EQUAL(env.executor.get_stats().push_failures, 0);
}

SEASTAR_THREAD_TEST_CASE(test_resolve_failure_is_reported) {
    executor_env env;
    env.directory.add(shard1, {"n2"});
    env.directory.failing = shard1;

    auto r = env.executor.do_push_shard(shard1).get();

    BOOST_REQUIRE_EQUAL(r, push_result::failed);
    BOOST_REQUIRE(env.transport.pushes.empty());
    BOOST_REQUIRE_EQUAL(env.executor.get_stats().push_failures, 1);
}

SEASTAR_THREAD_TEST_CASE(test_transport_failure_does_not_stop_other_replicas) {
    executor_env env;
    env.directory.add(shard1, {"n2", "n3"});
    env.transport.unreachable = "n2";

    auto r = env.executor.do_push_shard(shard1).get();

    BOOST_REQUIRE_EQUAL(r, push_result::delivered);
    BOOST_REQUIRE_EQUAL(env.transport.pushes.size(), 1);
    BOOST_REQUIRE(env.transport.pushes[0] == std::make_pair(sstring(shard1), node_id("n3")));
    BOOST_REQUIRE_EQUAL(env.executor.get_stats().push_failures, 1);
}

SEASTAR_THREAD_TEST_CASE(test_background_shard_push) {
    executor_env env;
    env.directory.add(shard1, {"n2", "n3"});

    env.executor.push_shard(shard1);

    REQUIRE_EVENTUALLY_EQUAL(env.transport.count(shard1), 2u);
}

SEASTAR_THREAD_TEST_CASE(test_push_to_live_nodes) {
    executor_env env;
    env.members.nodes = {"n1", "n2", "n3", "n4"};
    env.members.live = {"n2", "n4", "n9"};

    env.executor.push_to_live_nodes("_nodes");

    REQUIRE_EVENTUALLY_EQUAL(env.transport.pushes.size(), 2u);
    std::set<node_id> targets;
    for (auto& [subject, node] : env.transport.pushes) {
        BOOST_REQUIRE_EQUAL(subject, "_nodes");
        targets.insert(node);
    }
    BOOST_REQUIRE(targets == std::set<node_id>({"n2", "n4"}));
    BOOST_REQUIRE_EQUAL(env.executor.get_stats().control_pushes, 2);
}

SEASTAR_THREAD_TEST_CASE(test_push_to_next_node) {
    executor_env env;

    env.executor.push_to_next_node("_users");

    REQUIRE_EVENTUALLY_EQUAL(env.transport.pushes.size(), 1u);
    BOOST_REQUIRE(env.transport.pushes[0] == std::make_pair(sstring("_users"), node_id("n2")));
}

SEASTAR_THREAD_TEST_CASE(test_forget_shard) {
    executor_env env;

    env.executor.forget_shard(shard1);

    REQUIRE_EVENTUALLY_EQUAL(env.directory.forgotten.size(), 1u);
    BOOST_REQUIRE_EQUAL(env.directory.forgotten[0], shard1);
}

SEASTAR_THREAD_TEST_CASE(test_next_node) {
    fake_membership m;

    m.local = "n1";
    m.live = {"n2", "n3"};
    BOOST_REQUIRE_EQUAL(m.next_node(), "n2");

    m.local = "n2";
    m.live = {"n1", "n3"};
    BOOST_REQUIRE_EQUAL(m.next_node(), "n3");

    // Wraps around to the first node.
    m.local = "n3";
    m.live = {"n1", "n2"};
    BOOST_REQUIRE_EQUAL(m.next_node(), "n1");

    // Dead nodes are skipped.
    m.local = "n1";
    m.live = {"n3"};
    BOOST_REQUIRE_EQUAL(m.next_node(), "n3");

    // Live nodes outside the configured set are not candidates.
    m.nodes = {"n1", "n3"};
    m.live = {"n2"};
    BOOST_REQUIRE_EQUAL(m.next_node(), "n1");

    // Alone in the cluster.
    m.nodes = {"n1"};
    m.live = {};
    BOOST_REQUIRE_EQUAL(m.next_node(), "n1");
}

SEASTAR_THREAD_TEST_CASE(test_nothing_pushed_after_stop) {
    fake_directory directory;
    fake_membership members;
    fake_transport transport;
    push_executor executor(directory, members, transport);
    directory.add(shard1, {"n2"});

    executor.stop().get();
    executor.push_shard(shard1);
    executor.push_to_live_nodes("_nodes");
    executor.push_to_next_node("_dbs");
    executor.forget_shard(shard1);
    seastar::yield().get();

    BOOST_REQUIRE(transport.pushes.empty());
    BOOST_REQUIRE(directory.forgotten.empty());
    BOOST_REQUIRE(directory.resolved.empty());
}
