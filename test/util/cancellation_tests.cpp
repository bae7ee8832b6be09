// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/cancellation.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace ftpctl::util;

TEST_CASE("CancellationSource fires exactly once", "[util][cancellation]") {
    CancellationSource source;
    auto token = source.token();
    int calls = 0;
    auto reg = token.register_callback([&]() { ++calls; });

    CHECK_FALSE(token.is_cancellation_requested());
    CHECK(source.cancel());
    CHECK_FALSE(source.cancel());
    CHECK(token.is_cancellation_requested());
    CHECK(source.is_cancellation_requested());
    CHECK(calls == 1);
}

TEST_CASE("Callbacks registered after cancellation run immediately", "[util][cancellation]") {
    CancellationSource source;
    source.cancel();

    bool ran = false;
    auto reg = source.token().register_callback([&]() { ran = true; });
    CHECK(ran);
}

TEST_CASE("Unregistered callbacks do not run", "[util][cancellation]") {
    CancellationSource source;
    bool ran = false;
    {
        auto reg = source.token().register_callback([&]() { ran = true; });
    }
    auto reg2 = source.token().register_callback([]() {});
    reg2.Unregister();
    source.cancel();
    CHECK_FALSE(ran);
}

TEST_CASE("Moved registration keeps the callback registered", "[util][cancellation]") {
    CancellationSource source;
    int calls = 0;
    CancellationRegistration outer;
    {
        auto reg = source.token().register_callback([&]() { ++calls; });
        outer = std::move(reg);
    }
    source.cancel();
    CHECK(calls == 1);
}

TEST_CASE("none() tokens never fire", "[util][cancellation]") {
    auto token = CancellationToken::none();
    CHECK_FALSE(token.can_be_canceled());
    CHECK_FALSE(token.is_cancellation_requested());
    bool ran = false;
    auto reg = token.register_callback([&]() { ran = true; });
    CHECK_FALSE(ran);

    CancellationToken defaulted;
    CHECK_FALSE(defaulted.can_be_canceled());
}

TEST_CASE("Copies of a source share one signal", "[util][cancellation]") {
    CancellationSource a;
    CancellationSource b = a;
    b.cancel();
    CHECK(a.is_cancellation_requested());
    CHECK_FALSE(a.cancel());
}

TEST_CASE("Linked source fires when any parent fires", "[util][cancellation][linked]") {
    CancellationSource closed, stopped, paused;

    SECTION("first parent") {
        auto linked = CancellationSource::create_linked(
            {closed.token(), stopped.token(), paused.token()});
        CHECK_FALSE(linked.is_cancellation_requested());
        closed.cancel();
        CHECK(linked.is_cancellation_requested());
    }

    SECTION("last parent") {
        auto linked = CancellationSource::create_linked(
            {closed.token(), stopped.token(), paused.token()});
        paused.cancel();
        CHECK(linked.is_cancellation_requested());
        CHECK_FALSE(closed.is_cancellation_requested());
        CHECK_FALSE(stopped.is_cancellation_requested());
    }

    SECTION("already fired parent") {
        stopped.cancel();
        auto linked = CancellationSource::create_linked({closed.token(), stopped.token()});
        CHECK(linked.is_cancellation_requested());
    }

    SECTION("cancelling the linked source leaves parents alone") {
        auto linked = CancellationSource::create_linked({closed.token()});
        linked.cancel();
        CHECK_FALSE(closed.is_cancellation_requested());
    }
}

TEST_CASE("Fresh linked source per cycle is not pre-cancelled", "[util][cancellation][linked]") {
    CancellationSource closed, stopped;

    CancellationSource paused1;
    auto cycle1 = CancellationSource::create_linked({closed.token(), stopped.token(), paused1.token()});
    paused1.cancel();
    CHECK(cycle1.is_cancellation_requested());

    CancellationSource paused2;
    auto cycle2 = CancellationSource::create_linked({closed.token(), stopped.token(), paused2.token()});
    CHECK_FALSE(cycle2.is_cancellation_requested());

    stopped.cancel();
    CHECK(cycle2.is_cancellation_requested());
}

TEST_CASE("Discarded linked source does not keep callbacks alive", "[util][cancellation][linked]") {
    CancellationSource parent;
    int calls = 0;
    {
        auto linked = CancellationSource::create_linked({parent.token()});
        auto reg = linked.token().register_callback([&]() { ++calls; });
    }
    parent.cancel();
    CHECK(calls == 0);
}

TEST_CASE("Callback may register on the firing source", "[util][cancellation]") {
    CancellationSource source;
    bool inner_ran = false;
    CancellationRegistration inner;
    auto outer = source.token().register_callback([&]() {
        inner = source.token().register_callback([&]() { inner_ran = true; });
    });
    source.cancel();
    CHECK(inner_ran);
}

TEST_CASE("Concurrent cancel runs callbacks once", "[util][cancellation][threading]") {
    for (int round = 0; round < 50; ++round) {
        CancellationSource source;
        std::atomic<int> calls{0};
        auto reg = source.token().register_callback([&]() { calls++; });

        std::atomic<int> fired{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&]() {
                if (source.cancel()) fired++;
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(calls.load() == 1);
        REQUIRE(fired.load() == 1);
    }
}
