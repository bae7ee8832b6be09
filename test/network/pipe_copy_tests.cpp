// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/pipe_copy.hpp"
#include "test_helpers.hpp"
#include <atomic>

using namespace ftpctl::network;
using namespace ftpctl::test;
using ftpctl::util::CancellationSource;

namespace {

struct CopyFixture {
    IoContextRunner runner;
    std::shared_ptr<Pipe> source = Pipe::create(runner.executor());
    std::shared_ptr<Pipe> destination = Pipe::create(runner.executor());
    CancellationSource stop;
    std::atomic<int> finished{0};

    std::shared_ptr<PipeCopyLoop> make() {
        return PipeCopyLoop::create(source, destination, stop.token(), "test.copy",
                                    [this]() { finished++; });
    }
};

} // namespace

TEST_CASE("PipeCopyLoop forwards chunks in order", "[network][pipe_copy]") {
    CopyFixture fx;
    auto loop = fx.make();
    loop->start();

    REQUIRE(WriteAndFlush(fx.source->writer(), Bytes("first ")));
    REQUIRE(WriteAndFlush(fx.source->writer(), Bytes("second ")));
    REQUIRE(WriteAndFlush(fx.source->writer(), Bytes("third")));

    CHECK(Text(ReadExactly(fx.destination->reader(), 18)) == "first second third");
    CHECK(fx.finished == 0);

    fx.stop.cancel();
    REQUIRE(WaitFor([&]() { return fx.finished == 1; }));
    CHECK(loop->bytes_copied() == 18);
}

TEST_CASE("PipeCopyLoop stops when the source completes", "[network][pipe_copy]") {
    CopyFixture fx;
    auto loop = fx.make();
    loop->start();

    fx.source->writer().write(Bytes("last words"));
    fx.source->writer().complete();

    CHECK(Text(ReadExactly(fx.destination->reader(), 10)) == "last words");
    REQUIRE(WaitFor([&]() { return fx.finished == 1; }));
}

TEST_CASE("PipeCopyLoop stops on cancel_pending_read", "[network][pipe_copy]") {
    CopyFixture fx;
    auto loop = fx.make();
    loop->start();

    // Give the loop time to park its read
    std::this_thread::sleep_for(20ms);
    fx.source->reader().cancel_pending_read();
    REQUIRE(WaitFor([&]() { return fx.finished == 1; }));
}

TEST_CASE("PipeCopyLoop leaves unread data in the source when cancelled", "[network][pipe_copy]") {
    CopyFixture fx;
    fx.stop.cancel();
    auto loop = fx.make();

    REQUIRE(WriteAndFlush(fx.source->writer(), Bytes("pending")));
    loop->start();
    REQUIRE(WaitFor([&]() { return fx.finished == 1; }));
    CHECK(fx.source->unread_bytes() == 7);
    CHECK(loop->bytes_copied() == 0);
}

TEST_CASE("PipeCopyLoop stops when the destination reader is gone", "[network][pipe_copy]") {
    CopyFixture fx;
    auto loop = fx.make();
    fx.destination->reader().complete();
    loop->start();

    REQUIRE(WriteAndFlush(fx.source->writer(), Bytes("nobody listens")));
    REQUIRE(WaitFor([&]() { return fx.finished == 1; }));
}
