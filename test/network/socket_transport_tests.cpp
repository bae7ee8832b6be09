// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/socket_transport.hpp"
#include "test_helpers.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <condition_variable>
#include <mutex>

using namespace ftpctl::network;
using namespace ftpctl::test;
using boost::asio::ip::tcp;

namespace {

// Listener on 127.0.0.1:<ephemeral> that wires every accepted socket to a
// fresh socket pipe pair; the test drives the application end.
struct ListenerFixture {
    IoContextRunner runner{1};
    SocketListener listener{runner.io()};

    std::mutex m;
    std::condition_variable cv;
    std::shared_ptr<SocketPipeConnection> connection;
    std::optional<DuplexPipe> app_end;
    std::atomic<int> disconnects{0};

    uint16_t listen() {
        bool ok = listener.listen("127.0.0.1", 0, [this](tcp::socket socket) {
            auto pair = DuplexPipe::create_pair(runner.executor());
            auto conn = SocketPipeConnection::create(std::move(socket), pair.first);
            conn->set_disconnect_callback([this]() { disconnects++; });
            conn->start();
            {
                std::lock_guard<std::mutex> lk(m);
                connection = conn;
                app_end = pair.second;
            }
            cv.notify_all();
        });
        return ok ? listener.listening_port() : 0;
    }

    bool wait_accepted() {
        std::unique_lock<std::mutex> lk(m);
        return cv.wait_for(lk, DEFAULT_TIMEOUT, [this]() { return connection != nullptr; });
    }
};

// Blocking client on its own io_context
struct BlockingClient {
    boost::asio::io_context io;
    tcp::socket socket{io};

    void connect(uint16_t port) {
        socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    }

    void send(const std::string& text) {
        boost::asio::write(socket, boost::asio::buffer(text));
    }

    std::string receive(size_t count) {
        std::string out(count, '\0');
        boost::system::error_code ec;
        size_t n = boost::asio::read(socket, boost::asio::buffer(out), ec);
        out.resize(n);
        return out;
    }
};

} // namespace

TEST_CASE("SocketListener binds an ephemeral port", "[network][transport]") {
    ListenerFixture fx;
    uint16_t port = fx.listen();
    REQUIRE(port != 0);
    CHECK(fx.listener.listening_port() == port);

    // A second listen on the same listener is refused
    CHECK_FALSE(fx.listener.listen("127.0.0.1", 0, [](tcp::socket) {}));

    fx.listener.stop();
}

TEST_CASE("SocketListener rejects a bad bind address", "[network][transport]") {
    IoContextRunner runner;
    SocketListener listener(runner.io());
    CHECK_FALSE(listener.listen("not-an-address", 0, [](tcp::socket) {}));
    CHECK(listener.listening_port() == 0);
}

TEST_CASE("SocketPipeConnection moves bytes both ways", "[network][transport]") {
    ListenerFixture fx;
    uint16_t port = fx.listen();
    REQUIRE(port != 0);

    BlockingClient client;
    client.connect(port);
    REQUIRE(fx.wait_accepted());
    CHECK(fx.connection->is_open());
    CHECK(fx.connection->remote_address().rfind("127.0.0.1:", 0) == 0);

    client.send("USER anonymous\r\n");
    CHECK(Text(ReadExactly(fx.app_end->input(), 16)) == "USER anonymous\r\n");

    REQUIRE(WriteAndFlush(fx.app_end->output(), Bytes("331 password please\r\n")));
    CHECK(client.receive(21) == "331 password please\r\n");

    fx.connection->close();
    REQUIRE(WaitFor([&]() { return fx.disconnects.load() == 1; }));
    CHECK_FALSE(fx.connection->is_open());
    CHECK(fx.connection->closed_token().is_cancellation_requested());
}

TEST_CASE("Client disconnect completes the pipe and runs the callback once",
          "[network][transport]") {
    ListenerFixture fx;
    uint16_t port = fx.listen();
    REQUIRE(port != 0);

    {
        BlockingClient client;
        client.connect(port);
        REQUIRE(fx.wait_accepted());
        client.send("QUIT\r\n");
        CHECK(Text(ReadExactly(fx.app_end->input(), 6)) == "QUIT\r\n");
    }

    CHECK(ReadsCompleted(fx.app_end->input()));
    REQUIRE(WaitFor([&]() { return fx.disconnects.load() == 1; }));
    CHECK_FALSE(fx.connection->is_open());

    fx.connection->close();
    std::this_thread::sleep_for(50ms);
    CHECK(fx.disconnects.load() == 1);
}

TEST_CASE("Completing the application output half-closes the socket",
          "[network][transport]") {
    ListenerFixture fx;
    uint16_t port = fx.listen();
    REQUIRE(port != 0);

    BlockingClient client;
    client.connect(port);
    REQUIRE(fx.wait_accepted());

    REQUIRE(WriteAndFlush(fx.app_end->output(), Bytes("221 bye\r\n")));
    fx.app_end->output().complete();

    // Data first, then EOF
    CHECK(client.receive(64) == "221 bye\r\n");

    // The receive direction still works after the half-close
    client.send("late");
    CHECK(Text(ReadExactly(fx.app_end->input(), 4)) == "late");

    fx.connection->close();
}
