// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/errors.hpp"
#include "network/tls_relay.hpp"
#include "test_helpers.hpp"
#include "tls_client.hpp"
#include <algorithm>
#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>
#include <filesystem>
#include <fstream>

using namespace ftpctl::network;
using namespace ftpctl::test;
using ftpctl::util::CancellationSource;

namespace {

struct TlsRelayFixture {
    IoContextRunner runner{2};
    std::pair<DuplexPipe, DuplexPipe> socket = DuplexPipe::create_pair(runner.executor());
    std::pair<DuplexPipe, DuplexPipe> connection = DuplexPipe::create_pair(runner.executor());
    Strand strand = boost::asio::make_strand(runner.executor());
    std::shared_ptr<SslStreamWrapperFactory> factory =
        std::make_shared<DefaultSslStreamWrapperFactory>();
    CancellationSource token_source;

    TlsRelayFixture() = default;
    explicit TlsRelayFixture(PipeOptions socket_options)
        : socket(DuplexPipe::create_pair(runner.executor(), socket_options)) {}

    std::shared_ptr<std::promise<std::exception_ptr>> done =
        std::make_shared<std::promise<std::exception_ptr>>();
    std::shared_future<std::exception_ptr> finished = done->get_future().share();

    std::shared_ptr<TlsRelay> run(const ServerCertificate& certificate = TestServerCertificate()) {
        auto relay = std::make_shared<TlsRelay>(strand, socket.second, connection.first, factory,
                                                certificate);
        auto p = done;
        relay->async_run(token_source.token(),
                         [p](std::exception_ptr error) { p->set_value(error); });
        return relay;
    }
};

} // namespace

TEST_CASE("TLS relay encrypts and decrypts application data", "[network][relay][tls]") {
    TlsRelayFixture fx;
    auto relay = fx.run();
    CHECK(std::string(relay->name()) == "tls");

    TlsTestClient client(fx.runner.executor(), fx.socket.first);
    REQUIRE_FALSE(client.handshake());

    SECTION("connection -> socket arrives as TLS records") {
        const std::string plaintext = "230 User logged in, proceed.\r\n";
        REQUIRE(WriteAndFlush(fx.connection.second.output(), Bytes(plaintext)));

        // Record header (5) + AEAD tag (16) at least
        auto raw = fx.socket.first.input_pipe();
        REQUIRE(WaitFor([&]() { return raw->unread_bytes() >= plaintext.size() + 21; }));
        ReadResult peek;
        REQUIRE(raw->reader().try_read(peek));
        auto wire = peek.to_vector();
        auto plain = Bytes(plaintext);
        CHECK(std::search(wire.begin(), wire.end(), plain.begin(), plain.end()) == wire.end());

        CHECK(Text(client.read(plaintext.size())) == plaintext);
    }

    SECTION("socket -> connection is decrypted") {
        REQUIRE_FALSE(client.write(Bytes("PBSZ 0\r\n")));
        CHECK(Text(ReadExactly(fx.connection.second.input(), 8)) == "PBSZ 0\r\n");
    }

    fx.token_source.cancel();
    REQUIRE(IsReady(fx.finished));
    CHECK(fx.finished.get() == nullptr);
}

TEST_CASE("TLS relay fails the run on a bad handshake", "[network][relay][tls]") {
    TlsRelayFixture fx;
    auto relay = fx.run();

    // Plain FTP where a ClientHello is expected
    REQUIRE(WriteAndFlush(fx.socket.first.output(), Bytes("USER anonymous\r\nPASS x\r\n")));
    REQUIRE(IsReady(fx.finished));

    auto error = fx.finished.get();
    REQUIRE(error != nullptr);
    CHECK_THROWS_AS(std::rethrow_exception(error), boost::system::system_error);
}

TEST_CASE("TLS relay cancelled during handshake ends quietly", "[network][relay][tls]") {
    TlsRelayFixture fx;
    auto relay = fx.run();

    // No ClientHello ever arrives
    std::this_thread::sleep_for(20ms);
    fx.token_source.cancel();
    REQUIRE(IsReady(fx.finished));
    CHECK(fx.finished.get() == nullptr);
}

TEST_CASE("TLS relay reports an unusable certificate", "[network][relay][tls]") {
    TlsRelayFixture fx;
    ServerCertificate broken;
    broken.certificate_chain_pem = "-----BEGIN CERTIFICATE-----\nnope\n-----END CERTIFICATE-----\n";
    broken.private_key_pem = "not a key";
    auto relay = fx.run(broken);

    REQUIRE(IsReady(fx.finished));
    auto error = fx.finished.get();
    REQUIRE(error != nullptr);
    CHECK_THROWS_AS(std::rethrow_exception(error), ConfigurationError);
}

TEST_CASE("TLS relay sends close_notify when the run ends", "[network][relay][tls]") {
    TlsRelayFixture fx;
    auto relay = fx.run();

    TlsTestClient client(fx.runner.executor(), fx.socket.first);
    REQUIRE_FALSE(client.handshake());

    fx.token_source.cancel();
    REQUIRE(IsReady(fx.finished));

    // The client sees an orderly end of stream, not a truncation
    CHECK(client.read(1).empty());
}

TEST_CASE("TLS relay finishes when the peer closes the socket", "[network][relay][tls]") {
    TlsRelayFixture fx;
    auto relay = fx.run();

    {
        TlsTestClient client(fx.runner.executor(), fx.socket.first);
        REQUIRE_FALSE(client.handshake());
    }
    fx.socket.first.output().complete();

    REQUIRE(IsReady(fx.finished));
    CHECK(fx.finished.get() == nullptr);
}

TEST_CASE("ServerCertificate and wrapper factory configuration", "[network][tls][config]") {
    DefaultSslStreamWrapperFactory factory;

    SECTION("the context is cached per certificate") {
        auto a = factory.context_for(TestServerCertificate());
        auto b = factory.context_for(TestServerCertificate());
        CHECK(a == b);
    }

    SECTION("garbage PEM is a configuration error") {
        ServerCertificate broken{"garbage", "garbage"};
        CHECK_THROWS_AS(factory.context_for(broken), ConfigurationError);
    }

    SECTION("missing files are a configuration error") {
        CHECK_THROWS_AS(ServerCertificate::load("/nonexistent/cert.pem", "/nonexistent/key.pem"),
                        ConfigurationError);
    }

    SECTION("load reads both files") {
        auto dir = std::filesystem::temp_directory_path() / "ftpctl_cert_test";
        std::filesystem::create_directories(dir);
        {
            std::ofstream(dir / "cert.pem") << TestServerCertificate().certificate_chain_pem;
            std::ofstream(dir / "key.pem") << TestServerCertificate().private_key_pem;
        }
        auto loaded = ServerCertificate::load(dir / "cert.pem", dir / "key.pem");
        CHECK(loaded.certificate_chain_pem == TestServerCertificate().certificate_chain_pem);
        CHECK(loaded.private_key_pem == TestServerCertificate().private_key_pem);
        CHECK_NOTHROW(factory.context_for(loaded));
        std::filesystem::remove_all(dir);
    }
}

TEST_CASE("TLS relay drains buffered connection data after cancellation",
          "[network][relay][tls]") {
    // Small socket-side thresholds: a TLS write blocks until the client reads
    PipeOptions socket_options;
    socket_options.pause_writer_threshold = 2048;
    socket_options.resume_writer_threshold = 512;
    TlsRelayFixture fx(socket_options);
    auto relay = fx.run();

    TlsTestClient client(fx.runner.executor(), fx.socket.first);
    REQUIRE_FALSE(client.handshake());

    // The first chunk keeps the transmit loop busy in a write the client has
    // not drained yet
    const std::string head(8192, 'h');
    REQUIRE(WriteAndFlush(fx.connection.second.output(), Bytes(head)));
    auto raw = fx.socket.first.input_pipe();
    REQUIRE(WaitFor([&]() { return raw->unread_bytes() > socket_options.pause_writer_threshold; }));

    // Queued behind the blocked write: no read is pending for it
    const std::string tail = "226 Transfer complete.\r\n";
    REQUIRE(WriteAndFlush(fx.connection.second.output(), Bytes(tail)));
    REQUIRE(fx.connection.first.input_pipe()->unread_bytes() == head.size() + tail.size());

    fx.token_source.cancel();

    CHECK(Text(client.read(head.size() + tail.size())) == head + tail);
    // Then close_notify
    CHECK(client.read(1).empty());

    REQUIRE(IsReady(fx.finished));
    CHECK(fx.finished.get() == nullptr);
    CHECK(fx.connection.first.input_pipe()->unread_bytes() == 0);
}
