// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "network/connection_status.hpp"
#include "network/errors.hpp"
#include "network/tls_stream_service.hpp"
#include "test_helpers.hpp"

using namespace ftpctl::network;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ConnectionStatus names", "[unit][status]") {
    CHECK(ConnectionStatusAsString(ConnectionStatus::READY_TO_RUN) == "ReadyToRun");
    CHECK(ConnectionStatusAsString(ConnectionStatus::RUNNING) == "Running");
    CHECK(ConnectionStatusAsString(ConnectionStatus::PAUSED) == "Paused");
    CHECK(ConnectionStatusAsString(ConnectionStatus::STOPPED) == "Stopped");
    CHECK(ConnectionStatusAsString(static_cast<ConnectionStatus>(42)) == "unknown");
}

TEST_CASE("Error types keep their categories", "[unit][status]") {
    // Misuse of the control API is a logic error; bad configuration is a
    // runtime condition
    CHECK_THROWS_AS(throw InvalidStateTransition("x"), std::logic_error);
    CHECK_THROWS_AS(throw ConfigurationError("x"), std::runtime_error);
}

TEST_CASE("Illegal transitions name the call and the current status", "[unit][status]") {
    ftpctl::test::IoContextRunner runner;
    auto socket = DuplexPipe::create_pair(runner.executor());
    auto connection = DuplexPipe::create_pair(runner.executor());
    auto service = TlsStreamService::create(runner.executor(), socket.second, connection.first,
                                            nullptr, std::nullopt,
                                            ftpctl::util::CancellationSource());

    CHECK_THROWS_WITH(service->pause(), ContainsSubstring("pause") &&
                                            ContainsSubstring("ReadyToRun"));
    CHECK_THROWS_WITH(service->stop(), ContainsSubstring("stop"));

    service->start();
    CHECK_THROWS_WITH(service->start(), ContainsSubstring("start") &&
                                            ContainsSubstring("Running"));
    REQUIRE(ftpctl::test::IsReady(service->stop()));
}
