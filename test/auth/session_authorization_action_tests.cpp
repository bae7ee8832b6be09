// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "auth/session_authorization_action.hpp"
#include <stdexcept>

using namespace ftpctl::auth;
using ftpctl::util::CancellationSource;
using ftpctl::util::CancellationToken;

namespace {

class RecordingSession : public SessionFeature {
public:
    explicit RecordingSession(bool fail = false) : fail_(fail) {}

    void open_session() override {
        ++open_calls;
        if (fail_) throw std::runtime_error("pam_open_session: Permission denied");
        open_ = true;
    }
    bool is_session_open() const override { return open_; }

    int open_calls = 0;

private:
    bool fail_;
    bool open_ = false;
};

AccountInformation Account(const std::string& method) {
    AccountInformation account;
    account.user_name = "alice";
    if (!method.empty()) account.claims[CLAIM_AUTHENTICATION_METHOD] = method;
    return account;
}

} // namespace

TEST_CASE("SessionAuthorizationAction level", "[auth]") {
    SessionAuthorizationAction action(std::make_shared<FeatureCollection>());
    CHECK(action.level() == 1850);
}

TEST_CASE("SessionAuthorizationAction opens the session for PAM accounts", "[auth]") {
    auto features = std::make_shared<FeatureCollection>();
    auto session = std::make_shared<RecordingSession>();
    features->set<SessionFeature>(session);
    SessionAuthorizationAction action(features);

    SECTION("pam account") {
        action.authorized(Account("pam"), CancellationToken::none());
        CHECK(session->open_calls == 1);
        CHECK(session->is_session_open());
    }

    SECTION("other authentication method") {
        action.authorized(Account("password"), CancellationToken::none());
        CHECK(session->open_calls == 0);
    }

    SECTION("no authentication method claim") {
        action.authorized(Account(""), CancellationToken::none());
        CHECK(session->open_calls == 0);
    }

    SECTION("cancelled before running") {
        CancellationSource source;
        source.cancel();
        action.authorized(Account("pam"), source.token());
        CHECK(session->open_calls == 0);
    }
}

TEST_CASE("SessionAuthorizationAction tolerates missing or failing sessions", "[auth]") {
    SECTION("no session feature registered") {
        auto features = std::make_shared<FeatureCollection>();
        SessionAuthorizationAction action(features);
        CHECK_NOTHROW(action.authorized(Account("pam"), CancellationToken::none()));
    }

    SECTION("no feature collection") {
        SessionAuthorizationAction action(nullptr);
        CHECK_NOTHROW(action.authorized(Account("pam"), CancellationToken::none()));
    }

    SECTION("open_session throws") {
        auto features = std::make_shared<FeatureCollection>();
        auto session = std::make_shared<RecordingSession>(true);
        features->set<SessionFeature>(session);
        SessionAuthorizationAction action(features);

        CHECK_NOTHROW(action.authorized(Account("pam"), CancellationToken::none()));
        CHECK(session->open_calls == 1);
        CHECK_FALSE(session->is_session_open());
    }
}

TEST_CASE("FeatureCollection stores one feature per type", "[auth]") {
    FeatureCollection features;
    CHECK(features.get<SessionFeature>() == nullptr);

    auto first = std::make_shared<RecordingSession>();
    auto second = std::make_shared<RecordingSession>();
    features.set<SessionFeature>(first);
    features.set<SessionFeature>(second);
    CHECK(features.size() == 1);
    CHECK(features.get<SessionFeature>() == second);

    features.set<SessionFeature>(nullptr);
    CHECK(features.size() == 0);
    CHECK(features.get<SessionFeature>() == nullptr);
}
