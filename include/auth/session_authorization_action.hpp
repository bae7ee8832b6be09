// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "auth/authorization_action.hpp"
#include "auth/feature_collection.hpp"
#include <memory>

namespace ftpctl {
namespace auth {

// Login session bound to a connection (e.g. a PAM session)
class SessionFeature {
public:
  virtual ~SessionFeature() = default;

  // May throw; callers decide whether a failure matters
  virtual void open_session() = 0;
  virtual bool is_session_open() const = 0;
};

/**
 * Opens the connection's login session once a PAM-authenticated user is
 * authorized.
 *
 * Only accounts whose authentication_method claim is "pam" are handled. A
 * missing SessionFeature is not an error, and a failing open_session() is
 * logged and otherwise ignored: the login proceeds without a session.
 */
class SessionAuthorizationAction : public AuthorizationAction {
public:
  static constexpr int LEVEL = 1850;
  static constexpr const char *AUTHENTICATION_METHOD = "pam";

  explicit SessionAuthorizationAction(std::shared_ptr<FeatureCollection> features);

  int level() const override { return LEVEL; }
  void authorized(const AccountInformation &account,
                  const util::CancellationToken &token) override;

private:
  std::shared_ptr<FeatureCollection> features_;
};

} // namespace auth
} // namespace ftpctl
