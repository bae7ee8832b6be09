// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "auth/session_authorization_action.hpp"
#include "util/logging.hpp"

namespace ftpctl {
namespace auth {

SessionAuthorizationAction::SessionAuthorizationAction(
    std::shared_ptr<FeatureCollection> features)
    : features_(std::move(features)) {}

void SessionAuthorizationAction::authorized(const AccountInformation &account,
                                            const util::CancellationToken &token) {
  if (token.is_cancellation_requested()) {
    return;
  }

  auto method = account.find_claim(CLAIM_AUTHENTICATION_METHOD);
  if (!method || *method != AUTHENTICATION_METHOD) {
    return;
  }

  auto session = features_ ? features_->get<SessionFeature>() : nullptr;
  if (!session) {
    LOG_AUTH_DEBUG("no session feature for user {}", account.user_name);
    return;
  }

  try {
    session->open_session();
    LOG_AUTH_DEBUG("session opened for user {}", account.user_name);
  } catch (const std::exception &e) {
    LOG_AUTH_WARN("failed to open session for user {}: {}", account.user_name,
                  e.what());
  }
}

} // namespace auth
} // namespace ftpctl
