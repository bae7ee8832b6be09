// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "auth/account_information.hpp"
#include "util/cancellation.hpp"

namespace ftpctl {
namespace auth {

// Runs after a successful authentication. Actions are executed in ascending
// level order.
class AuthorizationAction {
public:
  virtual ~AuthorizationAction() = default;

  virtual int level() const = 0;
  virtual void authorized(const AccountInformation &account,
                          const util::CancellationToken &token) = 0;
};

} // namespace auth
} // namespace ftpctl
