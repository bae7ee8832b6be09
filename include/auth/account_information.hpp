// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <optional>
#include <string>

namespace ftpctl {
namespace auth {

// Claim naming the mechanism that authenticated the account ("pam", ...)
inline constexpr const char *CLAIM_AUTHENTICATION_METHOD = "authentication_method";

// Authenticated account as seen by authorization actions
struct AccountInformation {
  std::string user_name;
  std::map<std::string, std::string> claims;

  std::optional<std::string> find_claim(const std::string &type) const {
    auto it = claims.find(type);
    if (it == claims.end()) {
      return std::nullopt;
    }
    return it->second;
  }
};

} // namespace auth
} // namespace ftpctl
