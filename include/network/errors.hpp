// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace ftpctl {
namespace network {

// A control call (start/stop/pause/resume) was issued in a status that does
// not allow it. Nothing was started or changed.
class InvalidStateTransition : public std::logic_error {
public:
  explicit InvalidStateTransition(const std::string &what)
      : std::logic_error(what) {}
};

// Invalid configuration, e.g. enabling TLS without a certificate or a
// certificate/key that cannot be loaded.
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace network
} // namespace ftpctl
