// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/connection_status.hpp"
#include <future>

namespace ftpctl {
namespace network {

// Completion handle of a control call. Becomes ready once the relay cycle the
// call refers to has fully unwound (or immediately, if there is none).
using ServiceHandle = std::shared_future<void>;

// Start/stop contract shared by all connection-level services
class BasicCommunicationService {
public:
  virtual ~BasicCommunicationService() = default;

  virtual ServiceHandle start() = 0;
  virtual ServiceHandle stop() = 0;
};

// Communication service that can additionally be paused and resumed without
// losing buffered data or closing the underlying connection.
class CommunicationService : public BasicCommunicationService {
public:
  virtual ConnectionStatus status() const = 0;

  virtual ServiceHandle pause() = 0;
  // "continue": no-op on a stopped service
  virtual ServiceHandle resume() = 0;
};

} // namespace network
} // namespace ftpctl
