// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace ftpctl {
namespace network {

/**
 * Lifecycle of a communication service.
 *
 *   READY_TO_RUN --start--> RUNNING --(cycle ends: pause)--> PAUSED
 *   PAUSED --resume--> RUNNING
 *   RUNNING / PAUSED --stop--> STOPPED   (terminal)
 */
enum class ConnectionStatus : uint8_t {
  READY_TO_RUN,
  RUNNING,
  PAUSED,
  STOPPED,
};

std::string ConnectionStatusAsString(ConnectionStatus status);

} // namespace network
} // namespace ftpctl
