// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/connection_status.hpp"

namespace ftpctl {
namespace network {

std::string ConnectionStatusAsString(ConnectionStatus status) {
  switch (status) {
  case ConnectionStatus::READY_TO_RUN:
    return "ReadyToRun";
  case ConnectionStatus::RUNNING:
    return "Running";
  case ConnectionStatus::PAUSED:
    return "Paused";
  case ConnectionStatus::STOPPED:
    return "Stopped";
  }
  return "unknown";
}

} // namespace network
} // namespace ftpctl
