// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    ftpctl::util::LogManager::Initialize(level, false, "");

    // "trace" also lowers every component logger, so LOG_RELAY_TRACE,
    // LOG_TLS_TRACE, etc. all show up
    if (level == "trace") {
        for (const char* component : {"network", "relay", "tls", "auth", "app"}) {
            ftpctl::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    ftpctl::util::LogManager::Shutdown();
}
