//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Gateway configuration from TOOLGATE_* environment variables and --key=value arguments
//==========================================================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "toolgate/Collaborator.h"

namespace toolgate {

//==========================================================================================================
// getArgValue
// Purpose: Returns the value of a "--key=value" argument, or std::nullopt when absent.
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key);

//==========================================================================================================
// GatewayConfig
// Purpose: Every runtime setting of the gateway.
// Fields:
//   address/port/wsPath: Listener (port 0 picks an ephemeral port).
//   workspace: Root for relative paths in file, search and command actions.
//   workerThreads: Size of the handler pool.
//   commandTimeoutSeconds/commandTimeoutMaxSeconds: Default and upper bound for execute_command.
//   commandOutputLimit: Per-stream capture cap in bytes.
//   collaborator: External service selection.
//==========================================================================================================
struct GatewayConfig {
    std::string address{"127.0.0.1"};
    uint16_t port{8000};
    std::string wsPath{"/ws"};
    std::filesystem::path workspace;
    int64_t workerThreads{32};
    double commandTimeoutSeconds{30.0};
    double commandTimeoutMaxSeconds{600.0};
    int64_t commandOutputLimit{8 * 1024 * 1024};
    CollaboratorOptions collaborator;

    //==========================================================================================================
    // Load
    // Purpose: Defaults, then environment, then command-line overrides, then Validate().
    // Throws:
    //   std::invalid_argument naming the offending setting.
    //==========================================================================================================
    static GatewayConfig Load(int argc, char** argv);

    static GatewayConfig FromEnvironment();
    void ApplyArguments(int argc, char** argv);

    // Throws std::invalid_argument when a value is out of range or the workspace is unusable.
    void Validate() const;
};

} // namespace toolgate
