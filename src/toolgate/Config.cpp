//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment/argument parsing and validation of GatewayConfig
//==========================================================================================================

#include <stdexcept>
#include <system_error>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolgate/Config.h"

namespace fs = std::filesystem;

namespace toolgate {

namespace {

uint16_t parsePort(const std::string& name, const std::string& text) {
    const int64_t v = ParseInt64Setting(name, text);
    if (v < 0 || v > 65535) {
        throw std::invalid_argument(name + " out of range [0, 65535]: " + text);
    }
    return static_cast<uint16_t>(v);
}

double parseSeconds(const std::string& name, const std::string& text) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid number for " + name + ": '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("invalid number for " + name + ": '" + text + "'");
    }
    return v;
}

} // namespace

std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

GatewayConfig GatewayConfig::FromEnvironment() {
    GatewayConfig c;
    c.address = GetEnvOrDefault("TOOLGATE_ADDRESS", c.address);
    const std::string port = GetEnvOrDefault("TOOLGATE_PORT", "");
    if (!port.empty()) c.port = parsePort("TOOLGATE_PORT", port);
    c.wsPath = GetEnvOrDefault("TOOLGATE_WS_PATH", c.wsPath);
    c.workspace = GetEnvOrDefault("TOOLGATE_WORKSPACE", "");
    c.workerThreads = GetEnvInt64OrDefault("TOOLGATE_WORKER_THREADS", c.workerThreads);
    const std::string timeout = GetEnvOrDefault("TOOLGATE_COMMAND_TIMEOUT", "");
    if (!timeout.empty()) c.commandTimeoutSeconds = parseSeconds("TOOLGATE_COMMAND_TIMEOUT", timeout);
    const std::string timeoutMax = GetEnvOrDefault("TOOLGATE_COMMAND_TIMEOUT_MAX", "");
    if (!timeoutMax.empty()) c.commandTimeoutMaxSeconds = parseSeconds("TOOLGATE_COMMAND_TIMEOUT_MAX", timeoutMax);
    c.commandOutputLimit = GetEnvInt64OrDefault("TOOLGATE_COMMAND_OUTPUT_LIMIT", c.commandOutputLimit);
    c.collaborator.mode = GetEnvOrDefault("TOOLGATE_COLLABORATOR", c.collaborator.mode);
    c.collaborator.url = GetEnvOrDefault("TOOLGATE_COLLABORATOR_URL", "");
    c.collaborator.apiKey = GetEnvOrDefault("TOOLGATE_COLLABORATOR_KEY", "");
    c.collaborator.requestTimeoutMs = GetEnvInt64OrDefault("TOOLGATE_COLLABORATOR_TIMEOUT_MS", c.collaborator.requestTimeoutMs);
    return c;
}

void GatewayConfig::ApplyArguments(int argc, char** argv) {
    if (auto v = getArgValue(argc, argv, "--address")) address = *v;
    if (auto v = getArgValue(argc, argv, "--port")) port = parsePort("--port", *v);
    if (auto v = getArgValue(argc, argv, "--ws-path")) wsPath = *v;
    if (auto v = getArgValue(argc, argv, "--workspace")) workspace = *v;
    if (auto v = getArgValue(argc, argv, "--workers")) workerThreads = ParseInt64Setting("--workers", *v);
    if (auto v = getArgValue(argc, argv, "--command-timeout")) commandTimeoutSeconds = parseSeconds("--command-timeout", *v);
    if (auto v = getArgValue(argc, argv, "--command-timeout-max")) commandTimeoutMaxSeconds = parseSeconds("--command-timeout-max", *v);
    if (auto v = getArgValue(argc, argv, "--collaborator")) collaborator.mode = *v;
    if (auto v = getArgValue(argc, argv, "--collaborator-url")) collaborator.url = *v;
}

void GatewayConfig::Validate() const {
    if (address.empty()) {
        throw std::invalid_argument("bind address must not be empty");
    }
    if (wsPath.empty() || wsPath.front() != '/') {
        throw std::invalid_argument("WebSocket path must start with '/': " + wsPath);
    }
    if (workerThreads < 1 || workerThreads > 1024) {
        throw std::invalid_argument("worker threads out of range [1, 1024]: " + std::to_string(workerThreads));
    }
    if (!(commandTimeoutMaxSeconds > 0.0)) {
        throw std::invalid_argument("max command timeout must be > 0");
    }
    if (!(commandTimeoutSeconds > 0.0) || commandTimeoutSeconds > commandTimeoutMaxSeconds) {
        throw std::invalid_argument("default command timeout must be > 0 and <= the max command timeout");
    }
    if (commandOutputLimit < 1) {
        throw std::invalid_argument("command output limit must be positive");
    }
    if (collaborator.requestTimeoutMs < 1) {
        throw std::invalid_argument("collaborator timeout must be positive");
    }
    if (collaborator.mode != "none" && collaborator.mode != "http" && collaborator.mode != "offline") {
        throw std::invalid_argument("collaborator mode must be none, http or offline: " + collaborator.mode);
    }
    const fs::path root = workspace.empty() ? fs::current_path() : workspace;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw std::invalid_argument("workspace is not a directory: " + root.string());
    }
}

GatewayConfig GatewayConfig::Load(int argc, char** argv) {
    GatewayConfig c = FromEnvironment();
    c.ApplyArguments(argc, argv);
    if (c.workspace.empty()) {
        c.workspace = fs::current_path();
    }
    c.workspace = fs::absolute(c.workspace).lexically_normal();
    c.Validate();
    LOG_DEBUG("Configuration: address={} port={} ws_path={} workspace={} workers={} collaborator={}",
              c.address, c.port, c.wsPath, c.workspace.string(), c.workerThreads, c.collaborator.mode);
    return c;
}

} // namespace toolgate
