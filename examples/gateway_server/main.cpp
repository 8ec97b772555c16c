//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolgate_server entry point: configuration, action catalog, gateway lifecycle
//==========================================================================================================

#include <utility>
#include <csignal>
#include <exception>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolgate/ActionRegistry.h"
#include "toolgate/Collaborator.h"
#include "toolgate/Config.h"
#include "toolgate/GatewayServer.h"
#include "toolgate/StandardActions.h"
#include "toolgate/tools/CommandRunner.h"
#include "toolgate/tools/FileMutator.h"
#include "toolgate/version.h"

using namespace toolgate;

//==========================================================================================================
// buildRegistry
// Purpose: Creates the tool services for the configured workspace and registers the full catalog.
// Returns:
//   Sealed registry shared with the gateway.
//==========================================================================================================
static std::shared_ptr<const ActionRegistry> buildRegistry(const GatewayConfig& config) {
    ToolContext ctx;
    ctx.files = std::make_shared<tools::FileMutator>(config.workspace);

    tools::CommandRunner::Options runnerOpts;
    runnerOpts.workspaceRoot = config.workspace;
    runnerOpts.defaultTimeoutSeconds = config.commandTimeoutSeconds;
    runnerOpts.maxTimeoutSeconds = config.commandTimeoutMaxSeconds;
    runnerOpts.outputLimit = static_cast<std::size_t>(config.commandOutputLimit);
    ctx.commands = std::make_shared<tools::CommandRunner>(runnerOpts);

    ctx.collaborator = CollaboratorFactory::Create(config.collaborator);
    LOG_INFO("Collaborator: {}", ctx.collaborator->Name());

    auto registry = std::make_shared<ActionRegistry>();
    RegisterStandardActions(*registry, ctx);
    registry->Seal();
    return registry;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("TOOLGATE_LOG_LEVEL", "INFO"));
    const std::string logFile = GetEnvOrDefault("TOOLGATE_LOG_FILE", "");
    if (!logFile.empty()) {
        Logger::setLogFile(logFile);
    }

    GatewayConfig config;
    try {
        config = GatewayConfig::Load(argc, argv);
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }

    std::unique_ptr<GatewayServer> server;
    try {
        GatewayServer::Options opts;
        opts.address = config.address;
        opts.port = config.port;
        opts.wsPath = config.wsPath;
        opts.workerThreads = static_cast<std::size_t>(config.workerThreads);
        server = std::make_unique<GatewayServer>(opts, buildRegistry(config));
        server->SetErrorHandler([](const std::string& err) { LOG_DEBUG("Gateway transport error: {}", err); });
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start {}: {}", getServiceName(), e.what());
        return 1;
    }
    LOG_INFO("{} {} serving workspace {}", getServiceName(), getVersionString(), config.workspace.string());

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (ec) {
            LOG_WARN("Signal wait failed: {}", ec.message());
            return;
        }
        LOG_INFO("Received signal {}, shutting down", signo);
    });
    signalContext.run();

    server->Stop().get();
    return 0;
}
