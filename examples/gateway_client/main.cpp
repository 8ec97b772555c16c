//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolgate_client: sends one request envelope and prints the response
//==========================================================================================================

#include <exception>
#include <iostream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolgate/Config.h"
#include "toolgate/GatewayClient.h"

using namespace toolgate;

static void printUsage() {
    std::cerr << "usage: toolgate_client --action=<name> [--data=<json object>] [--url=ws://127.0.0.1:8000/ws]"
                 " [--timeout-ms=30000]\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("TOOLGATE_LOG_LEVEL", "WARN"));

    const auto action = getArgValue(argc, argv, "--action");
    if (!action.has_value() || action->empty()) {
        printUsage();
        return 2;
    }

    JSONValue data{JSONValue::Object{}};
    if (auto text = getArgValue(argc, argv, "--data"); text.has_value()) {
        try {
            data = ParseJSON(*text);
        } catch (const JSONParseError& e) {
            std::cerr << "invalid --data: " << e.what() << "\n";
            return 2;
        }
    }

    GatewayClient::Options opts;
    opts.url = getArgValue(argc, argv, "--url").value_or(GetEnvOrDefault("TOOLGATE_URL", opts.url));
    if (auto ms = getArgValue(argc, argv, "--timeout-ms"); ms.has_value()) {
        try {
            opts.requestTimeout = std::chrono::milliseconds(ParseInt64Setting("--timeout-ms", *ms));
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            return 2;
        }
    }

    try {
        GatewayClient client(opts);
        client.Connect();
        ResponseEnvelope response = client.Send(*action, data);
        std::cout << response.Serialize() << std::endl;
        client.Close();
        return response.IsSuccess() ? 0 : 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Request failed: {}", e.what());
        return 2;
    }
}
