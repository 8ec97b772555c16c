//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayClient.h
// Purpose: WebSocket client for the gateway; correlates response envelopes by request_id
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "toolgate/Envelope.h"
#include "toolgate/JSONValue.h"

namespace toolgate {

//==========================================================================================================
// GatewayClient
// Purpose: Sends request envelopes over one WebSocket and resolves a future per request_id.
// Notes:
//   - Responses whose request_id is null or unknown (rejected frames, legacy requests) are queued
//     and can be taken with NextUnsolicited().
//   - Pending futures fail with std::runtime_error when the connection ends.
//==========================================================================================================
class GatewayClient {
public:
    struct Options {
        std::string url{"ws://127.0.0.1:8000/ws"};
        std::chrono::milliseconds requestTimeout{30000};
    };

    explicit GatewayClient(const Options& opts);
    ~GatewayClient();

    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    //==========================================================================================================
    // Connect
    // Purpose: Resolves, connects and performs the WebSocket handshake, then starts the reader thread.
    // Throws:
    //   std::invalid_argument for a malformed URL; boost::system::system_error for network failures.
    //==========================================================================================================
    void Connect();

    bool IsConnected() const;

    //==========================================================================================================
    // SendAsync
    // Args:
    //   action: Action name.
    //   data: Payload object.
    //   requestId: Explicit request_id; when omitted a unique "req-N" string is generated.
    // Returns:
    //   Future resolved with the matching response envelope.
    // Throws:
    //   std::logic_error when not connected or when requestId is already pending on this client.
    //==========================================================================================================
    std::future<ResponseEnvelope> SendAsync(const std::string& action, const JSONValue& data,
                                            std::optional<JSONValue> requestId = std::nullopt);

    // Blocking variant of SendAsync; throws errors::GatewayError (Timeout) after requestTimeout.
    ResponseEnvelope Send(const std::string& action, const JSONValue& data);

    // Writes a text frame verbatim (no correlation).
    void SendRaw(const std::string& frame);

    // Next response that did not match a pending request.
    std::optional<ResponseEnvelope> NextUnsolicited(std::chrono::milliseconds timeout);

    // Sends a close frame and waits briefly for the peer. Idempotent.
    void Close();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgate
