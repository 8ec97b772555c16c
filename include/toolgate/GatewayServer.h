//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayServer.h
// Purpose: Coroutine-based WebSocket gateway using Boost.Beast, with HTTP status/health endpoints
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolgate/ActionRegistry.h"

namespace toolgate {

class GatewayServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Listener and worker pool configuration.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; 0 picks an ephemeral port (see GetBoundPort())
    //   wsPath: Request target accepted for the WebSocket upgrade
    //   workerThreads: Size of the thread pool running action handlers
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{8000};
        std::string wsPath{"/ws"};
        std::size_t workerThreads{32};
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    // Throws std::invalid_argument when registry is null or not sealed.
    GatewayServer(const Options& opts, std::shared_ptr<const ActionRegistry> registry);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Binds the listener on the calling thread, then runs the accept loop on a background I/O
    //          thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    // Throws:
    //   boost::system::system_error when the address cannot be resolved or bound; std::logic_error when
    //   already started. A stopped server cannot be restarted.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stop
    // Purpose: Closes the listener and every session, stops the I/O thread and the worker pool.
    // Notes:
    //   Handlers already running are waited for; their results are discarded. Idempotent.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;

    // Port actually bound; valid after Start().
    uint16_t GetBoundPort() const;

    std::size_t ConnectionCount() const;

    // Transport errors that are not tied to a request (accept failures, connection errors).
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgate
