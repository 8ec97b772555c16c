//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Per-connection request lifecycle: envelope parsing, request_id tracking, worker dispatch
//==========================================================================================================

#pragma once

#include <utility>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include "toolgate/ActionRegistry.h"

namespace toolgate {

enum class SessionState { Connecting, Open, Closing, Closed };

const char* SessionStateName(SessionState state);

//==========================================================================================================
// Session
// Purpose: Transport-independent state of one client connection.
// Notes:
//   - Frames are accepted only while Open. Each valid request is posted to the worker executor; its
//     response is written through the FrameWriter when the handler completes, so responses follow
//     completion order.
//   - A request_id already in flight on this session is rejected. Requests without a request_id (or
//     with null) are tracked under an internal sequence key and answered with request_id null.
//   - Close() moves to Closing while handlers are in flight and to Closed when the last one ends.
//     Results completing after Close() are discarded.
//   - The FrameWriter may be invoked from worker threads and must be thread-safe.
//==========================================================================================================
class Session : public std::enable_shared_from_this<Session> {
public:
    using FrameWriter = std::function<void(std::string frame)>;
    using ClosedHandler = std::function<void(const std::string& sessionId)>;

    Session(std::string id, std::shared_ptr<const ActionRegistry> registry,
            boost::asio::any_io_executor workers, FrameWriter writer);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const { return id_; }
    std::chrono::system_clock::time_point CreatedAt() const { return createdAt_; }
    SessionState GetState() const;

    // Connecting -> Open; called once the transport handshake completed.
    void Open();

    //==========================================================================================================
    // OnFrame
    // Purpose: Handles one inbound text frame.
    // Notes:
    //   Parse failures, unknown actions and duplicate request_ids are answered immediately on the
    //   calling thread; everything else is dispatched on the worker executor.
    //==========================================================================================================
    void OnFrame(const std::string& text);

    // Idempotent. Invokes the closed handler exactly once, when the state reaches Closed.
    void Close();

    std::size_t InFlightCount() const;
    std::vector<std::string> InFlightRequestKeys() const;

    void SetClosedHandler(ClosedHandler handler);

private:
    void runRequest(RequestEnvelope request, const std::string& key);
    void send(const ResponseEnvelope& response);
    void finishClose();

    const std::string id_;
    const std::chrono::system_clock::time_point createdAt_;
    std::shared_ptr<const ActionRegistry> registry_;
    boost::asio::any_io_executor workers_;
    FrameWriter writer_;
    ClosedHandler closedHandler_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Connecting};
    std::unordered_set<std::string> inFlight_;
    uint64_t sequence_{0};
};

} // namespace toolgate
