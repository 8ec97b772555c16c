//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session state machine and request correlation
//==========================================================================================================

#include <utility>
#include <boost/asio/post.hpp>

#include "logging/Logger.h"
#include "toolgate/Envelope.h"
#include "toolgate/Session.h"
#include "toolgate/errors/Errors.h"

namespace toolgate {
namespace net = boost::asio;

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Open: return "open";
        case SessionState::Closing: return "closing";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

Session::Session(std::string id, std::shared_ptr<const ActionRegistry> registry,
                 net::any_io_executor workers, FrameWriter writer)
    : id_(std::move(id)),
      createdAt_(std::chrono::system_clock::now()),
      registry_(std::move(registry)),
      workers_(std::move(workers)),
      writer_(std::move(writer)) {}

Session::~Session() = default;

SessionState Session::GetState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::Open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Connecting) {
        state_ = SessionState::Open;
    }
}

void Session::SetClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    closedHandler_ = std::move(handler);
}

std::size_t Session::InFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.size();
}

std::vector<std::string> Session::InFlightRequestKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(inFlight_.begin(), inFlight_.end());
}

void Session::send(const ResponseEnvelope& response) {
    if (writer_) {
        writer_(response.Serialize());
    }
}

void Session::OnFrame(const std::string& text) {
    if (GetState() != SessionState::Open) {
        LOG_DEBUG("Session {}: dropping frame received while {}", id_, SessionStateName(GetState()));
        return;
    }

    RequestEnvelope request;
    try {
        request = ParseRequestEnvelope(text);
    } catch (const InvalidEnvelope& e) {
        LOG_DEBUG("Session {}: rejected frame: {}", id_, e.what());
        send(ResponseEnvelope::FromError(e.message(), e, e.requestId()));
        return;
    }

    // Unknown actions never reach the worker pool.
    if (!registry_->Contains(request.action)) {
        ResponseEnvelope response = registry_->Dispatch(request.action, request.data);
        response.SetRequestId(request.requestId);
        send(response);
        return;
    }

    std::string key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (request.hasRequestId && !request.requestId.IsNull()) {
            key = "id:" + RequestIdKey(request.requestId);
        } else {
            key = "seq:" + std::to_string(++sequence_);
        }
        if (!inFlight_.insert(key).second) {
            key.clear();
        }
    }
    if (key.empty()) {
        LOG_DEBUG("Session {}: duplicate request_id {}", id_, SerializeJSON(request.requestId));
        send(ResponseEnvelope::FromError("Duplicate request",
                                         errors::validationError("duplicate request_id " + SerializeJSON(request.requestId) +
                                                                 " is already in flight"),
                                         request.requestId));
        return;
    }

    LOG_DEBUG("Session {}: dispatching {} (request_id={})", id_, request.action, SerializeJSON(request.requestId));
    net::post(workers_, [self = shared_from_this(), request = std::move(request), key]() mutable {
        self->runRequest(std::move(request), key);
    });
}

void Session::runRequest(RequestEnvelope request, const std::string& key) {
    ResponseEnvelope response = [&]() {
        try {
            return registry_->Dispatch(request.action, request.data);
        } catch (const std::exception& e) {
            LOG_ERROR("Session {}: dispatch of {} failed: {}", id_, request.action, e.what());
            return ResponseEnvelope::FromError("Internal error",
                                               errors::GatewayError(errors::ErrorCategory::Internal, e.what()));
        }
    }();
    response.SetRequestId(request.requestId);

    bool deliver = false;
    bool closedNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(key);
        deliver = (state_ == SessionState::Open);
        if (state_ == SessionState::Closing && inFlight_.empty()) {
            state_ = SessionState::Closed;
            closedNow = true;
        }
    }
    if (deliver) {
        send(response);
    } else {
        LOG_DEBUG("Session {}: discarding {} result after close", id_, request.action);
    }
    if (closedNow) {
        finishClose();
    }
}

void Session::Close() {
    bool closedNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closing || state_ == SessionState::Closed) {
            return;
        }
        if (inFlight_.empty()) {
            state_ = SessionState::Closed;
            closedNow = true;
        } else {
            state_ = SessionState::Closing;
            LOG_DEBUG("Session {}: closing with {} request(s) in flight", id_, inFlight_.size());
        }
    }
    if (closedNow) {
        finishClose();
    }
}

void Session::finishClose() {
    ClosedHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = std::move(closedHandler_);
        closedHandler_ = nullptr;
    }
    LOG_DEBUG("Session {}: closed", id_);
    if (handler) {
        handler(id_);
    }
}

} // namespace toolgate
