//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelope.h
// Purpose: Request and response envelopes exchanged over a gateway connection
//==========================================================================================================

#pragma once

#include <string>

#include "toolgate/JSONValue.h"
#include "toolgate/errors/Errors.h"

namespace toolgate {

//==========================================================================================================
// RequestEnvelope
// Purpose: One inbound request frame: {action, data, request_id}.
// Fields:
//   action: Action name (non-empty).
//   data: Object payload; {} when the frame omitted it or sent null.
//   requestId: Any JSON value, echoed verbatim in the response.
//   hasRequestId: false when the frame carried no request_id member at all.
//==========================================================================================================
struct RequestEnvelope {
    std::string action;
    JSONValue data{JSONValue::Object{}};
    JSONValue requestId;
    bool hasRequestId{false};

    std::string Serialize() const;
};

//==========================================================================================================
// InvalidEnvelope
// Purpose: Thrown by ParseRequestEnvelope. Carries the response message ("Invalid JSON" or
//          "Invalid request") and whatever request_id could still be recovered from the frame.
//==========================================================================================================
class InvalidEnvelope : public errors::GatewayError {
public:
    InvalidEnvelope(std::string message, const std::string& detail, JSONValue requestId)
        : errors::GatewayError(errors::ErrorCategory::Validation, detail),
          message_(std::move(message)), requestId_(std::move(requestId)) {}

    const std::string& message() const noexcept { return message_; }
    const JSONValue& requestId() const noexcept { return requestId_; }

private:
    std::string message_;
    JSONValue requestId_;
};

//==========================================================================================================
// ParseRequestEnvelope
// Purpose: Parses and validates a text frame into a RequestEnvelope.
// Throws:
//   InvalidEnvelope when the text is not JSON, not an object, lacks a string action, has a
//   non-object data member.
//==========================================================================================================
RequestEnvelope ParseRequestEnvelope(const std::string& text);

// Canonical correlation key for a request_id of any JSON type.
std::string RequestIdKey(const JSONValue& id);

//==========================================================================================================
// ResponseEnvelope
// Purpose: Uniform reply {success, message, data, error, request_id}.
// Notes:
//   - Only constructible through Success()/Failure(): success implies error == null and an object
//     data; failure implies data == null and a non-empty error string.
//==========================================================================================================
class ResponseEnvelope {
public:
    static ResponseEnvelope Success(std::string message, JSONValue::Object data,
                                    JSONValue requestId = JSONValue());
    static ResponseEnvelope Failure(std::string message, std::string error,
                                    JSONValue requestId = JSONValue());
    static ResponseEnvelope FromError(const std::string& message, const errors::GatewayError& err,
                                      JSONValue requestId = JSONValue());

    bool IsSuccess() const { return success_; }
    const std::string& Message() const { return message_; }
    // Object payload for success envelopes; empty object for failures.
    const JSONValue::Object& Data() const { return data_; }
    // Error string for failures; empty for success envelopes.
    const std::string& Error() const { return error_; }
    const JSONValue& RequestId() const { return requestId_; }
    void SetRequestId(JSONValue id) { requestId_ = std::move(id); }

    JSONValue ToJSON() const;
    std::string Serialize() const;

    //==========================================================================================================
    // Deserialize
    // Purpose: Parses a response frame (client side).
    // Throws:
    //   JSONParseError for malformed JSON; std::invalid_argument when the envelope shape is violated.
    //==========================================================================================================
    static ResponseEnvelope Deserialize(const std::string& text);

private:
    ResponseEnvelope() = default;

    bool success_{false};
    std::string message_;
    JSONValue::Object data_;
    std::string error_;
    JSONValue requestId_;
};

} // namespace toolgate
