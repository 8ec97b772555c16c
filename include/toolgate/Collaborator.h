//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Collaborator.h
// Purpose: External code-assist service interface and its HTTP(S), offline and unconfigured implementations
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "toolgate/JSONValue.h"

namespace toolgate {

//==========================================================================================================
// ICollaborator
// Purpose: Opaque service behind analyze_code, generate_code, generate_tests, refactor_code, plan_task.
// Notes:
//   - Invoke() is called concurrently from worker threads.
//   - Failures throw errors::GatewayError with category ExternalService (or Timeout).
//==========================================================================================================
class ICollaborator {
public:
    virtual ~ICollaborator() = default;

    //==========================================================================================================
    // Invoke
    // Args:
    //   capability: Action name of the caller ("analyze_code", ...).
    //   payload: The validated request data object.
    // Returns:
    //   Result text produced by the service.
    //==========================================================================================================
    virtual std::string Invoke(const std::string& capability, const JSONValue& payload) = 0;

    virtual std::string Name() const = 0;
};

//==========================================================================================================
// CollaboratorOptions
// Purpose: Selection and connection settings for the collaborator.
// Fields:
//   mode: "none", "http" or "offline".
//   url: http:// or https:// endpoint (mode == "http").
//   apiKey: Sent as "Authorization: Bearer <apiKey>" when non-empty.
//   connectTimeoutMs: Resolve + connect + TLS handshake budget.
//   requestTimeoutMs: Write + read budget.
//==========================================================================================================
struct CollaboratorOptions {
    std::string mode{"none"};
    std::string url;
    std::string apiKey;
    int64_t connectTimeoutMs{10000};
    int64_t requestTimeoutMs{60000};
};

//==========================================================================================================
// HTTPCollaborator
// Purpose: POSTs {"capability","payload"} as JSON to a configured endpoint using Boost.Beast.
// Notes:
//   - 2xx responses whose JSON body has a string "text" or "result" member yield that member;
//     any other 2xx body is returned verbatim.
//   - Non-2xx statuses and transport failures throw ExternalServiceError; expired deadlines throw Timeout.
//   - HTTPS uses TLS 1.3 with peer verification against the system trust store and SNI.
//==========================================================================================================
class HTTPCollaborator : public ICollaborator {
public:
    explicit HTTPCollaborator(const CollaboratorOptions& opts);
    ~HTTPCollaborator() override;

    std::string Invoke(const std::string& capability, const JSONValue& payload) override;
    std::string Name() const override { return "http"; }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Deterministic local answers; no network access.
class OfflineCollaborator : public ICollaborator {
public:
    std::string Invoke(const std::string& capability, const JSONValue& payload) override;
    std::string Name() const override { return "offline"; }
};

// Every call fails with ExternalServiceError explaining which setting is missing.
class UnconfiguredCollaborator : public ICollaborator {
public:
    explicit UnconfiguredCollaborator(std::string reason) : reason_(std::move(reason)) {}
    std::string Invoke(const std::string& capability, const JSONValue& payload) override;
    std::string Name() const override { return "none"; }

private:
    std::string reason_;
};

//==========================================================================================================
// CollaboratorFactory
// Purpose: Builds the implementation selected by CollaboratorOptions::mode.
// Notes:
//   - "http" without a URL yields an UnconfiguredCollaborator naming TOOLGATE_COLLABORATOR_URL.
//   - Unknown modes throw std::invalid_argument.
//==========================================================================================================
class CollaboratorFactory {
public:
    static std::shared_ptr<ICollaborator> Create(const CollaboratorOptions& opts);
};

} // namespace toolgate
