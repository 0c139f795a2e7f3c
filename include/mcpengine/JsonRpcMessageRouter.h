//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Classification and decoding of inbound JSON-RPC envelopes
//========================================================================================================

#pragma once

#include <memory>
#include <variant>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

// Decoded inbound envelope; std::monostate marks a message that matched no envelope shape.
using InboundMessage = std::variant<std::monostate, JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a message by its top-level keys only; nested params/result members never count.
    virtual MessageKind classify(const JSONValue& message) const = 0;

    // Classify and decode into the matching envelope type.
    virtual InboundMessage decode(const JSONValue& message) const = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcpengine
