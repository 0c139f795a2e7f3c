//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message classification
//========================================================================================================

#include "logging/Logger.h"
#include "mcpengine/JsonRpcMessageRouter.h"

namespace mcpengine {

namespace {
class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& message) const override {
        if (!message.isObject()) {
            return MessageKind::Unknown;
        }
        const bool hasId = message.find("id") != nullptr;
        const JSONValue* method = message.find("method");
        if (method != nullptr && method->isString()) {
            return hasId ? MessageKind::Request : MessageKind::Notification;
        }
        // A reply without result or error is still a response so its waiter can be failed.
        if (hasId && method == nullptr) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    InboundMessage decode(const JSONValue& message) const override {
        switch (classify(message)) {
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (request.FromJSON(message)) return request;
                break;
            }
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromJSON(message)) return response;
                break;
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.FromJSON(message)) return notification;
                break;
            }
            case MessageKind::Unknown:
                break;
        }
        LOG_WARN("Router: unrecognized JSON-RPC message: {}", SerializeJSON(message));
        return std::monostate{};
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcpengine
