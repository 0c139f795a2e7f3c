//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolEngine.h
// Purpose: Symmetric JSON-RPC engine shared by the client and server roles
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "mcpengine/Channel.h"
#include "mcpengine/EventRecorder.h"
#include "mcpengine/JSONRPCTypes.h"
#include "mcpengine/errors/Errors.h"

namespace mcpengine {

// Connection state machine. Closed is terminal.
enum class EngineState {
    Unconnected,
    Negotiating,
    Ready,
    Closed
};

std::string ToString(EngineState state);

//==========================================================================================================
// HandlerResult
// Purpose: Explicit outcome of a request handler: exactly one of result or error is set.
//==========================================================================================================
struct HandlerResult {
    std::optional<JSONValue> result;
    std::optional<errors::McpError> error;

    static HandlerResult Ok(JSONValue value);
    static HandlerResult Fail(errors::McpError err);
    static HandlerResult Fail(int code, std::string message, std::optional<JSONValue> data = std::nullopt);

    bool IsError() const { return error.has_value(); }
};

// Identity of the inbound request being served.
struct RequestContext {
    JSONRPCId id;
    std::string method;
};

// Handlers are asynchronous by contract. They are invoked on the engine loop and must not block on
// engine traffic; adapt synchronous code with async::makeReadyFuture.
using RequestHandler = std::function<std::future<HandlerResult>(const JSONValue& params, const RequestContext& context)>;
using NotificationHandler = std::function<std::future<void>(const JSONValue& params)>;

// A sent request together with the id the engine allocated for it.
struct OutboundRequest {
    int64_t id{0};
    std::future<JSONValue> response;
};

//==========================================================================================================
// ProtocolEngine
// Purpose: Owns one channel, allocates request ids, correlates responses with pending requests and
//          dispatches inbound requests and notifications to registered handlers.
// Notes:
//   - A Boost.Asio io_context driven by one thread serializes all engine state; a reader thread blocks
//     on IChannel::Receive() and posts each message onto it.
//   - Failed handlers are converted into error responses; they never stop the loop.
//   - Destroying the engine closes it.
//==========================================================================================================
class ProtocolEngine {
public:
    //==========================================================================================================
    // Args:
    //   role: Label used for logging and event recording ("client" or "server").
    //   recorder: Optional observer offered every inbound and outbound message.
    //==========================================================================================================
    explicit ProtocolEngine(std::string role, std::shared_ptr<IEventRecorder> recorder = nullptr);
    ~ProtocolEngine();

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    ////////////////////////////////////////// Lifecycle //////////////////////////////////////////
    //==========================================================================================================
    // Attaches the channel and starts receiving. May be called once.
    // Args:
    //   channel: Connected duplex channel.
    // Returns:
    //   (none). Throws std::logic_error when already started or closed.
    //==========================================================================================================
    void Start(std::shared_ptr<IChannel> channel);

    //==========================================================================================================
    // Sends a best-effort notifications/shutdown, releases the channel, fails every pending request with
    // TransportClosed and stops the loop. Idempotent.
    //==========================================================================================================
    void Close();

    // True once started and until closed.
    bool IsConnected() const;

    EngineState GetState() const;

    // Moves to `next` unless the engine is Closed.
    void TransitionTo(EngineState next);

    // Atomically moves from `expected` to `next`; false when the current state differs.
    bool TryTransition(EngineState expected, EngineState next);

    const std::string& GetRole() const;
    std::string GetSessionId() const;

    ////////////////////////////////////////// Outbound traffic //////////////////////////////////////////
    //==========================================================================================================
    // Sends a request and returns a future for its result.
    // Args:
    //   method: JSON-RPC method name.
    //   params: Optional params value.
    // Returns:
    //   Future resolving to the response's result. Fails with errors::RemoteError when the peer answered
    //   with an error, or TransportClosed when the connection ends first.
    //==========================================================================================================
    std::future<JSONValue> SendRequest(const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt);

    // As SendRequest, also exposing the allocated id.
    OutboundRequest SendTrackedRequest(const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // Fire-and-forget notification.
    // Returns:
    //   (none). Throws TransportClosed when the engine is not connected.
    //==========================================================================================================
    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    ////////////////////////////////////////// Handlers //////////////////////////////////////////
    // Replaces any handler previously registered for the method.
    void RegisterRequestHandler(const std::string& method, RequestHandler handler);
    void RegisterNotificationHandler(const std::string& method, NotificationHandler handler);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpengine
