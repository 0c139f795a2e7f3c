//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: MCP client interface - COM-style abstraction for the initiator role
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpengine/Channel.h"
#include "mcpengine/ClientHandlers.h"
#include "mcpengine/EventRecorder.h"
#include "mcpengine/Protocol.h"
#include "mcpengine/ProtocolEngine.h"
#include "mcpengine/sampling/SamplingProvider.h"

namespace mcpengine {

// Forward declarations
class IClient;
class IClientFactory;

// Observer for server notifications; receives the notification params.
using NotificationCallback = std::function<void(const JSONValue& params)>;

//==========================================================================================================
// MCP Client interface
// Purpose: Initiator side of the protocol. Negotiates with the server, wraps the server's request methods in
//          typed calls and answers the server's delegation requests through pluggable collaborators.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    /////////////////////////////////////////// Connection management //////////////////////////////////////////
    //==========================================================================================================
    // Attaches the channel and starts receiving. Does not send anything.
    // Args:
    //   channel: Connected duplex channel.
    //==========================================================================================================
    virtual void Connect(std::shared_ptr<IChannel> channel) = 0;

    //==========================================================================================================
    // Performs the initialize exchange and sends notifications/initialized.
    // Args:
    //   clientInfo: Name and version announced to the server.
    //   capabilities: Capabilities the client declares.
    //   protocolVersion: Version requested; the server must answer with the same string.
    // Returns:
    //   Future resolving to the HandshakeResult once the engine is Ready. Fails with McpException
    //   InvalidRequest when a negotiation already ran, UnsupportedProtocolVersion on a version mismatch,
    //   errors::RemoteError when the server rejects the request, or TransportClosed. After a failure the
    //   engine is back in Unconnected unless the channel closed.
    //==========================================================================================================
    virtual std::future<HandshakeResult> Initialize(const ClientInfo& clientInfo,
                                                    const ClientCapabilities& capabilities,
                                                    const std::string& protocolVersion = PROTOCOL_VERSION) = 0;

    // Best-effort shutdown notification, then the channel is released. Idempotent.
    virtual void Close() = 0;

    virtual bool IsConnected() const = 0;
    virtual EngineState GetState() const = 0;
    virtual std::optional<HandshakeResult> GetHandshakeResult() const = 0;

    ////////////////////////////////////////////// Tools /////////////////////////////////////////////
    virtual std::future<std::vector<ToolDefinition>> ListTools() = 0;

    //==========================================================================================================
    // Invokes a tool.
    // Args:
    //   name: Registered tool name.
    //   arguments: Arguments object passed to the tool handler.
    // Returns:
    //   Future resolving to the tool result; a failed tool execution resolves with isError set. Fails with
    //   errors::RemoteError(UnknownTool) for an unknown name.
    //==========================================================================================================
    virtual std::future<ToolCallResult> CallTool(const std::string& name, const JSONValue::Object& arguments) = 0;

    ////////////////////////////////////////////// Resources /////////////////////////////////////////////
    virtual std::future<std::vector<ResourceDescriptor>> ListResources() = 0;
    virtual std::future<std::vector<ResourceContent>> ReadResource(const std::string& uri) = 0;

    // Opt in/out of notifications/resources/updated for one URI.
    virtual std::future<void> SubscribeResource(const std::string& uri) = 0;
    virtual std::future<void> UnsubscribeResource(const std::string& uri) = 0;

    virtual std::future<std::vector<ResourceTemplate>> ListResourceTemplates() = 0;

    ////////////////////////////////////////////// Prompts /////////////////////////////////////////////
    virtual std::future<std::vector<PromptDefinition>> ListPrompts() = 0;
    virtual std::future<PromptRenderResult> GetPrompt(const std::string& name,
                                                      const JSONValue::Object& arguments) = 0;

    ////////////////////////////////////////////// Utility /////////////////////////////////////////////
    // logging/setLevel; the server only forwards log messages at or above `level`.
    virtual std::future<void> SetLoggingLevel(LoggingLevel level) = 0;
    virtual std::future<void> Ping() = 0;

    virtual std::future<JSONValue> SendRequest(const std::string& method,
                                               std::optional<JSONValue> params = std::nullopt) = 0;
    virtual void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt) = 0;

    ////////////////////////////////////////// Delegation targets //////////////////////////////////////////
    //==========================================================================================================
    // Provider answering sampling/createMessage. Without one the request fails with MethodNotFound; a
    // provider failure becomes an assistant response with text "[sampling error] <reason>".
    //==========================================================================================================
    virtual void SetSamplingProvider(std::shared_ptr<ISamplingProvider> provider) = 0;

    // Handler answering elicitation/create; MethodNotFound without one.
    virtual void SetElicitationHandler(std::shared_ptr<IElicitationHandler> handler) = 0;

    // Handler answering roots/list; MethodNotFound without one.
    virtual void SetRootsHandler(std::shared_ptr<IRootsHandler> handler) = 0;

    // Announces notifications/roots/list_changed; the server then re-fetches roots/list.
    virtual void NotifyRootsListChanged() = 0;

    //==========================================================================================================
    // Observes a server notification (resources/updated, list_changed, notifications/message, ...).
    // Args:
    //   method: Notification method name.
    //   callback: Invoked on the engine loop with the notification params. Replaces an earlier callback.
    //==========================================================================================================
    virtual void SetNotificationHandler(const std::string& method, NotificationCallback callback) = 0;
};

// Standard MCP Client implementation
class Client : public IClient {
public:
    //==========================================================================================================
    // Constructs a client.
    // Args:
    //   clientInfo: Default name and version (Initialize may override them).
    //   recorder: Optional observer offered every message the client sends or receives.
    //==========================================================================================================
    explicit Client(const ClientInfo& clientInfo, std::shared_ptr<IEventRecorder> recorder = nullptr);
    ~Client() override;

    // IClient implementation
    void Connect(std::shared_ptr<IChannel> channel) override;
    std::future<HandshakeResult> Initialize(const ClientInfo& clientInfo,
                                            const ClientCapabilities& capabilities,
                                            const std::string& protocolVersion = PROTOCOL_VERSION) override;
    void Close() override;
    bool IsConnected() const override;
    EngineState GetState() const override;
    std::optional<HandshakeResult> GetHandshakeResult() const override;

    std::future<std::vector<ToolDefinition>> ListTools() override;
    std::future<ToolCallResult> CallTool(const std::string& name, const JSONValue::Object& arguments) override;

    std::future<std::vector<ResourceDescriptor>> ListResources() override;
    std::future<std::vector<ResourceContent>> ReadResource(const std::string& uri) override;
    std::future<void> SubscribeResource(const std::string& uri) override;
    std::future<void> UnsubscribeResource(const std::string& uri) override;
    std::future<std::vector<ResourceTemplate>> ListResourceTemplates() override;

    std::future<std::vector<PromptDefinition>> ListPrompts() override;
    std::future<PromptRenderResult> GetPrompt(const std::string& name, const JSONValue::Object& arguments) override;

    std::future<void> SetLoggingLevel(LoggingLevel level) override;
    std::future<void> Ping() override;
    std::future<JSONValue> SendRequest(const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt) override;
    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;

    void SetSamplingProvider(std::shared_ptr<ISamplingProvider> provider) override;
    void SetElicitationHandler(std::shared_ptr<IElicitationHandler> handler) override;
    void SetRootsHandler(std::shared_ptr<IRootsHandler> handler) override;
    void NotifyRootsListChanged() override;
    void SetNotificationHandler(const std::string& method, NotificationCallback callback) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Client factory interface
class IClientFactory {
public:
    virtual ~IClientFactory() = default;

    //==========================================================================================================
    // Creates a new client instance.
    // Args:
    //   clientInfo: Implementation information (name and version).
    // Returns:
    //   A unique_ptr to an IClient implementation.
    //==========================================================================================================
    virtual std::unique_ptr<IClient> CreateClient(const ClientInfo& clientInfo) = 0;
};

// Standard client factory
class ClientFactory : public IClientFactory {
public:
    explicit ClientFactory(std::shared_ptr<IEventRecorder> recorder = nullptr);
    std::unique_ptr<IClient> CreateClient(const ClientInfo& clientInfo) override;

private:
    std::shared_ptr<IEventRecorder> recorder;
};

} // namespace mcpengine
