//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: MCP server interface - COM-style abstraction for the responder role
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpengine/Channel.h"
#include "mcpengine/EventRecorder.h"
#include "mcpengine/Protocol.h"
#include "mcpengine/ProtocolEngine.h"

namespace mcpengine {

// Forward declarations
class IServer;
class IServerFactory;

// Handlers are asynchronous by contract; wrap synchronous code with async::makeReadyFuture.
using ToolHandler = std::function<std::future<ToolCallResult>(const JSONValue::Object& arguments)>;
using PromptHandler = std::function<std::future<PromptRenderResult>(const JSONValue::Object& arguments)>;
using RootsChangedCallback = std::function<void(const std::vector<RootDescriptor>& roots)>;

//==========================================================================================================
// MCP Server interface
// Purpose: Responder side of the protocol. Owns the tool, resource, template and prompt registries, the
//          resource subscriber set and the client-log threshold, and issues delegation requests (sampling,
//          elicitation, roots) back toward the connected client.
//==========================================================================================================
class IServer {
public:
    virtual ~IServer() = default;

    /////////////////////////////////////////// Connection management //////////////////////////////////////////
    //==========================================================================================================
    // Starts serving on the provided channel.
    // Args:
    //   channel: Connected duplex channel; the server answers initialize and all registry requests on it.
    // Returns:
    //   (none). Throws std::logic_error when already started.
    //==========================================================================================================
    virtual void Start(std::shared_ptr<IChannel> channel) = 0;

    //==========================================================================================================
    // Sends a best-effort shutdown notification, closes the channel and fails pending delegation requests.
    //==========================================================================================================
    virtual void Stop() = 0;

    virtual bool IsRunning() const = 0;
    virtual EngineState GetState() const = 0;

    ////////////////////////////////////////// Negotiation //////////////////////////////////////////
    // Capabilities and instructions answered to initialize. Set them before Start().
    virtual void SetCapabilities(const ServerCapabilities& capabilities) = 0;
    virtual ServerCapabilities GetCapabilities() const = 0;
    virtual void SetInstructions(std::optional<std::string> instructions) = 0;
    virtual ServerInfo GetServerInfo() const = 0;

    //==========================================================================================================
    // Outcome of the negotiation, available once notifications/initialized has been received.
    // Returns:
    //   The HandshakeResult, or std::nullopt before the confirmation arrived.
    //==========================================================================================================
    virtual std::optional<HandshakeResult> GetHandshakeResult() const = 0;

    // Client capabilities and info recorded while answering initialize.
    virtual std::optional<ClientCapabilities> GetClientCapabilities() const = 0;
    virtual std::optional<ClientInfo> GetClientInfo() const = 0;

    ////////////////////////////////////////////// Tools /////////////////////////////////////////////
    //==========================================================================================================
    // Registers a tool. A tool with the same name is replaced in place, keeping its list position.
    // Args:
    //   definition: Name, description and input schema advertised by tools/list.
    //   handler: Invoked by tools/call with the arguments object. Failures are reported to the caller as a
    //            ToolCallResult with isError set.
    //==========================================================================================================
    virtual void RegisterTool(const ToolDefinition& definition, ToolHandler handler) = 0;

    // Returns false when no tool had that name.
    virtual bool UnregisterTool(const std::string& name) = 0;

    // Registration order.
    virtual std::vector<ToolDefinition> ListTools() const = 0;

    ////////////////////////////////////////////// Resources /////////////////////////////////////////////
    //==========================================================================================================
    // Registers a resource with its readable content. Replaces an existing resource with the same URI.
    // Args:
    //   descriptor: Entry advertised by resources/list.
    //   content: Payload returned by resources/read.
    //==========================================================================================================
    virtual void RegisterResource(const ResourceDescriptor& descriptor, const ResourceContent& content) = 0;

    //==========================================================================================================
    // Replaces the stored content of a registered resource; subsequent reads observe the new content.
    // Returns:
    //   false when the URI is not registered.
    //==========================================================================================================
    virtual bool UpdateResourceContent(const std::string& uri, const ResourceContent& content) = 0;

    virtual bool UnregisterResource(const std::string& uri) = 0;
    virtual std::vector<ResourceDescriptor> ListResources() const = 0;

    virtual void RegisterResourceTemplate(const ResourceTemplate& resourceTemplate) = 0;
    virtual std::vector<ResourceTemplate> ListResourceTemplates() const = 0;

    // True once the client subscribed to the URI and has not unsubscribed since.
    virtual bool IsSubscribed(const std::string& uri) const = 0;

    ////////////////////////////////////////////// Prompts /////////////////////////////////////////////
    //==========================================================================================================
    // Registers a prompt. Render failures reach the client as InternalHandlerError.
    //==========================================================================================================
    virtual void RegisterPrompt(const PromptDefinition& definition, PromptHandler handler) = 0;
    virtual bool UnregisterPrompt(const std::string& name) = 0;
    virtual std::vector<PromptDefinition> ListPrompts() const = 0;

    ////////////////////////////////////////// Notifications //////////////////////////////////////////
    //==========================================================================================================
    // Emits notifications/resources/updated when the client subscribed to the URI.
    // Args:
    //   uri: Updated resource.
    //   title: Optional human-readable title carried with the notification.
    // Returns:
    //   Future resolving to true when a notification was sent; false when there is no subscriber or the
    //   channel is closed.
    //==========================================================================================================
    virtual std::future<bool> NotifyResourceUpdated(const std::string& uri,
                                                    std::optional<std::string> title = std::nullopt) = 0;

    // Unconditional list_changed broadcasts. A closed channel is logged, not raised.
    virtual std::future<void> NotifyResourcesListChanged() = 0;
    virtual std::future<void> NotifyToolsListChanged() = 0;
    virtual std::future<void> NotifyPromptsListChanged() = 0;

    ////////////////////////////////////////// Client logging //////////////////////////////////////////
    //==========================================================================================================
    // Emits notifications/message when `level` is at or above the threshold set by logging/setLevel.
    // Args:
    //   level: Severity of the message.
    //   message: Text of the message.
    //   data: Optional structured details; sent as { message, details }.
    //   logger: Optional logger name.
    // Returns:
    //   Future resolving to true when the notification was sent.
    //==========================================================================================================
    virtual std::future<bool> LogToClient(LoggingLevel level,
                                          const std::string& message,
                                          const std::optional<JSONValue>& data = std::nullopt,
                                          const std::optional<std::string>& logger = std::nullopt) = 0;

    // Current threshold; info until the client sets one.
    virtual LoggingLevel GetLogLevel() const = 0;

    ////////////////////////////////////////// Delegation //////////////////////////////////////////
    //==========================================================================================================
    // Asks the client to generate a message (sampling/createMessage).
    // Returns:
    //   Future resolving to the client's response. Fails with errors::RemoteError when the client has no
    //   generation provider, or TransportClosed when the connection ends first.
    //==========================================================================================================
    virtual std::future<GenerationResponse> RequestCreateMessage(const GenerationRequest& request) = 0;

    //==========================================================================================================
    // As RequestCreateMessage but never fails: any error yields an assistant response with text
    // "[sampling unavailable] <reason>" and stopReason "error".
    //==========================================================================================================
    virtual std::future<GenerationResponse> RequestCreateMessageOrFallback(const GenerationRequest& request) = 0;

    virtual std::future<ElicitationResponse> RequestElicitation(const ElicitationRequest& request) = 0;

    //==========================================================================================================
    // Elicits values and folds them into a working context.
    // Args:
    //   request: Message and optional requested schema.
    //   defaults: Values used for every field the client does not provide.
    // Returns:
    //   Future resolving to the defaults overlaid with the accepted fields. Decline and cancel resolve to
    //   the defaults unchanged; they are not errors.
    //==========================================================================================================
    virtual std::future<std::unordered_map<std::string, JSONValue>> ElicitWithDefaults(
        const ElicitationRequest& request,
        std::unordered_map<std::string, JSONValue> defaults) = 0;

    // roots/list; the returned set also replaces GetKnownRoots().
    virtual std::future<std::vector<RootDescriptor>> RequestRoots() = 0;
    virtual std::vector<RootDescriptor> GetKnownRoots() const = 0;

    // Invoked after notifications/roots/list_changed triggered a successful re-fetch.
    virtual void SetRootsChangedCallback(RootsChangedCallback callback) = 0;

    ////////////////////////////////////////// Raw messaging //////////////////////////////////////////
    virtual std::future<JSONValue> SendRequest(const std::string& method,
                                               std::optional<JSONValue> params = std::nullopt) = 0;
    virtual void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt) = 0;
};

// Standard MCP Server implementation
class Server : public IServer {
public:
    //==========================================================================================================
    // Constructs a server.
    // Args:
    //   serverInfo: Name and version answered to initialize.
    //   recorder: Optional observer offered every message the server sends or receives.
    //==========================================================================================================
    explicit Server(const ServerInfo& serverInfo, std::shared_ptr<IEventRecorder> recorder = nullptr);
    ~Server() override;

    // IServer implementation
    void Start(std::shared_ptr<IChannel> channel) override;
    void Stop() override;
    bool IsRunning() const override;
    EngineState GetState() const override;

    void SetCapabilities(const ServerCapabilities& capabilities) override;
    ServerCapabilities GetCapabilities() const override;
    void SetInstructions(std::optional<std::string> instructions) override;
    ServerInfo GetServerInfo() const override;
    std::optional<HandshakeResult> GetHandshakeResult() const override;
    std::optional<ClientCapabilities> GetClientCapabilities() const override;
    std::optional<ClientInfo> GetClientInfo() const override;

    // Tools
    void RegisterTool(const ToolDefinition& definition, ToolHandler handler) override;
    bool UnregisterTool(const std::string& name) override;
    std::vector<ToolDefinition> ListTools() const override;

    // Resources
    void RegisterResource(const ResourceDescriptor& descriptor, const ResourceContent& content) override;
    bool UpdateResourceContent(const std::string& uri, const ResourceContent& content) override;
    bool UnregisterResource(const std::string& uri) override;
    std::vector<ResourceDescriptor> ListResources() const override;
    void RegisterResourceTemplate(const ResourceTemplate& resourceTemplate) override;
    std::vector<ResourceTemplate> ListResourceTemplates() const override;
    bool IsSubscribed(const std::string& uri) const override;

    // Prompts
    void RegisterPrompt(const PromptDefinition& definition, PromptHandler handler) override;
    bool UnregisterPrompt(const std::string& name) override;
    std::vector<PromptDefinition> ListPrompts() const override;

    // Notifications
    std::future<bool> NotifyResourceUpdated(const std::string& uri,
                                            std::optional<std::string> title = std::nullopt) override;
    std::future<void> NotifyResourcesListChanged() override;
    std::future<void> NotifyToolsListChanged() override;
    std::future<void> NotifyPromptsListChanged() override;

    // Client logging
    std::future<bool> LogToClient(LoggingLevel level,
                                  const std::string& message,
                                  const std::optional<JSONValue>& data = std::nullopt,
                                  const std::optional<std::string>& logger = std::nullopt) override;
    LoggingLevel GetLogLevel() const override;

    // Delegation
    std::future<GenerationResponse> RequestCreateMessage(const GenerationRequest& request) override;
    std::future<GenerationResponse> RequestCreateMessageOrFallback(const GenerationRequest& request) override;
    std::future<ElicitationResponse> RequestElicitation(const ElicitationRequest& request) override;
    std::future<std::unordered_map<std::string, JSONValue>> ElicitWithDefaults(
        const ElicitationRequest& request,
        std::unordered_map<std::string, JSONValue> defaults) override;
    std::future<std::vector<RootDescriptor>> RequestRoots() override;
    std::vector<RootDescriptor> GetKnownRoots() const override;
    void SetRootsChangedCallback(RootsChangedCallback callback) override;

    // Raw messaging
    std::future<JSONValue> SendRequest(const std::string& method,
                                       std::optional<JSONValue> params = std::nullopt) override;
    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Server factory interface
class IServerFactory {
public:
    virtual ~IServerFactory() = default;

    //==========================================================================================================
    // Creates a new server instance.
    // Args:
    //   serverInfo: Implementation information (name and version).
    // Returns:
    //   A unique_ptr to an IServer implementation.
    //==========================================================================================================
    virtual std::unique_ptr<IServer> CreateServer(const ServerInfo& serverInfo) = 0;
};

// Standard server factory; every server it creates shares the factory's recorder.
class ServerFactory : public IServerFactory {
public:
    explicit ServerFactory(std::shared_ptr<IEventRecorder> recorder = nullptr);
    std::unique_ptr<IServer> CreateServer(const ServerInfo& serverInfo) override;

private:
    std::shared_ptr<IEventRecorder> recorder;
};

} // namespace mcpengine
