//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpengine/JSONRPCTypes.h"
#include "mcpengine/errors/Errors.h"

namespace mcpengine {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names. Every type converts to and from
//          its wire form with ToJSON()/FromJSON(); absent optional fields are omitted, never null.
//          FromJSON throws errors::McpException(InvalidParams) on a missing or mistyped required field.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Subscribe = "resources/subscribe";
    constexpr const char* Unsubscribe = "resources/unsubscribe";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* SetLogLevel = "logging/setLevel";

    // Server to client
    constexpr const char* CreateMessage = "sampling/createMessage";
    constexpr const char* Elicit = "elicitation/create";
    constexpr const char* ListRoots = "roots/list";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Shutdown = "notifications/shutdown";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
    constexpr const char* RootsListChanged = "notifications/roots/list_changed";
}

///////////////////////////////////////// Logging levels ///////////////////////////////////////////
// Fixed total order used for log filtering; never compare level names lexically.
enum class LoggingLevel {
    Debug = 0,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

// Case-insensitive; std::nullopt for names outside the fixed set.
std::optional<LoggingLevel> LoggingLevelFromString(const std::string& name);
std::string ToString(LoggingLevel level);

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Capability blocks. Presence of a block is the declaration; flags are only written when true.
struct ToolsCapability {
    bool listChanged = false;
    bool operator==(const ToolsCapability&) const = default;
    JSONValue ToJSON() const;
    static ToolsCapability FromJSON(const JSONValue& value);
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
    bool operator==(const ResourcesCapability&) const = default;
    JSONValue ToJSON() const;
    static ResourcesCapability FromJSON(const JSONValue& value);
};

struct PromptsCapability {
    bool listChanged = false;
    bool operator==(const PromptsCapability&) const = default;
    JSONValue ToJSON() const;
    static PromptsCapability FromJSON(const JSONValue& value);
};

struct RootsCapability {
    bool listChanged = false;
    bool operator==(const RootsCapability&) const = default;
    JSONValue ToJSON() const;
    static RootsCapability FromJSON(const JSONValue& value);
};

struct LoggingCapability {
    // Presence indicates notifications/message is supported
    bool operator==(const LoggingCapability&) const = default;
};

struct CompletionsCapability {
    bool operator==(const CompletionsCapability&) const = default;
};

struct SamplingCapability {
    bool operator==(const SamplingCapability&) const = default;
};

struct ElicitationCapability {
    bool operator==(const ElicitationCapability&) const = default;
};

struct ServerCapabilities {
    std::optional<LoggingCapability> logging;
    std::optional<PromptsCapability> prompts;
    std::optional<ResourcesCapability> resources;
    std::optional<ToolsCapability> tools;
    std::optional<CompletionsCapability> completions;
    std::unordered_map<std::string, JSONValue> experimental;

    bool operator==(const ServerCapabilities&) const = default;
    JSONValue ToJSON() const;
    static ServerCapabilities FromJSON(const JSONValue& value);
};

struct ClientCapabilities {
    std::optional<SamplingCapability> sampling;
    std::optional<RootsCapability> roots;
    std::optional<ElicitationCapability> elicitation;
    std::unordered_map<std::string, JSONValue> experimental;

    bool operator==(const ClientCapabilities&) const = default;
    JSONValue ToJSON() const;
    static ClientCapabilities FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Peer info ///////////////////////////////////////////
struct PeerInfo {
    std::string name;
    std::string version;
    std::optional<std::string> title;
    std::unordered_map<std::string, JSONValue> metadata;

    PeerInfo() = default;
    PeerInfo(std::string name, std::string version, std::optional<std::string> title = std::nullopt)
        : name(std::move(name)), version(std::move(version)), title(std::move(title)) {}

    bool operator==(const PeerInfo&) const = default;
    JSONValue ToJSON() const;
    static PeerInfo FromJSON(const JSONValue& value);
};

using ClientInfo = PeerInfo;
using ServerInfo = PeerInfo;

///////////////////////////////////////// Handshake ///////////////////////////////////////////
struct InitializeParams {
    std::string protocolVersion;
    ClientCapabilities capabilities;
    ClientInfo clientInfo;

    JSONValue ToJSON() const;
    static InitializeParams FromJSON(const JSONValue& value);
};

struct InitializeResult {
    std::string protocolVersion;
    ServerCapabilities capabilities;
    ServerInfo serverInfo;
    std::optional<std::string> instructions;

    JSONValue ToJSON() const;
    static InitializeResult FromJSON(const JSONValue& value);
};

//==========================================================================================================
// HandshakeResult
// Purpose: Outcome of one completed negotiation. Built once per successful initialize exchange, only after
//          the initialized confirmation has been sent (client) or received (server).
//==========================================================================================================
struct HandshakeResult {
    std::string protocolVersion;
    int64_t requestId{0};
    ClientCapabilities clientCapabilities;
    ServerCapabilities serverCapabilities;
    ClientInfo clientInfo;
    ServerInfo serverInfo;
    std::optional<std::string> instructions;

    bool operator==(const HandshakeResult&) const = default;
    JSONValue ToJSON() const;
};

///////////////////////////////////////// Content ///////////////////////////////////////////
struct ContentBlock {
    std::string type{"text"};
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mimeType;

    static ContentBlock Text(std::string text);

    bool operator==(const ContentBlock&) const = default;
    JSONValue ToJSON() const;
    static ContentBlock FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct ToolDefinition {
    std::string name;
    std::string description;
    std::optional<std::string> title;
    JSONValue inputSchema;  // JSON Schema for tool arguments; omitted while null

    bool operator==(const ToolDefinition&) const = default;
    JSONValue ToJSON() const;
    static ToolDefinition FromJSON(const JSONValue& value);
};

struct CallToolParams {
    std::string name;
    JSONValue::Object arguments;

    JSONValue ToJSON() const;
    // Missing arguments decode as empty; non-object arguments are InvalidParams.
    static CallToolParams FromJSON(const JSONValue& value);
};

struct ToolCallResult {
    std::vector<ContentBlock> content;
    bool isError = false;

    bool operator==(const ToolCallResult&) const = default;
    JSONValue ToJSON() const;
    static ToolCallResult FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
    std::optional<int64_t> size;
    std::optional<JSONValue> annotations;

    bool operator==(const ResourceDescriptor&) const = default;
    JSONValue ToJSON() const;
    static ResourceDescriptor FromJSON(const JSONValue& value);
};

// Readable payload of a resource; mutable so updates are visible to subsequent reads.
struct ResourceContent {
    std::string uri;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;
    std::optional<JSONValue> annotations;

    bool operator==(const ResourceContent&) const = default;
    JSONValue ToJSON() const;
    static ResourceContent FromJSON(const JSONValue& value);
};

struct ResourceTemplate {
    std::string uriTemplate;
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
    std::optional<JSONValue> annotations;

    bool operator==(const ResourceTemplate&) const = default;
    JSONValue ToJSON() const;
    static ResourceTemplate FromJSON(const JSONValue& value);
};

// Params of resources/read, resources/subscribe and resources/unsubscribe
struct ResourceUriParams {
    std::string uri;

    JSONValue ToJSON() const;
    static ResourceUriParams FromJSON(const JSONValue& value);
};

struct ResourceUpdatedParams {
    std::string uri;
    std::optional<std::string> title;

    JSONValue ToJSON() const;
    static ResourceUpdatedParams FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
    std::optional<std::string> type;

    bool operator==(const PromptArgument&) const = default;
    JSONValue ToJSON() const;
    static PromptArgument FromJSON(const JSONValue& value);
};

struct PromptDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    bool operator==(const PromptDefinition&) const = default;
    JSONValue ToJSON() const;
    static PromptDefinition FromJSON(const JSONValue& value);
};

struct GetPromptParams {
    std::string name;
    JSONValue::Object arguments;

    JSONValue ToJSON() const;
    static GetPromptParams FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Sampling ///////////////////////////////////////////
struct SamplingMessage {
    std::string role;
    ContentBlock content;

    static SamplingMessage Text(std::string role, std::string text);

    bool operator==(const SamplingMessage&) const = default;
    JSONValue ToJSON() const;
    static SamplingMessage FromJSON(const JSONValue& value);
};

struct PromptRenderResult {
    std::optional<std::string> description;
    std::vector<SamplingMessage> messages;

    bool operator==(const PromptRenderResult&) const = default;
    JSONValue ToJSON() const;
    static PromptRenderResult FromJSON(const JSONValue& value);
};

// Params of sampling/createMessage
struct GenerationRequest {
    std::vector<SamplingMessage> messages;
    std::optional<JSONValue> modelPreferences;
    std::optional<std::string> systemPrompt;
    std::optional<int64_t> maxTokens;

    bool operator==(const GenerationRequest&) const = default;
    JSONValue ToJSON() const;
    static GenerationRequest FromJSON(const JSONValue& value);
};

struct GenerationResponse {
    std::string role{"assistant"};
    ContentBlock content;
    std::optional<std::string> model;
    std::optional<std::string> stopReason;

    bool operator==(const GenerationResponse&) const = default;
    JSONValue ToJSON() const;
    static GenerationResponse FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Elicitation ///////////////////////////////////////////
enum class ElicitationAction {
    Accept,
    Decline,
    Cancel
};

std::optional<ElicitationAction> ElicitationActionFromString(const std::string& name);
std::string ToString(ElicitationAction action);

struct ElicitationRequest {
    std::string message;
    std::optional<JSONValue> requestedSchema;

    bool operator==(const ElicitationRequest&) const = default;
    JSONValue ToJSON() const;
    static ElicitationRequest FromJSON(const JSONValue& value);
};

struct ElicitationResponse {
    ElicitationAction action{ElicitationAction::Cancel};
    std::unordered_map<std::string, JSONValue> content;  // only meaningful on Accept

    bool operator==(const ElicitationResponse&) const = default;
    JSONValue ToJSON() const;
    static ElicitationResponse FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Roots ///////////////////////////////////////////
struct RootDescriptor {
    std::string uri;
    std::optional<std::string> name;

    bool operator==(const RootDescriptor&) const = default;
    JSONValue ToJSON() const;
    static RootDescriptor FromJSON(const JSONValue& value);
};

///////////////////////////////////////// Log messages ///////////////////////////////////////////
// Params of notifications/message. `data` is the message text, or { message, details } when the
// emitter attached structured details.
struct LogMessage {
    LoggingLevel level{LoggingLevel::Info};
    std::optional<std::string> logger;
    JSONValue data;

    JSONValue ToJSON() const;
    static LogMessage FromJSON(const JSONValue& value);
};

///////////////////////////////////////// List helpers ///////////////////////////////////////////
//==========================================================================================================
// ListToJSON / ListFromJSON
// Purpose: Convert a list result such as { "tools": [...] } to and from typed vectors.
// Args:
//   key: Member name carrying the array.
// Returns:
//   ListToJSON: the wrapping object. ListFromJSON: decoded items in wire order; throws InvalidParams
//   when the member is missing or not an array.
//==========================================================================================================
template <typename T>
JSONValue ListToJSON(const std::string& key, const std::vector<T>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item.ToJSON()));
    }
    JSONValue::Object obj;
    obj[key] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue{std::move(obj)};
}

template <typename T>
std::vector<T> ListFromJSON(const JSONValue& value, const std::string& key) {
    const JSONValue* member = value.find(key);
    if (member == nullptr || !member->isArray()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "Expected array member '" + key + "'");
    }
    std::vector<T> items;
    for (const auto& element : std::get<JSONValue::Array>(member->value)) {
        if (!element) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "Null element in '" + key + "'");
        }
        items.push_back(T::FromJSON(*element));
    }
    return items;
}

} // namespace mcpengine
