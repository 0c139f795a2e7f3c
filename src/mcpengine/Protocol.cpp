//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Wire conversions for MCP protocol data structures
//==========================================================================================================

#include <algorithm>
#include <array>
#include <cctype>

#include "mcpengine/Protocol.h"

namespace mcpengine {

namespace {

using errors::McpException;

[[noreturn]] void invalid(const std::string& message) {
    throw McpException(JSONRPCErrorCodes::InvalidParams, message);
}

const JSONValue::Object& expectObject(const JSONValue& value, const char* what) {
    if (!value.isObject()) {
        invalid(std::string(what) + " must be an object");
    }
    return std::get<JSONValue::Object>(value.value);
}

void put(JSONValue::Object& obj, const char* key, JSONValue value) {
    obj[key] = std::make_shared<JSONValue>(std::move(value));
}

void putOptional(JSONValue::Object& obj, const char* key, const std::optional<std::string>& value) {
    if (value.has_value()) {
        put(obj, key, JSONValue{value.value()});
    }
}

void putOptional(JSONValue::Object& obj, const char* key, const std::optional<JSONValue>& value) {
    if (value.has_value()) {
        put(obj, key, value.value());
    }
}

void putMap(JSONValue::Object& obj, const char* key, const std::unordered_map<std::string, JSONValue>& map) {
    if (map.empty()) {
        return;
    }
    JSONValue::Object inner;
    for (const auto& [k, v] : map) {
        inner[k] = std::make_shared<JSONValue>(v);
    }
    put(obj, key, JSONValue{std::move(inner)});
}

// A member explicitly set to null is treated as absent.
const JSONValue* member(const JSONValue& value, const char* key) {
    const JSONValue* found = value.find(key);
    if (found == nullptr || found->isNull()) {
        return nullptr;
    }
    return found;
}

std::string requireString(const JSONValue& value, const char* key, const char* what) {
    const JSONValue* found = member(value, key);
    if (found == nullptr) {
        invalid(std::string(what) + " is missing '" + key + "'");
    }
    if (!found->isString()) {
        invalid(std::string(what) + " field '" + key + "' must be a string");
    }
    return std::get<std::string>(found->value);
}

std::optional<std::string> optionalString(const JSONValue& value, const char* key, const char* what) {
    const JSONValue* found = member(value, key);
    if (found == nullptr) {
        return std::nullopt;
    }
    if (!found->isString()) {
        invalid(std::string(what) + " field '" + key + "' must be a string");
    }
    return std::get<std::string>(found->value);
}

bool optionalBool(const JSONValue& value, const char* key, const char* what) {
    const JSONValue* found = member(value, key);
    if (found == nullptr) {
        return false;
    }
    if (!std::holds_alternative<bool>(found->value)) {
        invalid(std::string(what) + " field '" + key + "' must be a boolean");
    }
    return std::get<bool>(found->value);
}

std::optional<int64_t> optionalInt(const JSONValue& value, const char* key, const char* what) {
    const JSONValue* found = member(value, key);
    if (found == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(found->value)) {
        invalid(std::string(what) + " field '" + key + "' must be an integer");
    }
    return std::get<int64_t>(found->value);
}

std::optional<JSONValue> optionalValue(const JSONValue& value, const char* key) {
    const JSONValue* found = member(value, key);
    if (found == nullptr) {
        return std::nullopt;
    }
    return *found;
}

std::unordered_map<std::string, JSONValue> optionalMap(const JSONValue& value, const char* key, const char* what) {
    std::unordered_map<std::string, JSONValue> out;
    const JSONValue* found = member(value, key);
    if (found == nullptr) {
        return out;
    }
    for (const auto& [k, v] : expectObject(*found, what)) {
        out.emplace(k, v ? *v : JSONValue{});
    }
    return out;
}

JSONValue::Object optionalArguments(const JSONValue& value, const char* what) {
    const JSONValue* found = member(value, "arguments");
    if (found == nullptr) {
        return {};
    }
    if (!found->isObject()) {
        invalid(std::string(what) + " arguments must be an object");
    }
    return std::get<JSONValue::Object>(found->value);
}

template <typename T>
JSONValue arrayOf(const std::vector<T>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item.ToJSON()));
    }
    return JSONValue{std::move(arr)};
}

template <typename T>
std::vector<T> optionalArrayOf(const JSONValue& value, const char* key, const char* what) {
    std::vector<T> items;
    const JSONValue* found = member(value, key);
    if (found == nullptr) {
        return items;
    }
    if (!found->isArray()) {
        invalid(std::string(what) + " field '" + key + "' must be an array");
    }
    for (const auto& element : std::get<JSONValue::Array>(found->value)) {
        items.push_back(T::FromJSON(element ? *element : JSONValue{}));
    }
    return items;
}

JSONValue flag(bool present, const char* key) {
    JSONValue::Object obj;
    if (present) {
        put(obj, key, JSONValue{true});
    }
    return JSONValue{std::move(obj)};
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return s;
}

constexpr std::array<const char*, 8> kLevelNames = {
    "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency"
};

} // namespace

///////////////////////////////////////// Logging levels ///////////////////////////////////////////
std::optional<LoggingLevel> LoggingLevelFromString(const std::string& name) {
    const std::string key = lower(name);
    for (size_t i = 0; i < kLevelNames.size(); ++i) {
        if (key == kLevelNames[i]) {
            return static_cast<LoggingLevel>(i);
        }
    }
    return std::nullopt;
}

std::string ToString(LoggingLevel level) {
    const auto index = static_cast<size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : "info";
}

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
JSONValue ToolsCapability::ToJSON() const { return flag(listChanged, "listChanged"); }

ToolsCapability ToolsCapability::FromJSON(const JSONValue& value) {
    expectObject(value, "tools capability");
    ToolsCapability cap;
    cap.listChanged = optionalBool(value, "listChanged", "tools capability");
    return cap;
}

JSONValue ResourcesCapability::ToJSON() const {
    JSONValue::Object obj;
    if (subscribe) {
        put(obj, "subscribe", JSONValue{true});
    }
    if (listChanged) {
        put(obj, "listChanged", JSONValue{true});
    }
    return JSONValue{std::move(obj)};
}

ResourcesCapability ResourcesCapability::FromJSON(const JSONValue& value) {
    expectObject(value, "resources capability");
    ResourcesCapability cap;
    cap.subscribe = optionalBool(value, "subscribe", "resources capability");
    cap.listChanged = optionalBool(value, "listChanged", "resources capability");
    return cap;
}

JSONValue PromptsCapability::ToJSON() const { return flag(listChanged, "listChanged"); }

PromptsCapability PromptsCapability::FromJSON(const JSONValue& value) {
    expectObject(value, "prompts capability");
    PromptsCapability cap;
    cap.listChanged = optionalBool(value, "listChanged", "prompts capability");
    return cap;
}

JSONValue RootsCapability::ToJSON() const { return flag(listChanged, "listChanged"); }

RootsCapability RootsCapability::FromJSON(const JSONValue& value) {
    expectObject(value, "roots capability");
    RootsCapability cap;
    cap.listChanged = optionalBool(value, "listChanged", "roots capability");
    return cap;
}

JSONValue ServerCapabilities::ToJSON() const {
    JSONValue::Object obj;
    if (logging) put(obj, "logging", JSONValue{JSONValue::Object{}});
    if (prompts) put(obj, "prompts", prompts->ToJSON());
    if (resources) put(obj, "resources", resources->ToJSON());
    if (tools) put(obj, "tools", tools->ToJSON());
    if (completions) put(obj, "completions", JSONValue{JSONValue::Object{}});
    putMap(obj, "experimental", experimental);
    return JSONValue{std::move(obj)};
}

ServerCapabilities ServerCapabilities::FromJSON(const JSONValue& value) {
    expectObject(value, "server capabilities");
    ServerCapabilities caps;
    if (member(value, "logging")) caps.logging = LoggingCapability{};
    if (const JSONValue* v = member(value, "prompts")) caps.prompts = PromptsCapability::FromJSON(*v);
    if (const JSONValue* v = member(value, "resources")) caps.resources = ResourcesCapability::FromJSON(*v);
    if (const JSONValue* v = member(value, "tools")) caps.tools = ToolsCapability::FromJSON(*v);
    if (member(value, "completions")) caps.completions = CompletionsCapability{};
    caps.experimental = optionalMap(value, "experimental", "experimental capabilities");
    return caps;
}

JSONValue ClientCapabilities::ToJSON() const {
    JSONValue::Object obj;
    if (sampling) put(obj, "sampling", JSONValue{JSONValue::Object{}});
    if (roots) put(obj, "roots", roots->ToJSON());
    if (elicitation) put(obj, "elicitation", JSONValue{JSONValue::Object{}});
    putMap(obj, "experimental", experimental);
    return JSONValue{std::move(obj)};
}

ClientCapabilities ClientCapabilities::FromJSON(const JSONValue& value) {
    expectObject(value, "client capabilities");
    ClientCapabilities caps;
    if (member(value, "sampling")) caps.sampling = SamplingCapability{};
    if (const JSONValue* v = member(value, "roots")) caps.roots = RootsCapability::FromJSON(*v);
    if (member(value, "elicitation")) caps.elicitation = ElicitationCapability{};
    caps.experimental = optionalMap(value, "experimental", "experimental capabilities");
    return caps;
}

///////////////////////////////////////// Peer info ///////////////////////////////////////////
JSONValue PeerInfo::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "name", JSONValue{name});
    put(obj, "version", JSONValue{version});
    putOptional(obj, "title", title);
    putMap(obj, "metadata", metadata);
    return JSONValue{std::move(obj)};
}

PeerInfo PeerInfo::FromJSON(const JSONValue& value) {
    expectObject(value, "peer info");
    PeerInfo info;
    info.name = requireString(value, "name", "peer info");
    info.version = requireString(value, "version", "peer info");
    info.title = optionalString(value, "title", "peer info");
    info.metadata = optionalMap(value, "metadata", "peer info metadata");
    return info;
}

///////////////////////////////////////// Handshake ///////////////////////////////////////////
JSONValue InitializeParams::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "protocolVersion", JSONValue{protocolVersion});
    put(obj, "capabilities", capabilities.ToJSON());
    put(obj, "clientInfo", clientInfo.ToJSON());
    return JSONValue{std::move(obj)};
}

InitializeParams InitializeParams::FromJSON(const JSONValue& value) {
    expectObject(value, "initialize params");
    InitializeParams params;
    params.protocolVersion = requireString(value, "protocolVersion", "initialize params");
    if (const JSONValue* caps = member(value, "capabilities")) {
        params.capabilities = ClientCapabilities::FromJSON(*caps);
    }
    const JSONValue* info = member(value, "clientInfo");
    if (info == nullptr) {
        invalid("initialize params is missing 'clientInfo'");
    }
    params.clientInfo = PeerInfo::FromJSON(*info);
    return params;
}

JSONValue InitializeResult::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "protocolVersion", JSONValue{protocolVersion});
    put(obj, "capabilities", capabilities.ToJSON());
    put(obj, "serverInfo", serverInfo.ToJSON());
    putOptional(obj, "instructions", instructions);
    return JSONValue{std::move(obj)};
}

InitializeResult InitializeResult::FromJSON(const JSONValue& value) {
    expectObject(value, "initialize result");
    InitializeResult result;
    result.protocolVersion = requireString(value, "protocolVersion", "initialize result");
    const JSONValue* caps = member(value, "capabilities");
    if (caps == nullptr) {
        invalid("initialize result is missing 'capabilities'");
    }
    result.capabilities = ServerCapabilities::FromJSON(*caps);
    const JSONValue* info = member(value, "serverInfo");
    if (info == nullptr) {
        invalid("initialize result is missing 'serverInfo'");
    }
    result.serverInfo = PeerInfo::FromJSON(*info);
    result.instructions = optionalString(value, "instructions", "initialize result");
    return result;
}

JSONValue HandshakeResult::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "protocolVersion", JSONValue{protocolVersion});
    put(obj, "requestId", JSONValue{requestId});
    put(obj, "clientCapabilities", clientCapabilities.ToJSON());
    put(obj, "serverCapabilities", serverCapabilities.ToJSON());
    put(obj, "clientInfo", clientInfo.ToJSON());
    put(obj, "serverInfo", serverInfo.ToJSON());
    putOptional(obj, "instructions", instructions);
    return JSONValue{std::move(obj)};
}

///////////////////////////////////////// Content ///////////////////////////////////////////
ContentBlock ContentBlock::Text(std::string text) {
    ContentBlock block;
    block.type = "text";
    block.text = std::move(text);
    return block;
}

JSONValue ContentBlock::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "type", JSONValue{type});
    putOptional(obj, "text", text);
    putOptional(obj, "data", data);
    putOptional(obj, "mimeType", mimeType);
    return JSONValue{std::move(obj)};
}

ContentBlock ContentBlock::FromJSON(const JSONValue& value) {
    expectObject(value, "content block");
    ContentBlock block;
    block.type = requireString(value, "type", "content block");
    block.text = optionalString(value, "text", "content block");
    block.data = optionalString(value, "data", "content block");
    block.mimeType = optionalString(value, "mimeType", "content block");
    return block;
}

///////////////////////////////////////// Tools ///////////////////////////////////////////
JSONValue ToolDefinition::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "name", JSONValue{name});
    put(obj, "description", JSONValue{description});
    putOptional(obj, "title", title);
    if (!inputSchema.isNull()) {
        put(obj, "inputSchema", inputSchema);
    }
    return JSONValue{std::move(obj)};
}

ToolDefinition ToolDefinition::FromJSON(const JSONValue& value) {
    expectObject(value, "tool definition");
    ToolDefinition tool;
    tool.name = requireString(value, "name", "tool definition");
    tool.description = optionalString(value, "description", "tool definition").value_or("");
    tool.title = optionalString(value, "title", "tool definition");
    if (const JSONValue* schema = member(value, "inputSchema")) {
        tool.inputSchema = *schema;
    }
    return tool;
}

JSONValue CallToolParams::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "name", JSONValue{name});
    put(obj, "arguments", JSONValue{arguments});
    return JSONValue{std::move(obj)};
}

CallToolParams CallToolParams::FromJSON(const JSONValue& value) {
    expectObject(value, "tools/call params");
    CallToolParams params;
    params.name = requireString(value, "name", "tools/call params");
    params.arguments = optionalArguments(value, "tools/call");
    return params;
}

JSONValue ToolCallResult::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "content", arrayOf(content));
    put(obj, "isError", JSONValue{isError});
    return JSONValue{std::move(obj)};
}

ToolCallResult ToolCallResult::FromJSON(const JSONValue& value) {
    expectObject(value, "tool result");
    ToolCallResult result;
    result.content = optionalArrayOf<ContentBlock>(value, "content", "tool result");
    result.isError = optionalBool(value, "isError", "tool result");
    return result;
}

///////////////////////////////////////// Resources ///////////////////////////////////////////
JSONValue ResourceDescriptor::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue{uri});
    put(obj, "name", JSONValue{name});
    putOptional(obj, "title", title);
    putOptional(obj, "description", description);
    putOptional(obj, "mimeType", mimeType);
    if (size.has_value()) {
        put(obj, "size", JSONValue{size.value()});
    }
    putOptional(obj, "annotations", annotations);
    return JSONValue{std::move(obj)};
}

ResourceDescriptor ResourceDescriptor::FromJSON(const JSONValue& value) {
    expectObject(value, "resource descriptor");
    ResourceDescriptor desc;
    desc.uri = requireString(value, "uri", "resource descriptor");
    desc.name = requireString(value, "name", "resource descriptor");
    desc.title = optionalString(value, "title", "resource descriptor");
    desc.description = optionalString(value, "description", "resource descriptor");
    desc.mimeType = optionalString(value, "mimeType", "resource descriptor");
    desc.size = optionalInt(value, "size", "resource descriptor");
    desc.annotations = optionalValue(value, "annotations");
    return desc;
}

JSONValue ResourceContent::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue{uri});
    put(obj, "name", JSONValue{name});
    putOptional(obj, "title", title);
    putOptional(obj, "mimeType", mimeType);
    putOptional(obj, "text", text);
    putOptional(obj, "blob", blob);
    putOptional(obj, "annotations", annotations);
    return JSONValue{std::move(obj)};
}

ResourceContent ResourceContent::FromJSON(const JSONValue& value) {
    expectObject(value, "resource content");
    ResourceContent content;
    content.uri = requireString(value, "uri", "resource content");
    content.name = optionalString(value, "name", "resource content").value_or("");
    content.title = optionalString(value, "title", "resource content");
    content.mimeType = optionalString(value, "mimeType", "resource content");
    content.text = optionalString(value, "text", "resource content");
    content.blob = optionalString(value, "blob", "resource content");
    content.annotations = optionalValue(value, "annotations");
    return content;
}

JSONValue ResourceTemplate::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "uriTemplate", JSONValue{uriTemplate});
    put(obj, "name", JSONValue{name});
    putOptional(obj, "title", title);
    putOptional(obj, "description", description);
    putOptional(obj, "mimeType", mimeType);
    putOptional(obj, "annotations", annotations);
    return JSONValue{std::move(obj)};
}

ResourceTemplate ResourceTemplate::FromJSON(const JSONValue& value) {
    expectObject(value, "resource template");
    ResourceTemplate tmpl;
    tmpl.uriTemplate = requireString(value, "uriTemplate", "resource template");
    tmpl.name = requireString(value, "name", "resource template");
    tmpl.title = optionalString(value, "title", "resource template");
    tmpl.description = optionalString(value, "description", "resource template");
    tmpl.mimeType = optionalString(value, "mimeType", "resource template");
    tmpl.annotations = optionalValue(value, "annotations");
    return tmpl;
}

JSONValue ResourceUriParams::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue{uri});
    return JSONValue{std::move(obj)};
}

ResourceUriParams ResourceUriParams::FromJSON(const JSONValue& value) {
    expectObject(value, "resource params");
    return ResourceUriParams{requireString(value, "uri", "resource params")};
}

JSONValue ResourceUpdatedParams::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue{uri});
    putOptional(obj, "title", title);
    return JSONValue{std::move(obj)};
}

ResourceUpdatedParams ResourceUpdatedParams::FromJSON(const JSONValue& value) {
    expectObject(value, "resource update");
    ResourceUpdatedParams params;
    params.uri = requireString(value, "uri", "resource update");
    params.title = optionalString(value, "title", "resource update");
    return params;
}

///////////////////////////////////////// Prompts ///////////////////////////////////////////
JSONValue PromptArgument::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "name", JSONValue{name});
    put(obj, "required", JSONValue{required});
    putOptional(obj, "description", description);
    putOptional(obj, "type", type);
    return JSONValue{std::move(obj)};
}

PromptArgument PromptArgument::FromJSON(const JSONValue& value) {
    expectObject(value, "prompt argument");
    PromptArgument arg;
    arg.name = requireString(value, "name", "prompt argument");
    arg.description = optionalString(value, "description", "prompt argument");
    arg.required = optionalBool(value, "required", "prompt argument");
    arg.type = optionalString(value, "type", "prompt argument");
    return arg;
}

JSONValue PromptDefinition::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "name", JSONValue{name});
    putOptional(obj, "title", title);
    putOptional(obj, "description", description);
    if (!arguments.empty()) {
        put(obj, "arguments", arrayOf(arguments));
    }
    return JSONValue{std::move(obj)};
}

PromptDefinition PromptDefinition::FromJSON(const JSONValue& value) {
    expectObject(value, "prompt definition");
    PromptDefinition prompt;
    prompt.name = requireString(value, "name", "prompt definition");
    prompt.title = optionalString(value, "title", "prompt definition");
    prompt.description = optionalString(value, "description", "prompt definition");
    prompt.arguments = optionalArrayOf<PromptArgument>(value, "arguments", "prompt definition");
    return prompt;
}

JSONValue GetPromptParams::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "name", JSONValue{name});
    put(obj, "arguments", JSONValue{arguments});
    return JSONValue{std::move(obj)};
}

GetPromptParams GetPromptParams::FromJSON(const JSONValue& value) {
    expectObject(value, "prompts/get params");
    GetPromptParams params;
    params.name = requireString(value, "name", "prompts/get params");
    params.arguments = optionalArguments(value, "prompts/get");
    return params;
}

///////////////////////////////////////// Sampling ///////////////////////////////////////////
SamplingMessage SamplingMessage::Text(std::string role, std::string text) {
    return SamplingMessage{std::move(role), ContentBlock::Text(std::move(text))};
}

JSONValue SamplingMessage::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "role", JSONValue{role});
    put(obj, "content", content.ToJSON());
    return JSONValue{std::move(obj)};
}

SamplingMessage SamplingMessage::FromJSON(const JSONValue& value) {
    expectObject(value, "message");
    SamplingMessage msg;
    msg.role = requireString(value, "role", "message");
    const JSONValue* content = member(value, "content");
    if (content == nullptr) {
        invalid("message is missing 'content'");
    }
    msg.content = ContentBlock::FromJSON(*content);
    return msg;
}

JSONValue PromptRenderResult::ToJSON() const {
    JSONValue::Object obj;
    putOptional(obj, "description", description);
    put(obj, "messages", arrayOf(messages));
    return JSONValue{std::move(obj)};
}

PromptRenderResult PromptRenderResult::FromJSON(const JSONValue& value) {
    expectObject(value, "prompt result");
    PromptRenderResult result;
    result.description = optionalString(value, "description", "prompt result");
    result.messages = optionalArrayOf<SamplingMessage>(value, "messages", "prompt result");
    return result;
}

JSONValue GenerationRequest::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "messages", arrayOf(messages));
    putOptional(obj, "modelPreferences", modelPreferences);
    putOptional(obj, "systemPrompt", systemPrompt);
    if (maxTokens.has_value()) {
        put(obj, "maxTokens", JSONValue{maxTokens.value()});
    }
    return JSONValue{std::move(obj)};
}

GenerationRequest GenerationRequest::FromJSON(const JSONValue& value) {
    expectObject(value, "sampling request");
    GenerationRequest request;
    request.messages = optionalArrayOf<SamplingMessage>(value, "messages", "sampling request");
    request.modelPreferences = optionalValue(value, "modelPreferences");
    request.systemPrompt = optionalString(value, "systemPrompt", "sampling request");
    request.maxTokens = optionalInt(value, "maxTokens", "sampling request");
    return request;
}

JSONValue GenerationResponse::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "role", JSONValue{role});
    put(obj, "content", content.ToJSON());
    putOptional(obj, "model", model);
    putOptional(obj, "stopReason", stopReason);
    return JSONValue{std::move(obj)};
}

GenerationResponse GenerationResponse::FromJSON(const JSONValue& value) {
    expectObject(value, "sampling response");
    GenerationResponse response;
    response.role = requireString(value, "role", "sampling response");
    const JSONValue* content = member(value, "content");
    if (content == nullptr) {
        invalid("sampling response is missing 'content'");
    }
    response.content = ContentBlock::FromJSON(*content);
    response.model = optionalString(value, "model", "sampling response");
    response.stopReason = optionalString(value, "stopReason", "sampling response");
    return response;
}

///////////////////////////////////////// Elicitation ///////////////////////////////////////////
std::optional<ElicitationAction> ElicitationActionFromString(const std::string& name) {
    const std::string key = lower(name);
    if (key == "accept") return ElicitationAction::Accept;
    if (key == "decline") return ElicitationAction::Decline;
    if (key == "cancel") return ElicitationAction::Cancel;
    return std::nullopt;
}

std::string ToString(ElicitationAction action) {
    switch (action) {
        case ElicitationAction::Accept: return "accept";
        case ElicitationAction::Decline: return "decline";
        case ElicitationAction::Cancel: return "cancel";
    }
    return "cancel";
}

JSONValue ElicitationRequest::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "message", JSONValue{message});
    putOptional(obj, "requestedSchema", requestedSchema);
    return JSONValue{std::move(obj)};
}

ElicitationRequest ElicitationRequest::FromJSON(const JSONValue& value) {
    expectObject(value, "elicitation request");
    ElicitationRequest request;
    request.message = requireString(value, "message", "elicitation request");
    request.requestedSchema = optionalValue(value, "requestedSchema");
    return request;
}

JSONValue ElicitationResponse::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "action", JSONValue{ToString(action)});
    putMap(obj, "content", content);
    return JSONValue{std::move(obj)};
}

ElicitationResponse ElicitationResponse::FromJSON(const JSONValue& value) {
    expectObject(value, "elicitation response");
    ElicitationResponse response;
    const std::string action = requireString(value, "action", "elicitation response");
    auto parsed = ElicitationActionFromString(action);
    if (!parsed.has_value()) {
        invalid("Unknown elicitation action '" + action + "'");
    }
    response.action = parsed.value();
    response.content = optionalMap(value, "content", "elicitation content");
    return response;
}

///////////////////////////////////////// Roots ///////////////////////////////////////////
JSONValue RootDescriptor::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "uri", JSONValue{uri});
    putOptional(obj, "name", name);
    return JSONValue{std::move(obj)};
}

RootDescriptor RootDescriptor::FromJSON(const JSONValue& value) {
    expectObject(value, "root");
    RootDescriptor root;
    root.uri = requireString(value, "uri", "root");
    root.name = optionalString(value, "name", "root");
    return root;
}

///////////////////////////////////////// Log messages ///////////////////////////////////////////
JSONValue LogMessage::ToJSON() const {
    JSONValue::Object obj;
    put(obj, "level", JSONValue{ToString(level)});
    putOptional(obj, "logger", logger);
    put(obj, "data", data);
    return JSONValue{std::move(obj)};
}

LogMessage LogMessage::FromJSON(const JSONValue& value) {
    expectObject(value, "log message");
    LogMessage msg;
    const std::string levelName = requireString(value, "level", "log message");
    auto level = LoggingLevelFromString(levelName);
    if (!level.has_value()) {
        invalid("Unknown logging level '" + levelName + "'");
    }
    msg.level = level.value();
    msg.logger = optionalString(value, "logger", "log message");
    if (const JSONValue* data = value.find("data")) {
        msg.data = *data;
    }
    return msg;
}

} // namespace mcpengine
