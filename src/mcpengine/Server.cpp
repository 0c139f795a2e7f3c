//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: MCP server implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include "logging/Logger.h"
#include "mcpengine/Server.h"
#include "mcpengine/async/FutureAwaitable.h"
#include "mcpengine/async/Task.h"

namespace mcpengine {

namespace {

////////////////////////////////////////// Registry helpers //////////////////////////////////////////
// Registries are vectors so list requests answer in registration order.
template <typename Entry, typename KeyFn>
void upsert(std::vector<Entry>& entries, Entry entry, KeyFn key) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry& existing) { return key(existing) == key(entry); });
    if (it != entries.end()) {
        *it = std::move(entry);
    } else {
        entries.push_back(std::move(entry));
    }
}

template <typename Entry, typename KeyFn>
const Entry* findByKey(const std::vector<Entry>& entries, const std::string& name, KeyFn key) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry& existing) { return key(existing) == name; });
    return it == entries.end() ? nullptr : &(*it);
}

template <typename Entry, typename KeyFn>
bool eraseByKey(std::vector<Entry>& entries, const std::string& name, KeyFn key) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry& existing) { return key(existing) == name; });
    if (it == entries.end()) {
        return false;
    }
    entries.erase(it);
    return true;
}

struct ToolEntry {
    ToolDefinition definition;
    ToolHandler handler;
};

struct ResourceEntry {
    ResourceDescriptor descriptor;
    ResourceContent content;
};

struct PromptEntry {
    PromptDefinition definition;
    PromptHandler handler;
};

const auto toolKey = [](const ToolEntry& e) -> const std::string& { return e.definition.name; };
const auto resourceKey = [](const ResourceEntry& e) -> const std::string& { return e.descriptor.uri; };
const auto templateKey = [](const ResourceTemplate& t) -> const std::string& { return t.uriTemplate; };
const auto promptKey = [](const PromptEntry& e) -> const std::string& { return e.definition.name; };

JSONValue emptyObject() {
    return JSONValue{JSONValue::Object{}};
}

//==========================================================================================================
// RootsCache
// Purpose: Last root set fetched from the client. Shared with the coroutines that refresh it so they never
//          reach back into the server.
//==========================================================================================================
struct RootsCache {
    mutable std::mutex mutex;
    std::vector<RootDescriptor> roots;
    RootsChangedCallback callback;

    void replace(std::vector<RootDescriptor> fresh, bool announce) {
        RootsChangedCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex);
            roots = fresh;
            if (announce) {
                cb = callback;
            }
        }
        if (cb) {
            cb(fresh);
        }
    }

    std::vector<RootDescriptor> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return roots;
    }
};

////////////////////////////////////////// Coroutines //////////////////////////////////////////
// Parameters are taken by value; none of these touch the server after a suspension point.

// Tool failures are recovered here and reported in the result payload.
async::Task<HandlerResult> coCallTool(std::string name, ToolHandler handler, JSONValue::Object arguments) {
    ToolCallResult result;
    try {
        std::future<ToolCallResult> fut = handler(arguments);
        if (!fut.valid()) {
            throw std::runtime_error("Tool handler returned no result");
        }
        result = co_await async::makeFutureAwaitable(std::move(fut));
    } catch (const std::exception& e) {
        LOG_WARN("Tool {} failed: {}", name, e.what());
        result = ToolCallResult{};
        result.content.push_back(ContentBlock::Text(std::string("Tool execution failed: ") + e.what()));
        result.isError = true;
    } catch (...) {
        LOG_WARN("Tool {} failed with a non-standard exception", name);
        result = ToolCallResult{};
        result.content.push_back(ContentBlock::Text("Tool execution failed: unknown error"));
        result.isError = true;
    }
    co_return HandlerResult::Ok(result.ToJSON());
}

// Prompt failures propagate to the engine, which answers InternalHandlerError.
async::Task<HandlerResult> coRenderPrompt(PromptHandler handler, JSONValue::Object arguments) {
    std::future<PromptRenderResult> fut = handler(arguments);
    if (!fut.valid()) {
        throw std::runtime_error("Prompt handler returned no result");
    }
    PromptRenderResult rendered = co_await async::makeFutureAwaitable(std::move(fut));
    co_return HandlerResult::Ok(rendered.ToJSON());
}

template <typename T>
async::Task<T> coDecode(std::future<JSONValue> pending) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(pending));
    co_return T::FromJSON(result);
}

GenerationResponse samplingFallback(const std::string& reason) {
    GenerationResponse response;
    response.role = "assistant";
    response.content = ContentBlock::Text("[sampling unavailable] " + reason);
    response.stopReason = "error";
    return response;
}

async::Task<GenerationResponse> coCreateMessageOrFallback(std::future<JSONValue> pending) {
    std::optional<GenerationResponse> response;
    std::string reason;
    try {
        JSONValue result = co_await async::makeFutureAwaitable(std::move(pending));
        response = GenerationResponse::FromJSON(result);
    } catch (const std::exception& e) {
        reason = e.what();
    } catch (...) {
        reason = "unknown error";
    }
    if (!response.has_value()) {
        LOG_WARN("Sampling delegation failed, using fallback: {}", reason);
        response = samplingFallback(reason);
    }
    co_return std::move(response.value());
}

async::Task<std::unordered_map<std::string, JSONValue>> coElicitWithDefaults(
    std::future<JSONValue> pending, std::unordered_map<std::string, JSONValue> working) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(pending));
    ElicitationResponse response = ElicitationResponse::FromJSON(result);
    if (response.action == ElicitationAction::Accept) {
        for (auto& [field, value] : response.content) {
            working[field] = value;
        }
        LOG_DEBUG("Elicitation accepted with {} field(s)", response.content.size());
    } else {
        LOG_INFO("Elicitation {}; continuing with defaults", ToString(response.action));
    }
    co_return std::move(working);
}

async::Task<std::vector<RootDescriptor>> coFetchRoots(std::future<JSONValue> pending,
                                                      std::shared_ptr<RootsCache> cache,
                                                      bool announce) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(pending));
    std::vector<RootDescriptor> roots = ListFromJSON<RootDescriptor>(result, "roots");
    LOG_DEBUG("Client reported {} root(s)", roots.size());
    cache->replace(roots, announce);
    co_return std::move(roots);
}

async::Task<void> coRefreshRoots(std::future<JSONValue> pending, std::shared_ptr<RootsCache> cache) {
    co_await async::makeFutureAwaitable(coFetchRoots(std::move(pending), std::move(cache), true).toFuture());
}

} // namespace

//==========================================================================================================
// Server::Impl
// Purpose: Registries, negotiation state and the request handlers installed on the engine. Handlers run on
//          the engine loop; public registry methods may be called from any thread, so the registries sit
//          behind registryMutex.
//==========================================================================================================
class Server::Impl {
public:
    // Client side of an answered initialize, kept until notifications/initialized arrives.
    struct AnsweredInitialize {
        int64_t requestId{0};
        std::string protocolVersion;
        ClientCapabilities capabilities;
        ClientInfo clientInfo;
    };

    std::shared_ptr<ProtocolEngine> engine;
    const ServerInfo serverInfo;

    mutable std::mutex stateMutex;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;
    std::optional<AnsweredInitialize> answered;
    std::optional<HandshakeResult> handshake;

    mutable std::mutex registryMutex;
    std::vector<ToolEntry> tools;
    std::vector<ResourceEntry> resources;
    std::vector<ResourceTemplate> templates;
    std::vector<PromptEntry> prompts;
    std::unordered_set<std::string> subscribedUris;

    std::atomic<bool> initializeAnswered{false};
    std::atomic<LoggingLevel> logLevel{LoggingLevel::Info};
    std::shared_ptr<RootsCache> rootsCache = std::make_shared<RootsCache>();

    Impl(const ServerInfo& info, std::shared_ptr<IEventRecorder> recorder)
        : engine(std::make_shared<ProtocolEngine>("server", std::move(recorder))),
          serverInfo(info) {
        registerHandlers();
    }

    ~Impl() {
        engine->Close();
    }

    void registerSync(const char* method, std::function<HandlerResult(const JSONValue&, const RequestContext&)> fn) {
        engine->RegisterRequestHandler(method, [fn = std::move(fn)](const JSONValue& params,
                                                                    const RequestContext& context) {
            return async::makeReadyFuture(fn(params, context));
        });
    }

    void registerHandlers() {
        registerSync(Methods::Initialize, [this](const JSONValue& params, const RequestContext& context) {
            return handleInitialize(params, context);
        });
        engine->RegisterNotificationHandler(Methods::Initialized, [this](const JSONValue&) {
            handleInitialized();
            return async::makeReadyFuture();
        });

        registerSync(Methods::ListTools, [this](const JSONValue&, const RequestContext&) {
            return HandlerResult::Ok(ListToJSON("tools", listTools()));
        });
        engine->RegisterRequestHandler(Methods::CallTool, [this](const JSONValue& params, const RequestContext&) {
            return handleCallTool(params);
        });

        registerSync(Methods::ListResources, [this](const JSONValue&, const RequestContext&) {
            return HandlerResult::Ok(ListToJSON("resources", listResources()));
        });
        registerSync(Methods::ReadResource, [this](const JSONValue& params, const RequestContext&) {
            return handleReadResource(params);
        });
        registerSync(Methods::Subscribe, [this](const JSONValue& params, const RequestContext&) {
            return handleSubscription(params, true);
        });
        registerSync(Methods::Unsubscribe, [this](const JSONValue& params, const RequestContext&) {
            return handleSubscription(params, false);
        });
        registerSync(Methods::ListResourceTemplates, [this](const JSONValue&, const RequestContext&) {
            return HandlerResult::Ok(ListToJSON("resourceTemplates", listTemplates()));
        });

        registerSync(Methods::ListPrompts, [this](const JSONValue&, const RequestContext&) {
            return HandlerResult::Ok(ListToJSON("prompts", listPrompts()));
        });
        engine->RegisterRequestHandler(Methods::GetPrompt, [this](const JSONValue& params, const RequestContext&) {
            return handleGetPrompt(params);
        });

        registerSync(Methods::SetLogLevel, [this](const JSONValue& params, const RequestContext&) {
            return handleSetLogLevel(params);
        });

        engine->RegisterNotificationHandler(Methods::RootsListChanged, [this](const JSONValue&) {
            LOG_INFO("Client roots changed; refreshing");
            return coRefreshRoots(engine->SendRequest(Methods::ListRoots), rootsCache).toFuture();
        });
    }

    ////////////////////////////////////////// Negotiation //////////////////////////////////////////
    HandlerResult handleInitialize(const JSONValue& params, const RequestContext& context) {
        if (initializeAnswered.load()) {
            return HandlerResult::Fail(JSONRPCErrorCodes::InvalidRequest, "Server already initialized");
        }
        InitializeParams request = InitializeParams::FromJSON(params);
        if (request.protocolVersion != PROTOCOL_VERSION) {
            LOG_WARN("Rejecting initialize from {}: unsupported protocol version {}",
                     request.clientInfo.name, request.protocolVersion);
            JSONValue::Array supported{std::make_shared<JSONValue>(PROTOCOL_VERSION)};
            JSONValue::Object data;
            data["supported"] = std::make_shared<JSONValue>(std::move(supported));
            data["requested"] = std::make_shared<JSONValue>(request.protocolVersion);
            return HandlerResult::Fail(JSONRPCErrorCodes::UnsupportedProtocolVersion,
                                       "Unsupported protocol version: " + request.protocolVersion,
                                       JSONValue{std::move(data)});
        }
        engine->TryTransition(EngineState::Unconnected, EngineState::Negotiating);

        InitializeResult result;
        result.protocolVersion = PROTOCOL_VERSION;
        result.serverInfo = serverInfo;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            AnsweredInitialize record;
            if (const int64_t* id = std::get_if<int64_t>(&context.id)) {
                record.requestId = *id;
            }
            record.protocolVersion = request.protocolVersion;
            record.capabilities = request.capabilities;
            record.clientInfo = request.clientInfo;
            answered = std::move(record);
            result.capabilities = capabilities;
            result.instructions = instructions;
        }
        initializeAnswered.store(true);
        engine->TransitionTo(EngineState::Ready);
        LOG_INFO("Answered initialize from {} {}", request.clientInfo.name, request.clientInfo.version);
        return HandlerResult::Ok(result.ToJSON());
    }

    void handleInitialized() {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!answered.has_value()) {
            LOG_WARN("Ignoring {} received before initialize", Methods::Initialized);
            return;
        }
        if (handshake.has_value()) {
            LOG_DEBUG("Duplicate {} ignored", Methods::Initialized);
            return;
        }
        HandshakeResult result;
        result.protocolVersion = answered->protocolVersion;
        result.requestId = answered->requestId;
        result.clientCapabilities = answered->capabilities;
        result.serverCapabilities = capabilities;
        result.clientInfo = answered->clientInfo;
        result.serverInfo = serverInfo;
        result.instructions = instructions;
        handshake = std::move(result);
        LOG_INFO("Handshake with {} complete", answered->clientInfo.name);
    }

    ////////////////////////////////////////// Tools //////////////////////////////////////////
    std::vector<ToolDefinition> listTools() const {
        std::lock_guard<std::mutex> lock(registryMutex);
        std::vector<ToolDefinition> out;
        out.reserve(tools.size());
        for (const auto& entry : tools) {
            out.push_back(entry.definition);
        }
        return out;
    }

    std::future<HandlerResult> handleCallTool(const JSONValue& params) {
        CallToolParams call = CallToolParams::FromJSON(params);
        ToolHandler handler;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            if (const ToolEntry* entry = findByKey(tools, call.name, toolKey)) {
                handler = entry->handler;
            }
        }
        if (!handler) {
            return async::makeReadyFuture(
                HandlerResult::Fail(JSONRPCErrorCodes::UnknownTool, "Unknown tool: " + call.name));
        }
        LOG_DEBUG("Calling tool {}", call.name);
        return coCallTool(call.name, std::move(handler), std::move(call.arguments)).toFuture();
    }

    ////////////////////////////////////////// Resources //////////////////////////////////////////
    std::vector<ResourceDescriptor> listResources() const {
        std::lock_guard<std::mutex> lock(registryMutex);
        std::vector<ResourceDescriptor> out;
        out.reserve(resources.size());
        for (const auto& entry : resources) {
            out.push_back(entry.descriptor);
        }
        return out;
    }

    std::vector<ResourceTemplate> listTemplates() const {
        std::lock_guard<std::mutex> lock(registryMutex);
        return templates;
    }

    HandlerResult handleReadResource(const JSONValue& params) {
        ResourceUriParams request = ResourceUriParams::FromJSON(params);
        ResourceContent content;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            const ResourceEntry* entry = findByKey(resources, request.uri, resourceKey);
            if (entry == nullptr) {
                return HandlerResult::Fail(JSONRPCErrorCodes::ResourceNotFound, "Resource not found: " + request.uri);
            }
            content = entry->content;
            if (content.uri.empty()) {
                content.uri = entry->descriptor.uri;
            }
            if (content.name.empty()) {
                content.name = entry->descriptor.name;
            }
            if (!content.mimeType.has_value()) {
                content.mimeType = entry->descriptor.mimeType;
            }
            // Content without a payload falls back to the descriptor's description.
            if (!content.text.has_value() && !content.blob.has_value()) {
                content.text = entry->descriptor.description.value_or("");
            }
        }
        return HandlerResult::Ok(ListToJSON("contents", std::vector<ResourceContent>{content}));
    }

    HandlerResult handleSubscription(const JSONValue& params, bool subscribe) {
        ResourceUriParams request = ResourceUriParams::FromJSON(params);
        std::lock_guard<std::mutex> lock(registryMutex);
        if (findByKey(resources, request.uri, resourceKey) == nullptr) {
            return HandlerResult::Fail(JSONRPCErrorCodes::ResourceNotFound, "Resource not found: " + request.uri);
        }
        if (subscribe) {
            subscribedUris.insert(request.uri);
            LOG_DEBUG("Client subscribed to {}", request.uri);
        } else {
            subscribedUris.erase(request.uri);
            LOG_DEBUG("Client unsubscribed from {}", request.uri);
        }
        return HandlerResult::Ok(emptyObject());
    }

    ////////////////////////////////////////// Prompts //////////////////////////////////////////
    std::vector<PromptDefinition> listPrompts() const {
        std::lock_guard<std::mutex> lock(registryMutex);
        std::vector<PromptDefinition> out;
        out.reserve(prompts.size());
        for (const auto& entry : prompts) {
            out.push_back(entry.definition);
        }
        return out;
    }

    std::future<HandlerResult> handleGetPrompt(const JSONValue& params) {
        GetPromptParams request = GetPromptParams::FromJSON(params);
        PromptHandler handler;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            if (const PromptEntry* entry = findByKey(prompts, request.name, promptKey)) {
                handler = entry->handler;
            }
        }
        if (!handler) {
            return async::makeReadyFuture(
                HandlerResult::Fail(JSONRPCErrorCodes::PromptNotFound, "Prompt not found: " + request.name));
        }
        return coRenderPrompt(std::move(handler), std::move(request.arguments)).toFuture();
    }

    ////////////////////////////////////////// Logging //////////////////////////////////////////
    HandlerResult handleSetLogLevel(const JSONValue& params) {
        const JSONValue* level = params.find("level");
        if (level == nullptr || !level->isString()) {
            return HandlerResult::Fail(JSONRPCErrorCodes::InvalidParams, "Missing string member 'level'");
        }
        const std::string& name = std::get<std::string>(level->value);
        std::optional<LoggingLevel> parsed = LoggingLevelFromString(name);
        if (!parsed.has_value()) {
            return HandlerResult::Fail(JSONRPCErrorCodes::InvalidParams, "Unknown logging level: " + name);
        }
        logLevel.store(parsed.value());
        LOG_INFO("Client log level set to {}", ToString(parsed.value()));
        return HandlerResult::Ok(emptyObject());
    }

    ////////////////////////////////////////// Outbound //////////////////////////////////////////
    // Fire-and-forget; false when the channel is gone.
    bool notifyPeer(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        try {
            engine->SendNotification(method, std::move(params));
            return true;
        } catch (const TransportClosed& e) {
            LOG_WARN("Dropping {}: {}", method, e.what());
            return false;
        }
    }

    // Registry changes after the handshake are announced to the client.
    void announceListChanged(const char* method) {
        if (initializeAnswered.load() && engine->IsConnected()) {
            notifyPeer(method);
        }
    }
};

////////////////////////////////////////// Server //////////////////////////////////////////
Server::Server(const ServerInfo& serverInfo, std::shared_ptr<IEventRecorder> recorder)
    : pImpl(std::make_unique<Impl>(serverInfo, std::move(recorder))) {}

Server::~Server() = default;

void Server::Start(std::shared_ptr<IChannel> channel) {
    LOG_INFO("Starting server {} {}", pImpl->serverInfo.name, pImpl->serverInfo.version);
    pImpl->engine->Start(std::move(channel));
}

void Server::Stop() {
    FUNC_SCOPE();
    pImpl->engine->Close();
}

bool Server::IsRunning() const {
    return pImpl->engine->IsConnected();
}

EngineState Server::GetState() const {
    return pImpl->engine->GetState();
}

void Server::SetCapabilities(const ServerCapabilities& capabilities) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->capabilities = capabilities;
}

ServerCapabilities Server::GetCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->capabilities;
}

void Server::SetInstructions(std::optional<std::string> instructions) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->instructions = std::move(instructions);
}

ServerInfo Server::GetServerInfo() const {
    return pImpl->serverInfo;
}

std::optional<HandshakeResult> Server::GetHandshakeResult() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->handshake;
}

std::optional<ClientCapabilities> Server::GetClientCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    if (!pImpl->answered.has_value()) {
        return std::nullopt;
    }
    return pImpl->answered->capabilities;
}

std::optional<ClientInfo> Server::GetClientInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    if (!pImpl->answered.has_value()) {
        return std::nullopt;
    }
    return pImpl->answered->clientInfo;
}

///////////////////////////////////////// Tools /////////////////////////////////////////
void Server::RegisterTool(const ToolDefinition& definition, ToolHandler handler) {
    if (!handler) {
        throw std::invalid_argument("RegisterTool requires a handler for " + definition.name);
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        upsert(pImpl->tools, ToolEntry{definition, std::move(handler)}, toolKey);
    }
    LOG_DEBUG("Registered tool {}", definition.name);
    pImpl->announceListChanged(Methods::ToolListChanged);
}

bool Server::UnregisterTool(const std::string& name) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        removed = eraseByKey(pImpl->tools, name, toolKey);
    }
    if (removed) {
        pImpl->announceListChanged(Methods::ToolListChanged);
    }
    return removed;
}

std::vector<ToolDefinition> Server::ListTools() const {
    return pImpl->listTools();
}

///////////////////////////////////////// Resources /////////////////////////////////////////
void Server::RegisterResource(const ResourceDescriptor& descriptor, const ResourceContent& content) {
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        upsert(pImpl->resources, ResourceEntry{descriptor, content}, resourceKey);
    }
    LOG_DEBUG("Registered resource {}", descriptor.uri);
    pImpl->announceListChanged(Methods::ResourceListChanged);
}

bool Server::UpdateResourceContent(const std::string& uri, const ResourceContent& content) {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    auto it = std::find_if(pImpl->resources.begin(), pImpl->resources.end(),
                           [&](const ResourceEntry& entry) { return entry.descriptor.uri == uri; });
    if (it == pImpl->resources.end()) {
        return false;
    }
    it->content = content;
    return true;
}

bool Server::UnregisterResource(const std::string& uri) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        removed = eraseByKey(pImpl->resources, uri, resourceKey);
        pImpl->subscribedUris.erase(uri);
    }
    if (removed) {
        pImpl->announceListChanged(Methods::ResourceListChanged);
    }
    return removed;
}

std::vector<ResourceDescriptor> Server::ListResources() const {
    return pImpl->listResources();
}

void Server::RegisterResourceTemplate(const ResourceTemplate& resourceTemplate) {
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        upsert(pImpl->templates, resourceTemplate, templateKey);
    }
    pImpl->announceListChanged(Methods::ResourceListChanged);
}

std::vector<ResourceTemplate> Server::ListResourceTemplates() const {
    return pImpl->listTemplates();
}

bool Server::IsSubscribed(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    return pImpl->subscribedUris.count(uri) > 0;
}

///////////////////////////////////////// Prompts /////////////////////////////////////////
void Server::RegisterPrompt(const PromptDefinition& definition, PromptHandler handler) {
    if (!handler) {
        throw std::invalid_argument("RegisterPrompt requires a handler for " + definition.name);
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        upsert(pImpl->prompts, PromptEntry{definition, std::move(handler)}, promptKey);
    }
    LOG_DEBUG("Registered prompt {}", definition.name);
    pImpl->announceListChanged(Methods::PromptListChanged);
}

bool Server::UnregisterPrompt(const std::string& name) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->registryMutex);
        removed = eraseByKey(pImpl->prompts, name, promptKey);
    }
    if (removed) {
        pImpl->announceListChanged(Methods::PromptListChanged);
    }
    return removed;
}

std::vector<PromptDefinition> Server::ListPrompts() const {
    return pImpl->listPrompts();
}

///////////////////////////////////////// Notifications /////////////////////////////////////////
std::future<bool> Server::NotifyResourceUpdated(const std::string& uri, std::optional<std::string> title) {
    if (!IsSubscribed(uri)) {
        LOG_DEBUG("No subscriber for {}; update not sent", uri);
        return async::makeReadyFuture(false);
    }
    ResourceUpdatedParams params;
    params.uri = uri;
    params.title = std::move(title);
    return async::makeReadyFuture(pImpl->notifyPeer(Methods::ResourceUpdated, params.ToJSON()));
}

std::future<void> Server::NotifyResourcesListChanged() {
    pImpl->notifyPeer(Methods::ResourceListChanged);
    return async::makeReadyFuture();
}

std::future<void> Server::NotifyToolsListChanged() {
    pImpl->notifyPeer(Methods::ToolListChanged);
    return async::makeReadyFuture();
}

std::future<void> Server::NotifyPromptsListChanged() {
    pImpl->notifyPeer(Methods::PromptListChanged);
    return async::makeReadyFuture();
}

///////////////////////////////////////// Client logging /////////////////////////////////////////
std::future<bool> Server::LogToClient(LoggingLevel level,
                                      const std::string& message,
                                      const std::optional<JSONValue>& data,
                                      const std::optional<std::string>& logger) {
    if (static_cast<int>(level) < static_cast<int>(pImpl->logLevel.load())) {
        return async::makeReadyFuture(false);
    }
    LogMessage entry;
    entry.level = level;
    entry.logger = logger;
    if (data.has_value()) {
        JSONValue::Object payload;
        payload["message"] = std::make_shared<JSONValue>(message);
        payload["details"] = std::make_shared<JSONValue>(data.value());
        entry.data = JSONValue{std::move(payload)};
    } else {
        entry.data = JSONValue{message};
    }
    return async::makeReadyFuture(pImpl->notifyPeer(Methods::Log, entry.ToJSON()));
}

LoggingLevel Server::GetLogLevel() const {
    return pImpl->logLevel.load();
}

///////////////////////////////////////// Delegation /////////////////////////////////////////
std::future<GenerationResponse> Server::RequestCreateMessage(const GenerationRequest& request) {
    return coDecode<GenerationResponse>(pImpl->engine->SendRequest(Methods::CreateMessage, request.ToJSON()))
        .toFuture();
}

std::future<GenerationResponse> Server::RequestCreateMessageOrFallback(const GenerationRequest& request) {
    return coCreateMessageOrFallback(pImpl->engine->SendRequest(Methods::CreateMessage, request.ToJSON()))
        .toFuture();
}

std::future<ElicitationResponse> Server::RequestElicitation(const ElicitationRequest& request) {
    return coDecode<ElicitationResponse>(pImpl->engine->SendRequest(Methods::Elicit, request.ToJSON())).toFuture();
}

std::future<std::unordered_map<std::string, JSONValue>> Server::ElicitWithDefaults(
    const ElicitationRequest& request,
    std::unordered_map<std::string, JSONValue> defaults) {
    return coElicitWithDefaults(pImpl->engine->SendRequest(Methods::Elicit, request.ToJSON()), std::move(defaults))
        .toFuture();
}

std::future<std::vector<RootDescriptor>> Server::RequestRoots() {
    return coFetchRoots(pImpl->engine->SendRequest(Methods::ListRoots), pImpl->rootsCache, false).toFuture();
}

std::vector<RootDescriptor> Server::GetKnownRoots() const {
    return pImpl->rootsCache->snapshot();
}

void Server::SetRootsChangedCallback(RootsChangedCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->rootsCache->mutex);
    pImpl->rootsCache->callback = std::move(callback);
}

///////////////////////////////////////// Raw messaging /////////////////////////////////////////
std::future<JSONValue> Server::SendRequest(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->engine->SendRequest(method, std::move(params));
}

void Server::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    pImpl->engine->SendNotification(method, std::move(params));
}

///////////////////////////////////////// ServerFactory /////////////////////////////////////////
ServerFactory::ServerFactory(std::shared_ptr<IEventRecorder> recorder)
    : recorder(std::move(recorder)) {}

std::unique_ptr<IServer> ServerFactory::CreateServer(const ServerInfo& serverInfo) {
    return std::make_unique<Server>(serverInfo, recorder);
}

} // namespace mcpengine
