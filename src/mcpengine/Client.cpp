//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: MCP client implementation
//==========================================================================================================

#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpengine/Client.h"
#include "mcpengine/async/FutureAwaitable.h"
#include "mcpengine/async/Task.h"

namespace mcpengine {

namespace {

// Negotiation outcome shared with the initialize coroutine.
struct HandshakeSlot {
    mutable std::mutex mutex;
    std::optional<HandshakeResult> result;
};

////////////////////////////////////////// Outbound coroutines //////////////////////////////////////////
template <typename T, typename Decode>
async::Task<T> coRequest(std::future<JSONValue> pending, Decode decode) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(pending));
    co_return decode(result);
}

// Requests whose result carries no data.
async::Task<void> coAcknowledge(std::future<JSONValue> pending) {
    co_await async::makeFutureAwaitable(std::move(pending));
}

//==========================================================================================================
// coInitialize
// Purpose: initialize request, result validation, initialized confirmation and the Ready transition. Any
//          failure after the request was sent moves the engine back to Unconnected before it propagates.
//==========================================================================================================
async::Task<HandshakeResult> coInitialize(std::shared_ptr<ProtocolEngine> engine,
                                          std::shared_ptr<HandshakeSlot> slot,
                                          InitializeParams params) {
    if (!engine->IsConnected()) {
        throw TransportClosed("Client is not connected");
    }
    if (!engine->TryTransition(EngineState::Unconnected, EngineState::Negotiating)) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidRequest,
                                   "Initialize requires an unconnected engine (state " +
                                       ToString(engine->GetState()) + ")");
    }
    OutboundRequest request = engine->SendTrackedRequest(Methods::Initialize, params.ToJSON());
    HandshakeResult handshake;
    try {
        JSONValue raw = co_await async::makeFutureAwaitable(std::move(request.response));
        InitializeResult result = InitializeResult::FromJSON(raw);
        if (result.protocolVersion != params.protocolVersion) {
            throw errors::McpException(JSONRPCErrorCodes::UnsupportedProtocolVersion,
                                       "Server answered with protocol version " + result.protocolVersion +
                                           ", requested " + params.protocolVersion);
        }
        handshake.protocolVersion = result.protocolVersion;
        handshake.requestId = request.id;
        handshake.clientCapabilities = params.capabilities;
        handshake.serverCapabilities = result.capabilities;
        handshake.clientInfo = params.clientInfo;
        handshake.serverInfo = result.serverInfo;
        handshake.instructions = result.instructions;

        engine->SendNotification(Methods::Initialized);
        engine->TransitionTo(EngineState::Ready);
    } catch (const std::exception& e) {
        LOG_WARN("Initialize failed: {}", e.what());
        engine->TryTransition(EngineState::Negotiating, EngineState::Unconnected);
        throw;
    } catch (...) {
        LOG_WARN("Initialize failed with a non-standard exception");
        engine->TryTransition(EngineState::Negotiating, EngineState::Unconnected);
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->result = handshake;
    }
    LOG_INFO("Handshake with {} {} complete (protocol {})", handshake.serverInfo.name, handshake.serverInfo.version,
             handshake.protocolVersion);
    co_return std::move(handshake);
}

////////////////////////////////////////// Delegation coroutines //////////////////////////////////////////
// Provider failures are answered with an error-flavored response; the exchange itself succeeds.
async::Task<HandlerResult> coSample(std::shared_ptr<ISamplingProvider> provider, GenerationRequest request) {
    std::optional<GenerationResponse> response;
    std::string reason;
    try {
        std::future<GenerationResponse> fut = provider->CreateMessage(request);
        if (!fut.valid()) {
            throw std::runtime_error("Sampling provider returned no result");
        }
        response = co_await async::makeFutureAwaitable(std::move(fut));
    } catch (const std::exception& e) {
        reason = e.what();
    } catch (...) {
        reason = "unknown error";
    }
    if (!response.has_value()) {
        LOG_WARN("Sampling provider failed: {}", reason);
        GenerationResponse fallback;
        fallback.role = "assistant";
        fallback.content = ContentBlock::Text("[sampling error] " + reason);
        fallback.stopReason = "error";
        response = std::move(fallback);
    }
    co_return HandlerResult::Ok(response->ToJSON());
}

async::Task<HandlerResult> coElicit(std::shared_ptr<IElicitationHandler> handler, ElicitationRequest request) {
    ElicitationResponse response = co_await async::makeFutureAwaitable(handler->Elicit(request));
    LOG_DEBUG("Elicitation answered with {}", ToString(response.action));
    co_return HandlerResult::Ok(response.ToJSON());
}

async::Task<HandlerResult> coListRoots(std::shared_ptr<IRootsHandler> handler) {
    std::vector<RootDescriptor> roots = co_await async::makeFutureAwaitable(handler->ListRoots());
    co_return HandlerResult::Ok(ListToJSON("roots", roots));
}

std::future<HandlerResult> methodNotFound(const std::string& what) {
    return async::makeReadyFuture(HandlerResult::Fail(JSONRPCErrorCodes::MethodNotFound, what));
}

} // namespace

//==========================================================================================================
// Client::Impl
// Purpose: Engine plus the collaborators answering server-initiated requests. Collaborators may be swapped
//          at any time, so they are read under collaboratorsMutex on every request.
//==========================================================================================================
class Client::Impl {
public:
    std::shared_ptr<ProtocolEngine> engine;
    const ClientInfo clientInfo;
    std::shared_ptr<HandshakeSlot> handshake = std::make_shared<HandshakeSlot>();

    mutable std::mutex collaboratorsMutex;
    std::shared_ptr<ISamplingProvider> samplingProvider;
    std::shared_ptr<IElicitationHandler> elicitationHandler;
    std::shared_ptr<IRootsHandler> rootsHandler;

    Impl(const ClientInfo& info, std::shared_ptr<IEventRecorder> recorder)
        : engine(std::make_shared<ProtocolEngine>("client", std::move(recorder))),
          clientInfo(info) {
        registerHandlers();
    }

    ~Impl() {
        engine->Close();
    }

    template <typename T>
    std::shared_ptr<T> collaborator(const std::shared_ptr<T>& slot) const {
        std::lock_guard<std::mutex> lock(collaboratorsMutex);
        return slot;
    }

    void registerHandlers() {
        engine->RegisterRequestHandler(Methods::CreateMessage,
                                       [this](const JSONValue& params, const RequestContext&) {
            auto provider = collaborator(samplingProvider);
            if (!provider) {
                return methodNotFound("No sampling provider configured");
            }
            return coSample(std::move(provider), GenerationRequest::FromJSON(params)).toFuture();
        });
        engine->RegisterRequestHandler(Methods::Elicit, [this](const JSONValue& params, const RequestContext&) {
            auto handler = collaborator(elicitationHandler);
            if (!handler) {
                return methodNotFound("No elicitation handler configured");
            }
            return coElicit(std::move(handler), ElicitationRequest::FromJSON(params)).toFuture();
        });
        engine->RegisterRequestHandler(Methods::ListRoots, [this](const JSONValue&, const RequestContext&) {
            auto handler = collaborator(rootsHandler);
            if (!handler) {
                return methodNotFound("No roots handler configured");
            }
            return coListRoots(std::move(handler)).toFuture();
        });
    }
};

////////////////////////////////////////// Client //////////////////////////////////////////
Client::Client(const ClientInfo& clientInfo, std::shared_ptr<IEventRecorder> recorder)
    : pImpl(std::make_unique<Impl>(clientInfo, std::move(recorder))) {}

Client::~Client() = default;

void Client::Connect(std::shared_ptr<IChannel> channel) {
    LOG_INFO("Connecting client {} {}", pImpl->clientInfo.name, pImpl->clientInfo.version);
    pImpl->engine->Start(std::move(channel));
}

std::future<HandshakeResult> Client::Initialize(const ClientInfo& clientInfo,
                                                const ClientCapabilities& capabilities,
                                                const std::string& protocolVersion) {
    FUNC_SCOPE();
    InitializeParams params;
    params.protocolVersion = protocolVersion;
    params.capabilities = capabilities;
    params.clientInfo = clientInfo;
    return coInitialize(pImpl->engine, pImpl->handshake, std::move(params)).toFuture();
}

void Client::Close() {
    pImpl->engine->Close();
}

bool Client::IsConnected() const {
    return pImpl->engine->IsConnected();
}

EngineState Client::GetState() const {
    return pImpl->engine->GetState();
}

std::optional<HandshakeResult> Client::GetHandshakeResult() const {
    std::lock_guard<std::mutex> lock(pImpl->handshake->mutex);
    return pImpl->handshake->result;
}

///////////////////////////////////////// Tools /////////////////////////////////////////
std::future<std::vector<ToolDefinition>> Client::ListTools() {
    return coRequest<std::vector<ToolDefinition>>(pImpl->engine->SendRequest(Methods::ListTools),
                                                  [](const JSONValue& v) { return ListFromJSON<ToolDefinition>(v, "tools"); })
        .toFuture();
}

std::future<ToolCallResult> Client::CallTool(const std::string& name, const JSONValue::Object& arguments) {
    CallToolParams params;
    params.name = name;
    params.arguments = arguments;
    return coRequest<ToolCallResult>(pImpl->engine->SendRequest(Methods::CallTool, params.ToJSON()),
                                     [](const JSONValue& v) { return ToolCallResult::FromJSON(v); })
        .toFuture();
}

///////////////////////////////////////// Resources /////////////////////////////////////////
std::future<std::vector<ResourceDescriptor>> Client::ListResources() {
    return coRequest<std::vector<ResourceDescriptor>>(
               pImpl->engine->SendRequest(Methods::ListResources),
               [](const JSONValue& v) { return ListFromJSON<ResourceDescriptor>(v, "resources"); })
        .toFuture();
}

std::future<std::vector<ResourceContent>> Client::ReadResource(const std::string& uri) {
    ResourceUriParams params;
    params.uri = uri;
    return coRequest<std::vector<ResourceContent>>(
               pImpl->engine->SendRequest(Methods::ReadResource, params.ToJSON()),
               [](const JSONValue& v) { return ListFromJSON<ResourceContent>(v, "contents"); })
        .toFuture();
}

std::future<void> Client::SubscribeResource(const std::string& uri) {
    ResourceUriParams params;
    params.uri = uri;
    return coAcknowledge(pImpl->engine->SendRequest(Methods::Subscribe, params.ToJSON())).toFuture();
}

std::future<void> Client::UnsubscribeResource(const std::string& uri) {
    ResourceUriParams params;
    params.uri = uri;
    return coAcknowledge(pImpl->engine->SendRequest(Methods::Unsubscribe, params.ToJSON())).toFuture();
}

std::future<std::vector<ResourceTemplate>> Client::ListResourceTemplates() {
    return coRequest<std::vector<ResourceTemplate>>(
               pImpl->engine->SendRequest(Methods::ListResourceTemplates),
               [](const JSONValue& v) { return ListFromJSON<ResourceTemplate>(v, "resourceTemplates"); })
        .toFuture();
}

///////////////////////////////////////// Prompts /////////////////////////////////////////
std::future<std::vector<PromptDefinition>> Client::ListPrompts() {
    return coRequest<std::vector<PromptDefinition>>(
               pImpl->engine->SendRequest(Methods::ListPrompts),
               [](const JSONValue& v) { return ListFromJSON<PromptDefinition>(v, "prompts"); })
        .toFuture();
}

std::future<PromptRenderResult> Client::GetPrompt(const std::string& name, const JSONValue::Object& arguments) {
    GetPromptParams params;
    params.name = name;
    params.arguments = arguments;
    return coRequest<PromptRenderResult>(pImpl->engine->SendRequest(Methods::GetPrompt, params.ToJSON()),
                                         [](const JSONValue& v) { return PromptRenderResult::FromJSON(v); })
        .toFuture();
}

///////////////////////////////////////// Utility /////////////////////////////////////////
std::future<void> Client::SetLoggingLevel(LoggingLevel level) {
    JSONValue::Object params;
    params["level"] = std::make_shared<JSONValue>(ToString(level));
    return coAcknowledge(pImpl->engine->SendRequest(Methods::SetLogLevel, JSONValue{std::move(params)})).toFuture();
}

std::future<void> Client::Ping() {
    return coAcknowledge(pImpl->engine->SendRequest(Methods::Ping)).toFuture();
}

std::future<JSONValue> Client::SendRequest(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->engine->SendRequest(method, std::move(params));
}

void Client::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    pImpl->engine->SendNotification(method, std::move(params));
}

///////////////////////////////////////// Delegation targets /////////////////////////////////////////
void Client::SetSamplingProvider(std::shared_ptr<ISamplingProvider> provider) {
    std::lock_guard<std::mutex> lock(pImpl->collaboratorsMutex);
    pImpl->samplingProvider = std::move(provider);
}

void Client::SetElicitationHandler(std::shared_ptr<IElicitationHandler> handler) {
    std::lock_guard<std::mutex> lock(pImpl->collaboratorsMutex);
    pImpl->elicitationHandler = std::move(handler);
}

void Client::SetRootsHandler(std::shared_ptr<IRootsHandler> handler) {
    std::lock_guard<std::mutex> lock(pImpl->collaboratorsMutex);
    pImpl->rootsHandler = std::move(handler);
}

void Client::NotifyRootsListChanged() {
    pImpl->engine->SendNotification(Methods::RootsListChanged);
}

void Client::SetNotificationHandler(const std::string& method, NotificationCallback callback) {
    pImpl->engine->RegisterNotificationHandler(method, [callback = std::move(callback)](const JSONValue& params) {
        if (callback) {
            callback(params);
        }
        return async::makeReadyFuture();
    });
}

///////////////////////////////////////// ClientFactory /////////////////////////////////////////
ClientFactory::ClientFactory(std::shared_ptr<IEventRecorder> recorder)
    : recorder(std::move(recorder)) {}

std::unique_ptr<IClient> ClientFactory::CreateClient(const ClientInfo& clientInfo) {
    return std::make_unique<Client>(clientInfo, recorder);
}

} // namespace mcpengine
