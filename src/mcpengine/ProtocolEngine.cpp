//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolEngine.cpp
// Purpose: Request correlation, dispatch and lifecycle of the shared JSON-RPC engine
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <unordered_map>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "logging/Logger.h"
#include "mcpengine/JsonRpcMessageRouter.h"
#include "mcpengine/Protocol.h"
#include "mcpengine/ProtocolEngine.h"
#include "mcpengine/async/FutureAwaitable.h"
#include "mcpengine/async/Task.h"

namespace mcpengine {

std::string ToString(EngineState state) {
    switch (state) {
        case EngineState::Unconnected: return "Unconnected";
        case EngineState::Negotiating: return "Negotiating";
        case EngineState::Ready: return "Ready";
        case EngineState::Closed: return "Closed";
    }
    return "Unknown";
}

HandlerResult HandlerResult::Ok(JSONValue value) {
    HandlerResult r;
    r.result = std::move(value);
    return r;
}

HandlerResult HandlerResult::Fail(errors::McpError err) {
    HandlerResult r;
    r.error = std::move(err);
    return r;
}

HandlerResult HandlerResult::Fail(int code, std::string message, std::optional<JSONValue> data) {
    return Fail(errors::makeError(code, std::move(message), std::move(data)));
}

//==========================================================================================================
// ProtocolEngine::Impl
// Purpose: Engine state. Everything below the "Loop-only state" banner is touched from the io_context
//          thread only.
//==========================================================================================================
class ProtocolEngine::Impl : public std::enable_shared_from_this<ProtocolEngine::Impl> {
public:
    using Work = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    const std::string role;
    std::shared_ptr<IEventRecorder> recorder;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    std::shared_ptr<IChannel> channel;
    std::atomic<bool> started{false};
    std::atomic<bool> closeRequested{false};
    std::atomic<EngineState> state{EngineState::Unconnected};
    std::atomic<int64_t> nextId{1};

    std::mutex handlersMutex;
    std::unordered_map<std::string, RequestHandler> requestHandlers;
    std::unordered_map<std::string, NotificationHandler> notificationHandlers;

    boost::asio::io_context ioc;
    std::optional<Work> workGuard;
    std::thread loopThread;
    std::jthread readerThread;

    // Entries are added by callers and removed on the loop. Nothing is added once the state is Closed.
    std::mutex pendingMutex;
    std::unordered_map<int64_t, std::shared_ptr<std::promise<JSONValue>>> pending;

    Impl(std::string roleName, std::shared_ptr<IEventRecorder> rec)
        : role(std::move(roleName)),
          recorder(std::move(rec)),
          router(MakeDefaultJsonRpcMessageRouter()) {
        workGuard.emplace(boost::asio::make_work_guard(ioc));
        loopThread = std::thread([this]() {
            ioc.run();
            LOG_DEBUG("{} engine loop exited", role);
        });
    }

    ~Impl() {
        shutdown(false);
    }

    bool onLoop() {
        return ioc.get_executor().running_in_this_thread();
    }

    bool isConnected() const {
        return started.load() && state.load() != EngineState::Closed;
    }

    std::string sessionId() const {
        return channel ? channel->GetSessionId() : std::string();
    }

    void record(const char* direction, const JSONValue& message) {
        if (recorder) {
            recorder->Record(role, direction, message, sessionId());
        }
    }

    ///////////////////////////////////////// Lifecycle /////////////////////////////////////////
    void start(std::shared_ptr<IChannel> ch) {
        if (!ch) {
            throw std::invalid_argument("ProtocolEngine::Start requires a channel");
        }
        if (started.load() || closeRequested.load()) {
            throw std::logic_error("ProtocolEngine already started or closed");
        }
        channel = std::move(ch);
        started.store(true);
        LOG_INFO("{} engine started on channel {}", role, channel->GetSessionId());
        readerThread = std::jthread([this](std::stop_token st) { readLoop(st); });
    }

    void readLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            JSONValue message;
            try {
                message = channel->Receive();
            } catch (const TransportClosed& e) {
                LOG_INFO("{} engine channel closed: {}", role, e.what());
                boost::asio::post(ioc, [this]() { onConnectionLost("Channel closed"); });
                return;
            } catch (const std::exception& e) {
                LOG_ERROR("{} engine channel failure: {}", role, e.what());
                boost::asio::post(ioc, [this]() { onConnectionLost("Channel failure"); });
                return;
            }
            boost::asio::post(ioc, [this, msg = std::move(message)]() { handleInbound(msg); });
        }
    }

    // Local shutdown. `farewell` announces the shutdown to a connected peer.
    void shutdown(bool farewell) {
        bool expected = false;
        if (closeRequested.compare_exchange_strong(expected, true)) {
            LOG_INFO("{} engine closing", role);
            auto closeOnLoop = [this, farewell]() { closeConnection(farewell, "Engine closed"); };
            if (onLoop()) {
                closeOnLoop();
            } else {
                std::promise<void> done;
                auto doneFuture = done.get_future();
                boost::asio::dispatch(ioc, [&closeOnLoop, &done]() {
                    closeOnLoop();
                    done.set_value();
                });
                doneFuture.wait();
            }
            if (readerThread.joinable()) {
                readerThread.request_stop();
                readerThread.join();
            }
            workGuard.reset();
        }
        if (!onLoop() && loopThread.joinable()) {
            loopThread.join();
        }
    }

    // Runs on the loop. Moves to Closed, releases the channel and fails every pending request.
    void closeConnection(bool farewell, const std::string& reason) {
        const EngineState previous = state.exchange(EngineState::Closed);
        if (channel) {
            if (farewell && previous != EngineState::Closed) {
                JSONRPCNotification bye(Methods::Shutdown);
                writeToChannel(bye.ToJSON());
            }
            channel->Halt();
            channel->Close();
        }
        failPending(reason);
    }

    void onConnectionLost(const std::string& reason) {
        if (state.load() == EngineState::Closed) {
            return;
        }
        LOG_INFO("{} engine connection lost: {}", role, reason);
        closeConnection(false, reason);
    }

    void failPending(const std::string& reason) {
        std::unordered_map<int64_t, std::shared_ptr<std::promise<JSONValue>>> waiting;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            waiting.swap(pending);
        }
        if (waiting.empty()) {
            return;
        }
        LOG_WARN("{} engine failing {} pending request(s): {}", role, waiting.size(), reason);
        for (auto& [id, promise] : waiting) {
            promise->set_exception(std::make_exception_ptr(TransportClosed(reason)));
        }
    }

    ///////////////////////////////////////// Outbound /////////////////////////////////////////
    // Runs on the loop. Records and writes one envelope; false when it could not be written.
    bool writeToChannel(const JSONValue& message) {
        record("outbound", message);
        try {
            channel->Send(message);
        } catch (const TransportClosed& e) {
            LOG_ERROR("{} engine send failed: {}", role, e.what());
            return false;
        }
        LOG_DEBUG("{} -> {}", role, SerializeJSON(message));
        return true;
    }

    bool sendOnLoop(const JSONValue& message) {
        if (state.load() == EngineState::Closed) {
            LOG_DEBUG("{} engine closed; dropping outbound message", role);
            return false;
        }
        return writeToChannel(message);
    }

    OutboundRequest sendTracked(const std::string& method, std::optional<JSONValue> params) {
        auto promise = std::make_shared<std::promise<JSONValue>>();
        OutboundRequest out;
        out.id = nextId.fetch_add(1);
        out.response = promise->get_future();
        if (!isConnected()) {
            promise->set_exception(std::make_exception_ptr(TransportClosed("Engine is not connected")));
            return out;
        }
        {
            // Checked under the lock so a concurrent Close either sees this entry or is seen here.
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (state.load() == EngineState::Closed) {
                promise->set_exception(std::make_exception_ptr(TransportClosed("Engine closed")));
                return out;
            }
            pending.emplace(out.id, promise);
        }
        JSONRPCRequest request(out.id, method, std::move(params));
        boost::asio::dispatch(ioc, [this, id = out.id, wire = request.ToJSON()]() {
            if (state.load() == EngineState::Closed) {
                return;
            }
            if (!writeToChannel(wire)) {
                if (auto promise = takePending(id)) {
                    promise->set_exception(std::make_exception_ptr(TransportClosed("Send failed")));
                }
            }
        });
        return out;
    }

    std::shared_ptr<std::promise<JSONValue>> takePending(int64_t id) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(id);
        if (it == pending.end()) {
            return nullptr;
        }
        auto promise = it->second;
        pending.erase(it);
        return promise;
    }

    void sendNotification(const std::string& method, std::optional<JSONValue> params) {
        if (!isConnected()) {
            throw TransportClosed("Engine is not connected");
        }
        JSONRPCNotification notification(method, std::move(params));
        boost::asio::dispatch(ioc, [this, wire = notification.ToJSON()]() { sendOnLoop(wire); });
    }

    void respond(const JSONRPCId& id, HandlerResult outcome) {
        boost::asio::dispatch(ioc, [this, id, outcome = std::move(outcome)]() {
            if (outcome.error.has_value()) {
                sendOnLoop(errors::makeErrorResponse(id, outcome.error.value())->ToJSON());
            } else {
                sendOnLoop(JSONRPCResponse(id, outcome.result.value_or(JSONValue{JSONValue::Object{}})).ToJSON());
            }
        });
    }

    ///////////////////////////////////////// Inbound /////////////////////////////////////////
    void handleInbound(const JSONValue& message) {
        record("inbound", message);
        if (state.load() == EngineState::Closed) {
            LOG_DEBUG("{} engine closed; dropping inbound message", role);
            return;
        }
        LOG_DEBUG("{} <- {}", role, SerializeJSON(message));
        InboundMessage decoded = router->decode(message);
        if (auto* request = std::get_if<JSONRPCRequest>(&decoded)) {
            handleRequest(*request);
        } else if (auto* response = std::get_if<JSONRPCResponse>(&decoded)) {
            handleResponse(*response);
        } else if (auto* notification = std::get_if<JSONRPCNotification>(&decoded)) {
            handleNotification(*notification);
        }
    }

    void handleResponse(const JSONRPCResponse& response) {
        const int64_t* id = std::get_if<int64_t>(&response.id);
        auto promise = id ? takePending(*id) : nullptr;
        if (!promise) {
            LOG_WARN("{} engine received response for unknown id {}", role, IdToString(response.id));
            return;
        }
        if (response.error.has_value()) {
            auto err = errors::mcpErrorFromResponse(response);
            if (!err.has_value()) {
                err = errors::makeError(JSONRPCErrorCodes::InternalError, "Malformed error response",
                                        response.error);
            }
            promise->set_exception(std::make_exception_ptr(errors::RemoteError(err.value())));
        } else if (response.result.has_value()) {
            promise->set_value(response.result.value());
        } else {
            LOG_WARN("{} engine received response {} without result or error", role, *id);
            promise->set_exception(std::make_exception_ptr(errors::RemoteError(
                errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Response missing result"))));
        }
    }

    void handleRequest(const JSONRPCRequest& request) {
        if (request.method == Methods::Ping) {
            respond(request.id, HandlerResult::Ok(JSONValue{JSONValue::Object{}}));
            return;
        }
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = requestHandlers.find(request.method);
            if (it != requestHandlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            LOG_DEBUG("{} engine has no handler for {}", role, request.method);
            respond(request.id, HandlerResult::Fail(JSONRPCErrorCodes::MethodNotFound,
                                                    "Method not found: " + request.method));
            return;
        }
        coServeRequest(weak_from_this(), RequestContext{request.id, request.method}, std::move(handler),
                       request.params.value_or(JSONValue{JSONValue::Object{}}));
    }

    //==========================================================================================================
    // Invokes a request handler and answers with its outcome. A ready result is answered inline on the
    // loop; otherwise the coroutine resumes on a waiter thread and posts the response back. This is the
    // single place where handler failures become error responses.
    //==========================================================================================================
    static async::Task<void> coServeRequest(std::weak_ptr<Impl> weak, RequestContext context,
                                            RequestHandler handler, JSONValue params) {
        const std::string& method = context.method;
        HandlerResult outcome;
        try {
            std::future<HandlerResult> fut = handler(params, context);
            if (!fut.valid()) {
                throw std::runtime_error("Handler returned no result");
            }
            outcome = co_await async::makeFutureAwaitable(std::move(fut));
        } catch (const errors::McpException& e) {
            LOG_DEBUG("Handler for {} reported error {}: {}", method, e.code(), e.what());
            outcome = HandlerResult::Fail(e.details());
        } catch (const std::exception& e) {
            LOG_WARN("Handler for {} failed: {}", method, e.what());
            outcome = HandlerResult::Fail(JSONRPCErrorCodes::InternalHandlerError, e.what());
        } catch (...) {
            LOG_WARN("Handler for {} failed with a non-standard exception", method);
            outcome = HandlerResult::Fail(JSONRPCErrorCodes::InternalHandlerError, "Unknown handler failure");
        }
        if (!outcome.result.has_value() && !outcome.error.has_value()) {
            outcome.result = JSONValue{JSONValue::Object{}};
        }
        if (auto self = weak.lock()) {
            self->respond(context.id, std::move(outcome));
        }
    }

    void handleNotification(const JSONRPCNotification& notification) {
        if (notification.method == Methods::Shutdown) {
            LOG_INFO("{} engine received shutdown from peer", role);
            closeConnection(false, "Peer shut down");
            return;
        }
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = notificationHandlers.find(notification.method);
            if (it != notificationHandlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            LOG_WARN("{} engine dropping unhandled notification {}", role, notification.method);
            return;
        }
        coServeNotification(notification.method, std::move(handler),
                            notification.params.value_or(JSONValue{JSONValue::Object{}}));
    }

    // Notifications have no reply channel; a failing handler is logged.
    static async::Task<void> coServeNotification(std::string method, NotificationHandler handler, JSONValue params) {
        try {
            std::future<void> fut = handler(params);
            if (fut.valid()) {
                co_await async::makeFutureAwaitable(std::move(fut));
            }
        } catch (const std::exception& e) {
            LOG_WARN("Notification handler for {} failed: {}", method, e.what());
        } catch (...) {
            LOG_WARN("Notification handler for {} failed with a non-standard exception", method);
        }
    }
};

///////////////////////////////////////// ProtocolEngine /////////////////////////////////////////
ProtocolEngine::ProtocolEngine(std::string role, std::shared_ptr<IEventRecorder> recorder)
    : pImpl(std::make_shared<Impl>(std::move(role), std::move(recorder))) {}

ProtocolEngine::~ProtocolEngine() {
    // Join the loop before the last reference goes away so the Impl is never destroyed on its own thread.
    pImpl->shutdown(true);
}

void ProtocolEngine::Start(std::shared_ptr<IChannel> channel) {
    pImpl->start(std::move(channel));
}

void ProtocolEngine::Close() {
    pImpl->shutdown(true);
}

bool ProtocolEngine::IsConnected() const {
    return pImpl->isConnected();
}

EngineState ProtocolEngine::GetState() const {
    return pImpl->state.load();
}

void ProtocolEngine::TransitionTo(EngineState next) {
    EngineState current = pImpl->state.load();
    while (current != EngineState::Closed) {
        if (pImpl->state.compare_exchange_weak(current, next)) {
            LOG_DEBUG("{} engine state {} -> {}", pImpl->role, ToString(current), ToString(next));
            return;
        }
    }
}

bool ProtocolEngine::TryTransition(EngineState expected, EngineState next) {
    if (expected == EngineState::Closed) {
        return false;
    }
    const bool moved = pImpl->state.compare_exchange_strong(expected, next);
    if (moved) {
        LOG_DEBUG("{} engine state {} -> {}", pImpl->role, ToString(expected), ToString(next));
    }
    return moved;
}

const std::string& ProtocolEngine::GetRole() const {
    return pImpl->role;
}

std::string ProtocolEngine::GetSessionId() const {
    return pImpl->sessionId();
}

std::future<JSONValue> ProtocolEngine::SendRequest(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->sendTracked(method, std::move(params)).response;
}

OutboundRequest ProtocolEngine::SendTrackedRequest(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->sendTracked(method, std::move(params));
}

void ProtocolEngine::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    pImpl->sendNotification(method, std::move(params));
}

void ProtocolEngine::RegisterRequestHandler(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->requestHandlers[method] = std::move(handler);
}

void ProtocolEngine::RegisterNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->notificationHandlers[method] = std::move(handler);
}

} // namespace mcpengine
