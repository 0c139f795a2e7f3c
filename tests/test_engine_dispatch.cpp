//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_engine_dispatch.cpp
// Purpose: Tests for inbound request and notification dispatch in ProtocolEngine
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "mcpengine/InMemoryChannel.hpp"
#include "mcpengine/ProtocolEngine.h"

namespace mcpengine {

namespace {
constexpr auto kWait = std::chrono::seconds(2);

std::optional<JSONValue> receiveWithin(const std::shared_ptr<InMemoryChannel>& peer) {
    auto fut = std::async(std::launch::async, [peer]() { return peer->Receive(); });
    if (fut.wait_for(kWait) != std::future_status::ready) {
        peer->Halt();
        return std::nullopt;
    }
    try {
        return fut.get();
    } catch (const TransportClosed&) {
        return std::nullopt;
    }
}

void sendRequest(const std::shared_ptr<InMemoryChannel>& peer, int64_t id, const std::string& method) {
    peer->Send(JSONRPCRequest(id, method).ToJSON());
}

int64_t errorCode(const JSONValue& response) {
    const JSONValue* err = response.find("error");
    if (err == nullptr) {
        return 0;
    }
    return std::get<int64_t>(err->find("code")->value);
}

std::string errorMessage(const JSONValue& response) {
    return std::get<std::string>(response.find("error")->find("message")->value);
}

class EngineDispatch : public ::testing::Test {
protected:
    void SetUp() override {
        auto [local, remote] = InMemoryChannel::CreatePair();
        channel = local;
        peer = remote;
        engine = std::make_unique<ProtocolEngine>("server");
    }

    void TearDown() override {
        engine->Close();
    }

    std::shared_ptr<InMemoryChannel> channel;
    std::shared_ptr<InMemoryChannel> peer;
    std::unique_ptr<ProtocolEngine> engine;
};
} // namespace

TEST_F(EngineDispatch, UnknownMethodIsMethodNotFound) {
    engine->Start(channel);
    sendRequest(peer, 1, "does/not/exist");
    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(std::get<int64_t>(reply->find("id")->value), 1);
    EXPECT_EQ(errorCode(*reply), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*reply), "Method not found: does/not/exist");
}

TEST_F(EngineDispatch, PingIsAnsweredWithoutHandler) {
    engine->Start(channel);
    sendRequest(peer, 2, "ping");
    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    const JSONValue* result = reply->find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, JSONValue{JSONValue::Object{}});
}

TEST_F(EngineDispatch, HandlerResultIsReturned) {
    engine->RegisterRequestHandler("math/double", [](const JSONValue& params, const RequestContext& ctx) {
        const int64_t n = std::get<int64_t>(params.find("n")->value);
        JSONValue::Object out;
        out["value"] = std::make_shared<JSONValue>(n * 2);
        out["method"] = std::make_shared<JSONValue>(ctx.method);
        std::promise<HandlerResult> p;
        p.set_value(HandlerResult::Ok(JSONValue{std::move(out)}));
        return p.get_future();
    });
    engine->Start(channel);

    JSONValue::Object params;
    params["n"] = std::make_shared<JSONValue>(int64_t{21});
    peer->Send(JSONRPCRequest(std::string("req-a"), "math/double", JSONValue{params}).ToJSON());

    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(std::get<std::string>(reply->find("id")->value), "req-a");
    const JSONValue* result = reply->find("result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(std::get<int64_t>(result->find("value")->value), 42);
    EXPECT_EQ(std::get<std::string>(result->find("method")->value), "math/double");
}

TEST_F(EngineDispatch, AsynchronousHandlerIsAwaited) {
    engine->RegisterRequestHandler("slow", [](const JSONValue&, const RequestContext&) {
        return std::async(std::launch::async, []() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            return HandlerResult::Ok(JSONValue{"done"});
        });
    });
    engine->Start(channel);
    sendRequest(peer, 3, "slow");
    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(std::get<std::string>(reply->find("result")->value), "done");
}

TEST_F(EngineDispatch, ThrowingHandlerBecomesInternalHandlerError) {
    engine->RegisterRequestHandler("explode", [](const JSONValue&, const RequestContext&) -> std::future<HandlerResult> {
        throw std::runtime_error("kaboom");
    });
    engine->Start(channel);
    sendRequest(peer, 4, "explode");
    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(errorCode(*reply), JSONRPCErrorCodes::InternalHandlerError);
    EXPECT_EQ(errorMessage(*reply), "kaboom");

    // The engine keeps serving afterwards
    sendRequest(peer, 5, "ping");
    auto pong = receiveWithin(peer);
    ASSERT_TRUE(pong.has_value());
    EXPECT_NE(pong->find("result"), nullptr);
}

TEST_F(EngineDispatch, McpExceptionKeepsItsCode) {
    engine->RegisterRequestHandler("picky", [](const JSONValue&, const RequestContext&) {
        return std::async(std::launch::async, []() -> HandlerResult {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "Missing 'x'");
        });
    });
    engine->Start(channel);
    sendRequest(peer, 6, "picky");
    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(errorCode(*reply), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(*reply), "Missing 'x'");
}

TEST_F(EngineDispatch, FailResultIsSentAsError) {
    engine->RegisterRequestHandler("reject", [](const JSONValue&, const RequestContext&) {
        std::promise<HandlerResult> p;
        p.set_value(HandlerResult::Fail(JSONRPCErrorCodes::InvalidRequest, "Not now"));
        return p.get_future();
    });
    engine->Start(channel);
    sendRequest(peer, 7, "reject");
    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(errorCode(*reply), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(reply->find("result"), nullptr);
}

TEST_F(EngineDispatch, NotificationsReachHandlerAndUnhandledAreDropped) {
    std::promise<std::string> seen;
    auto seenFuture = seen.get_future();
    engine->RegisterNotificationHandler("notifications/custom", [&seen](const JSONValue& params) {
        seen.set_value(std::get<std::string>(params.find("note")->value));
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    });
    engine->Start(channel);

    peer->Send(JSONRPCNotification("notifications/nobody/listens").ToJSON());
    JSONValue::Object params;
    params["note"] = std::make_shared<JSONValue>("hello");
    peer->Send(JSONRPCNotification("notifications/custom", JSONValue{params}).ToJSON());

    ASSERT_EQ(seenFuture.wait_for(kWait), std::future_status::ready);
    EXPECT_EQ(seenFuture.get(), "hello");

    // Notifications never produce replies; the next message is the ping answer
    sendRequest(peer, 8, "ping");
    auto reply = receiveWithin(peer);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(std::get<int64_t>(reply->find("id")->value), 8);
}

TEST_F(EngineDispatch, PeerShutdownClosesEngine) {
    engine->Start(channel);
    EXPECT_TRUE(engine->IsConnected());
    peer->Send(JSONRPCNotification("notifications/shutdown").ToJSON());
    const auto deadline = std::chrono::steady_clock::now() + kWait;
    while (engine->IsConnected() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_FALSE(engine->IsConnected());
    EXPECT_EQ(engine->GetState(), EngineState::Closed);
}

TEST_F(EngineDispatch, StartTwiceIsRejected) {
    engine->Start(channel);
    auto [other, unused] = InMemoryChannel::CreatePair();
    EXPECT_THROW(engine->Start(other), std::logic_error);
    EXPECT_THROW(engine->Start(nullptr), std::invalid_argument);
}

TEST(EngineLifecycle, TransitionsStopAtClosed) {
    ProtocolEngine engine("client");
    EXPECT_EQ(engine.GetState(), EngineState::Unconnected);
    EXPECT_TRUE(engine.TryTransition(EngineState::Unconnected, EngineState::Negotiating));
    EXPECT_FALSE(engine.TryTransition(EngineState::Unconnected, EngineState::Negotiating));
    engine.TransitionTo(EngineState::Ready);
    EXPECT_EQ(engine.GetState(), EngineState::Ready);
    engine.Close();
    EXPECT_EQ(engine.GetState(), EngineState::Closed);
    engine.TransitionTo(EngineState::Ready);
    EXPECT_EQ(engine.GetState(), EngineState::Closed);
    EXPECT_FALSE(engine.TryTransition(EngineState::Closed, EngineState::Ready));
    EXPECT_EQ(ToString(EngineState::Negotiating), "Negotiating");
}

} // namespace mcpengine
