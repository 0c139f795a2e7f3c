//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_end_to_end.cpp
// Purpose: Full client/server session: handshake, tool call, delegated sampling and gated resource updates
//==========================================================================================================

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <vector>

#include "TestSupport.h"

namespace mcpengine {

using test::isReady;
using test::makeObject;

namespace {
class EndTurnProvider : public ISamplingProvider {
public:
    std::future<GenerationResponse> CreateMessage(const GenerationRequest&) override {
        GenerationResponse response;
        response.content = ContentBlock::Text("All good.");
        response.model = "demo-model";
        response.stopReason = "endTurn";
        return async::makeReadyFuture(std::move(response));
    }
};
} // namespace

TEST(EndToEnd, DemoSession) {
    const std::string uri = "mem://status";

    ServerCapabilities serverCaps;
    serverCaps.tools = ToolsCapability{};
    serverCaps.resources = ResourcesCapability{true, false};

    Server server(ServerInfo{"DemoServer", "1.0.0"});
    server.SetCapabilities(serverCaps);
    server.SetInstructions(std::string("demo"));

    ToolDefinition echo;
    echo.name = "echo";
    echo.description = "Echo a message";
    server.RegisterTool(echo, [](const JSONValue::Object& args) {
        ToolCallResult result;
        std::string message;
        if (auto it = args.find("message"); it != args.end() && it->second && it->second->isString()) {
            message = std::get<std::string>(it->second->value);
        }
        result.content.push_back(ContentBlock::Text("ECHO: " + message));
        return async::makeReadyFuture(std::move(result));
    });

    ResourceDescriptor status;
    status.uri = uri;
    status.name = "status";
    ResourceContent statusContent;
    statusContent.text = "ok";
    server.RegisterResource(status, statusContent);

    Client client(ClientInfo{"DemoClient", "1.0.0"});
    client.SetSamplingProvider(std::make_shared<EndTurnProvider>());

    std::mutex updatesMutex;
    std::vector<std::string> updates;
    std::promise<void> firstUpdate;
    auto firstUpdateFuture = firstUpdate.get_future();
    client.SetNotificationHandler(Methods::ResourceUpdated, [&](const JSONValue& params) {
        std::lock_guard<std::mutex> lock(updatesMutex);
        updates.push_back(test::stringAt(params, "uri"));
        if (updates.size() == 1) {
            firstUpdate.set_value();
        }
    });

    auto [clientChannel, serverChannel] = InMemoryChannel::CreatePair();
    server.Start(serverChannel);
    client.Connect(clientChannel);

    // Handshake
    ClientCapabilities clientCaps;
    clientCaps.sampling = SamplingCapability{};
    clientCaps.roots = RootsCapability{};
    auto handshakeFuture = client.Initialize(ClientInfo{"DemoClient", "1.0.0"}, clientCaps);
    ASSERT_TRUE(isReady(handshakeFuture));
    HandshakeResult handshake = handshakeFuture.get();
    ASSERT_TRUE(handshake.instructions.has_value());
    EXPECT_EQ(handshake.instructions.value(), "demo");
    EXPECT_TRUE(handshake.serverCapabilities.tools.has_value());
    EXPECT_TRUE(handshake.serverCapabilities.resources.has_value());

    // Tool call
    auto callFuture = client.CallTool("echo", makeObject({{"message", JSONValue{"hi"}}}));
    ASSERT_TRUE(isReady(callFuture));
    ToolCallResult call = callFuture.get();
    EXPECT_FALSE(call.isError);
    ASSERT_EQ(call.content.size(), 1u);
    EXPECT_EQ(call.content[0].text.value_or(""), "ECHO: hi");

    // Server-initiated sampling through the raw request path
    GenerationRequest ask;
    ask.messages.push_back(SamplingMessage::Text("user", "How are things?"));
    auto rawSampling = server.SendRequest(Methods::CreateMessage, ask.ToJSON());
    ASSERT_TRUE(isReady(rawSampling));
    GenerationResponse sampled = GenerationResponse::FromJSON(rawSampling.get());
    EXPECT_EQ(sampled.stopReason.value_or(""), "endTurn");

    // No subscriber yet: nothing reaches the client
    auto unsent = server.NotifyResourceUpdated(uri);
    ASSERT_TRUE(isReady(unsent));
    EXPECT_FALSE(unsent.get());

    auto subscribed = client.SubscribeResource(uri);
    ASSERT_TRUE(isReady(subscribed));
    subscribed.get();

    auto sent = server.NotifyResourceUpdated(uri);
    ASSERT_TRUE(isReady(sent));
    EXPECT_TRUE(sent.get());
    ASSERT_EQ(firstUpdateFuture.wait_for(test::kWait), std::future_status::ready);

    // A round trip after the update guarantees no second delivery is still in flight
    auto ping = client.Ping();
    ASSERT_TRUE(isReady(ping));
    ping.get();
    {
        std::lock_guard<std::mutex> lock(updatesMutex);
        ASSERT_EQ(updates.size(), 1u);
        EXPECT_EQ(updates[0], uri);
    }

    client.Close();
    server.Stop();
    EXPECT_FALSE(client.IsConnected());
    EXPECT_FALSE(server.IsRunning());
}

} // namespace mcpengine
