//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tools.cpp
// Purpose: Tests for tool registration, listing and invocation
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>

#include "TestSupport.h"

namespace mcpengine {

using test::isReady;
using test::makeObject;

namespace {
ToolDefinition echoTool() {
    ToolDefinition tool;
    tool.name = "echo";
    tool.description = "Echo text back";
    tool.inputSchema = ParseJSON(R"({"type":"object","properties":{"text":{"type":"string"}},"required":["text"]})");
    return tool;
}

std::future<ToolCallResult> echoHandler(const JSONValue::Object& args) {
    ToolCallResult result;
    auto it = args.find("text");
    const std::string text = (it != args.end() && it->second && it->second->isString())
                                 ? std::get<std::string>(it->second->value)
                                 : std::string();
    result.content.push_back(ContentBlock::Text("ECHO: " + text));
    return async::makeReadyFuture(std::move(result));
}
} // namespace

TEST(Tools, ListReturnsRegistrationOrder) {
    test::Session session;
    ToolDefinition second;
    second.name = "zeta";
    second.description = "Registered second";
    session.server->RegisterTool(echoTool(), echoHandler);
    session.server->RegisterTool(second, echoHandler);
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->ListTools();
    ASSERT_TRUE(isReady(fut));
    auto tools = fut.get();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0], echoTool());
    EXPECT_EQ(tools[1].name, "zeta");
}

TEST(Tools, CallInvokesHandler) {
    test::Session session;
    session.server->RegisterTool(echoTool(), echoHandler);
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->CallTool("echo", makeObject({{"text", JSONValue{"hi"}}}));
    ASSERT_TRUE(isReady(fut));
    ToolCallResult result = fut.get();
    EXPECT_FALSE(result.isError);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].text.value_or(""), "ECHO: hi");
}

TEST(Tools, UnknownToolIsProtocolError) {
    test::Session session;
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto fut = session.client->CallTool("missing", {});
    ASSERT_TRUE(isReady(fut));
    try {
        fut.get();
        FAIL() << "expected UnknownTool";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::UnknownTool);
        EXPECT_EQ(std::string(e.what()), "Unknown tool: missing");
    }
}

TEST(Tools, HandlerFailureIsReportedInResult) {
    test::Session session;
    ToolDefinition tool;
    tool.name = "fragile";
    tool.description = "Always fails";
    session.server->RegisterTool(tool, [](const JSONValue::Object&) -> std::future<ToolCallResult> {
        return std::async(std::launch::async, []() -> ToolCallResult {
            throw std::runtime_error("disk on fire");
        });
    });
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->CallTool("fragile", {});
    ASSERT_TRUE(isReady(fut));
    ToolCallResult result = fut.get();
    EXPECT_TRUE(result.isError);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].text.value_or(""), "Tool execution failed: disk on fire");
}

TEST(Tools, NonStandardThrowIsReportedInResult) {
    test::Session session;
    ToolDefinition tool;
    tool.name = "odd";
    tool.description = "Throws an int";
    session.server->RegisterTool(tool, [](const JSONValue::Object&) -> std::future<ToolCallResult> {
        throw 42;
    });
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->CallTool("odd", {});
    ASSERT_TRUE(isReady(fut));
    ToolCallResult result = fut.get();
    EXPECT_TRUE(result.isError);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].text.value_or(""), "Tool execution failed: unknown error");
}

TEST(Tools, MissingNameIsInvalidParams) {
    test::Session session;
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto fut = session.client->SendRequest(Methods::CallTool, ParseJSON(R"({"arguments":{}})"));
    ASSERT_TRUE(isReady(fut));
    try {
        fut.get();
        FAIL() << "expected InvalidParams";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
    }
}

TEST(Tools, ReRegisteringReplacesHandler) {
    test::Session session;
    session.server->RegisterTool(echoTool(), echoHandler);
    session.server->RegisterTool(echoTool(), [](const JSONValue::Object&) {
        ToolCallResult result;
        result.content.push_back(ContentBlock::Text("replaced"));
        return async::makeReadyFuture(std::move(result));
    });
    EXPECT_EQ(session.server->ListTools().size(), 1u);
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto fut = session.client->CallTool("echo", {});
    ASSERT_TRUE(isReady(fut));
    EXPECT_EQ(fut.get().content[0].text.value_or(""), "replaced");
}

TEST(Tools, RegisterRequiresHandler) {
    Server server(ServerInfo{"S", "1"});
    EXPECT_THROW(server.RegisterTool(echoTool(), ToolHandler{}), std::invalid_argument);
    EXPECT_FALSE(server.UnregisterTool("echo"));
}

TEST(Tools, ChangesAfterHandshakeAreAnnounced) {
    test::Session session;
    std::promise<void> announced;
    auto announcedFuture = announced.get_future();
    std::atomic<int> count{0};
    session.client->SetNotificationHandler(Methods::ToolListChanged, [&](const JSONValue&) {
        if (count.fetch_add(1) == 0) {
            announced.set_value();
        }
    });
    // Registration before the handshake is silent
    session.server->RegisterTool(echoTool(), echoHandler);
    ASSERT_TRUE(session.ConnectAndInitialize());
    EXPECT_EQ(count.load(), 0);

    EXPECT_TRUE(session.server->UnregisterTool("echo"));
    ASSERT_EQ(announcedFuture.wait_for(test::kWait), std::future_status::ready);

    auto fut = session.client->ListTools();
    ASSERT_TRUE(isReady(fut));
    EXPECT_TRUE(fut.get().empty());
    session.client->Close();
}

} // namespace mcpengine
