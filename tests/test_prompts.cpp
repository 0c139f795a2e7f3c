//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_prompts.cpp
// Purpose: Tests for prompt listing and rendering
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "TestSupport.h"

namespace mcpengine {

using test::isReady;
using test::makeObject;

namespace {
PromptDefinition greetPrompt() {
    PromptDefinition prompt;
    prompt.name = "greet";
    prompt.description = "Greets someone";
    PromptArgument who;
    who.name = "who";
    who.description = "Name to greet";
    who.required = true;
    prompt.arguments.push_back(who);
    return prompt;
}

std::future<PromptRenderResult> renderGreeting(const JSONValue::Object& args) {
    auto it = args.find("who");
    if (it == args.end() || !it->second || !it->second->isString()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "Missing argument 'who'");
    }
    PromptRenderResult result;
    result.description = "Greeting";
    result.messages.push_back(SamplingMessage::Text("user", "Say hello to " + std::get<std::string>(it->second->value)));
    return async::makeReadyFuture(std::move(result));
}
} // namespace

TEST(Prompts, ListIncludesArguments) {
    test::Session session;
    session.server->RegisterPrompt(greetPrompt(), renderGreeting);
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->ListPrompts();
    ASSERT_TRUE(isReady(fut));
    auto prompts = fut.get();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0], greetPrompt());
    ASSERT_EQ(prompts[0].arguments.size(), 1u);
    EXPECT_TRUE(prompts[0].arguments[0].required);
}

TEST(Prompts, GetRendersMessages) {
    test::Session session;
    session.server->RegisterPrompt(greetPrompt(), renderGreeting);
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->GetPrompt("greet", makeObject({{"who", JSONValue{"Ada"}}}));
    ASSERT_TRUE(isReady(fut));
    PromptRenderResult result = fut.get();
    EXPECT_EQ(result.description.value_or(""), "Greeting");
    ASSERT_EQ(result.messages.size(), 1u);
    EXPECT_EQ(result.messages[0].role, "user");
    EXPECT_EQ(result.messages[0].content.text.value_or(""), "Say hello to Ada");
}

TEST(Prompts, HandlerErrorsKeepTheirCode) {
    test::Session session;
    session.server->RegisterPrompt(greetPrompt(), renderGreeting);
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->GetPrompt("greet", {});
    ASSERT_TRUE(isReady(fut));
    try {
        fut.get();
        FAIL() << "expected InvalidParams";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(std::string(e.what()), "Missing argument 'who'");
    }
}

TEST(Prompts, UnexpectedFailureIsInternalHandlerError) {
    test::Session session;
    PromptDefinition broken;
    broken.name = "broken";
    session.server->RegisterPrompt(broken, [](const JSONValue::Object&) {
        return std::async(std::launch::async, []() -> PromptRenderResult {
            throw std::runtime_error("template missing");
        });
    });
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->GetPrompt("broken", {});
    ASSERT_TRUE(isReady(fut));
    try {
        fut.get();
        FAIL() << "expected InternalHandlerError";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InternalHandlerError);
    }
}

TEST(Prompts, NonStandardThrowIsInternalHandlerError) {
    test::Session session;
    PromptDefinition odd;
    odd.name = "odd";
    session.server->RegisterPrompt(odd, [](const JSONValue::Object&) -> std::future<PromptRenderResult> {
        return std::async(std::launch::async, []() -> PromptRenderResult {
            throw "bad";
        });
    });
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->GetPrompt("odd", {});
    ASSERT_TRUE(isReady(fut));
    try {
        fut.get();
        FAIL() << "expected InternalHandlerError";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InternalHandlerError);
        EXPECT_EQ(std::string(e.what()), "Unknown handler failure");
    }
}

TEST(Prompts, UnknownPromptIsPromptNotFound) {
    test::Session session;
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto fut = session.client->GetPrompt("nope", {});
    ASSERT_TRUE(isReady(fut));
    try {
        fut.get();
        FAIL() << "expected PromptNotFound";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::PromptNotFound);
        EXPECT_EQ(std::string(e.what()), "Prompt not found: nope");
    }
}

TEST(Prompts, UnregisterRemovesPrompt) {
    Server server(ServerInfo{"S", "1"});
    server.RegisterPrompt(greetPrompt(), renderGreeting);
    EXPECT_EQ(server.ListPrompts().size(), 1u);
    EXPECT_TRUE(server.UnregisterPrompt("greet"));
    EXPECT_FALSE(server.UnregisterPrompt("greet"));
    EXPECT_TRUE(server.ListPrompts().empty());
    EXPECT_THROW(server.RegisterPrompt(greetPrompt(), PromptHandler{}), std::invalid_argument);
}

} // namespace mcpengine
