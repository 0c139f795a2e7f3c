//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_logging.cpp
// Purpose: Tests for logging/setLevel and notifications/message delivery to the client
//==========================================================================================================

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <vector>

#include "TestSupport.h"

namespace mcpengine {

using test::isReady;

namespace {
struct LogSink {
    std::mutex mutex;
    std::vector<LogMessage> messages;

    void attach(IClient& client) {
        client.SetNotificationHandler(Methods::Log, [this](const JSONValue& params) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(LogMessage::FromJSON(params));
        });
    }

    bool waitFor(size_t count) {
        const auto deadline = std::chrono::steady_clock::now() + test::kWait;
        while (std::chrono::steady_clock::now() < deadline) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (messages.size() >= count) {
                    return true;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return false;
    }

    std::vector<LogMessage> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages;
    }
};
} // namespace

TEST(ServerLogging, DefaultThresholdIsInfo) {
    Server server(ServerInfo{"S", "1"});
    EXPECT_EQ(server.GetLogLevel(), LoggingLevel::Info);
    // Below threshold: filtered before any send is attempted
    auto filtered = server.LogToClient(LoggingLevel::Debug, "noise");
    ASSERT_TRUE(isReady(filtered));
    EXPECT_FALSE(filtered.get());
    // At threshold but not connected: dropped
    auto unsent = server.LogToClient(LoggingLevel::Info, "hello");
    ASSERT_TRUE(isReady(unsent));
    EXPECT_FALSE(unsent.get());
}

TEST(ServerLogging, SetLevelFiltersMessages) {
    test::Session session;
    LogSink sink;
    sink.attach(*session.client);
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto set = session.client->SetLoggingLevel(LoggingLevel::Warning);
    ASSERT_TRUE(isReady(set));
    set.get();
    EXPECT_EQ(session.server->GetLogLevel(), LoggingLevel::Warning);

    auto dropped = session.server->LogToClient(LoggingLevel::Info, "too quiet");
    ASSERT_TRUE(isReady(dropped));
    EXPECT_FALSE(dropped.get());

    auto sent = session.server->LogToClient(LoggingLevel::Error, "disk full", ParseJSON(R"({"free":0})"),
                                            std::string("storage"));
    ASSERT_TRUE(isReady(sent));
    EXPECT_TRUE(sent.get());
    auto plain = session.server->LogToClient(LoggingLevel::Warning, "slow query");
    ASSERT_TRUE(isReady(plain));
    EXPECT_TRUE(plain.get());

    ASSERT_TRUE(sink.waitFor(2));
    auto messages = sink.snapshot();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].level, LoggingLevel::Error);
    EXPECT_EQ(messages[0].logger.value_or(""), "storage");
    EXPECT_EQ(messages[0].data, ParseJSON(R"({"message":"disk full","details":{"free":0}})"));
    EXPECT_EQ(messages[1].level, LoggingLevel::Warning);
    EXPECT_EQ(messages[1].data, JSONValue{"slow query"});
    EXPECT_FALSE(messages[1].logger.has_value());
    session.client->Close();
}

TEST(ServerLogging, InvalidLevelsAreRejected) {
    test::Session session;
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto unknown = session.client->SendRequest(Methods::SetLogLevel, ParseJSON(R"({"level":"chatty"})"));
    ASSERT_TRUE(isReady(unknown));
    try {
        unknown.get();
        FAIL() << "expected InvalidParams";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(std::string(e.what()), "Unknown logging level: chatty");
    }

    auto missing = session.client->SendRequest(Methods::SetLogLevel, ParseJSON("{}"));
    ASSERT_TRUE(isReady(missing));
    EXPECT_THROW(missing.get(), errors::RemoteError);
    EXPECT_EQ(session.server->GetLogLevel(), LoggingLevel::Info);
}

} // namespace mcpengine
