//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_channel.cpp
// Purpose: Tests for the in-memory channel pair (ordering, closure, halting)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "mcpengine/InMemoryChannel.hpp"

namespace mcpengine {

namespace {
JSONValue numbered(int64_t n) {
    JSONValue::Object obj;
    obj["n"] = std::make_shared<JSONValue>(n);
    return JSONValue{std::move(obj)};
}

int64_t numberOf(const JSONValue& v) {
    return std::get<int64_t>(v.find("n")->value);
}
} // namespace

TEST(InMemoryChannel, PairSharesSessionId) {
    auto [a, b] = InMemoryChannel::CreatePair();
    EXPECT_EQ(a->GetSessionId(), b->GetSessionId());
    EXPECT_EQ(a->GetSessionId().rfind("memory-", 0), 0u);
    EXPECT_TRUE(a->IsOpen());
    EXPECT_TRUE(b->IsOpen());
}

TEST(InMemoryChannel, DeliversInOrderBothWays) {
    auto [a, b] = InMemoryChannel::CreatePair();
    for (int64_t i = 0; i < 5; ++i) {
        a->Send(numbered(i));
    }
    b->Send(numbered(100));
    for (int64_t i = 0; i < 5; ++i) {
        EXPECT_EQ(numberOf(b->Receive()), i);
    }
    EXPECT_EQ(numberOf(a->Receive()), 100);
}

TEST(InMemoryChannel, ReceiveBlocksUntilSend) {
    auto [a, b] = InMemoryChannel::CreatePair();
    auto fut = std::async(std::launch::async, [peer = b]() { return peer->Receive(); });
    EXPECT_EQ(fut.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);
    a->Send(numbered(42));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(numberOf(fut.get()), 42);
}

TEST(InMemoryChannel, CloseDrainsQueuedMessagesFirst) {
    auto [a, b] = InMemoryChannel::CreatePair();
    a->Send(numbered(1));
    a->Send(numbered(2));
    a->Close();
    EXPECT_THROW(a->Send(numbered(3)), TransportClosed);
    EXPECT_FALSE(a->IsOpen());
    EXPECT_EQ(numberOf(b->Receive()), 1);
    EXPECT_EQ(numberOf(b->Receive()), 2);
    EXPECT_THROW(b->Receive(), TransportClosed);
}

TEST(InMemoryChannel, CloseWakesBlockedReceiver) {
    auto [a, b] = InMemoryChannel::CreatePair();
    auto fut = std::async(std::launch::async, [peer = b]() { (void)peer->Receive(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    a->Close();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(fut.get(), TransportClosed);
}

TEST(InMemoryChannel, HaltFailsReceiveImmediately) {
    auto [a, b] = InMemoryChannel::CreatePair();
    a->Send(numbered(1));
    b->Halt();
    EXPECT_THROW(b->Receive(), TransportClosed);
    // The sender can no longer deliver into a halted direction
    EXPECT_THROW(a->Send(numbered(2)), TransportClosed);
    EXPECT_FALSE(b->IsOpen());
}

TEST(InMemoryChannel, ConcurrentSendersAllArrive) {
    auto [a, b] = InMemoryChannel::CreatePair();
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;
    std::vector<std::thread> senders;
    for (int t = 0; t < kThreads; ++t) {
        senders.emplace_back([peer = a, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                peer->Send(numbered(static_cast<int64_t>(t * kPerThread + i)));
            }
        });
    }
    for (auto& th : senders) th.join();
    std::vector<bool> seen(kThreads * kPerThread, false);
    for (int i = 0; i < kThreads * kPerThread; ++i) {
        seen[static_cast<size_t>(numberOf(b->Receive()))] = true;
    }
    for (bool s : seen) EXPECT_TRUE(s);
}

} // namespace mcpengine
