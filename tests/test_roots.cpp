//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_roots.cpp
// Purpose: Tests for roots/list requests and roots change propagation
//==========================================================================================================

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <vector>

#include "TestSupport.h"

namespace mcpengine {

using test::isReady;

namespace {
std::vector<RootDescriptor> projectRoots() {
    return {RootDescriptor{"file:///work/app", std::string("app")}, RootDescriptor{"file:///work/lib", std::nullopt}};
}
} // namespace

TEST(Roots, ServerRequestsClientRoots) {
    test::Session session;
    session.client->SetRootsHandler(std::make_shared<MutableRootsHandler>(projectRoots()));
    ASSERT_TRUE(session.ConnectAndInitialize());
    EXPECT_TRUE(session.server->GetKnownRoots().empty());

    auto fut = session.server->RequestRoots();
    ASSERT_TRUE(isReady(fut));
    EXPECT_EQ(fut.get(), projectRoots());
    EXPECT_EQ(session.server->GetKnownRoots(), projectRoots());
}

TEST(Roots, ChangeNotificationRefreshesServerView) {
    test::Session session;
    auto roots = std::make_shared<MutableRootsHandler>(projectRoots());
    session.client->SetRootsHandler(roots);

    std::mutex mutex;
    std::vector<std::vector<RootDescriptor>> announcements;
    std::promise<void> changed;
    auto changedFuture = changed.get_future();
    session.server->SetRootsChangedCallback([&](const std::vector<RootDescriptor>& fresh) {
        std::lock_guard<std::mutex> lock(mutex);
        announcements.push_back(fresh);
        if (announcements.size() == 1) {
            changed.set_value();
        }
    });
    ASSERT_TRUE(session.ConnectAndInitialize());

    // An explicit request updates the cache without invoking the callback
    auto initial = session.server->RequestRoots();
    ASSERT_TRUE(isReady(initial));
    initial.get();

    std::vector<RootDescriptor> updated{RootDescriptor{"file:///work/docs", std::string("docs")}};
    roots->SetRoots(updated);
    session.client->NotifyRootsListChanged();

    ASSERT_EQ(changedFuture.wait_for(test::kWait), std::future_status::ready);
    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_EQ(announcements.size(), 1u);
        EXPECT_EQ(announcements[0], updated);
    }
    EXPECT_EQ(session.server->GetKnownRoots(), updated);
    session.server->SetRootsChangedCallback(nullptr);
    session.client->Close();
}

TEST(Roots, MissingHandlerIsMethodNotFound) {
    test::Session session;
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto fut = session.server->RequestRoots();
    ASSERT_TRUE(isReady(fut));
    try {
        fut.get();
        FAIL() << "expected MethodNotFound";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::MethodNotFound);
        EXPECT_EQ(std::string(e.what()), "No roots handler configured");
    }
    EXPECT_TRUE(session.server->GetKnownRoots().empty());
}

TEST(Roots, MutableHandlerReturnsCurrentSet) {
    MutableRootsHandler handler;
    auto empty = handler.ListRoots();
    ASSERT_TRUE(isReady(empty));
    EXPECT_TRUE(empty.get().empty());
    handler.SetRoots(projectRoots());
    EXPECT_EQ(handler.GetRoots(), projectRoots());
    auto listed = handler.ListRoots();
    ASSERT_TRUE(isReady(listed));
    EXPECT_EQ(listed.get().size(), 2u);
}

} // namespace mcpengine
