//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_resources.cpp
// Purpose: Tests for resource listing, reading, templates and update subscriptions
//==========================================================================================================

#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <vector>

#include "TestSupport.h"

namespace mcpengine {

using test::isReady;

namespace {
const char* kUri = "mem://notes/today";

ResourceDescriptor notesDescriptor() {
    ResourceDescriptor desc;
    desc.uri = kUri;
    desc.name = "today";
    desc.description = "Today's notes";
    desc.mimeType = "text/plain";
    return desc;
}

ResourceContent textContent(const std::string& text) {
    ResourceContent content;
    content.text = text;
    return content;
}

// Collects notifications/resources/updated deliveries on the client.
struct UpdateLog {
    std::mutex mutex;
    std::vector<std::string> uris;
    std::promise<void> first;
    bool signalled{false};

    void attach(IClient& client) {
        client.SetNotificationHandler(Methods::ResourceUpdated, [this](const JSONValue& params) {
            std::lock_guard<std::mutex> lock(mutex);
            uris.push_back(test::stringAt(params, "uri"));
            if (!signalled) {
                signalled = true;
                first.set_value();
            }
        });
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return uris.size();
    }
};
} // namespace

TEST(Resources, ListAndReadWithDescriptorDefaults) {
    test::Session session;
    session.server->RegisterResource(notesDescriptor(), textContent("buy milk"));
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto listed = session.client->ListResources();
    ASSERT_TRUE(isReady(listed));
    auto resources = listed.get();
    ASSERT_EQ(resources.size(), 1u);
    EXPECT_EQ(resources[0], notesDescriptor());

    auto read = session.client->ReadResource(kUri);
    ASSERT_TRUE(isReady(read));
    auto contents = read.get();
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0].uri, kUri);
    EXPECT_EQ(contents[0].name, "today");
    EXPECT_EQ(contents[0].mimeType.value_or(""), "text/plain");
    EXPECT_EQ(contents[0].text.value_or(""), "buy milk");
}

TEST(Resources, EmptyContentFallsBackToDescription) {
    test::Session session;
    session.server->RegisterResource(notesDescriptor(), ResourceContent{});
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto read = session.client->ReadResource(kUri);
    ASSERT_TRUE(isReady(read));
    EXPECT_EQ(read.get()[0].text.value_or("<none>"), "Today's notes");
}

TEST(Resources, BlobContentIsPassedThrough) {
    test::Session session;
    ResourceContent blob;
    blob.blob = "AAEC";
    blob.mimeType = "application/octet-stream";
    session.server->RegisterResource(notesDescriptor(), blob);
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto read = session.client->ReadResource(kUri);
    ASSERT_TRUE(isReady(read));
    auto content = read.get()[0];
    EXPECT_EQ(content.blob.value_or(""), "AAEC");
    EXPECT_FALSE(content.text.has_value());
    EXPECT_EQ(content.mimeType.value_or(""), "application/octet-stream");
}

TEST(Resources, UnknownUriIsResourceNotFound) {
    test::Session session;
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto read = session.client->ReadResource("mem://nowhere");
    ASSERT_TRUE(isReady(read));
    try {
        read.get();
        FAIL() << "expected ResourceNotFound";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ResourceNotFound);
        EXPECT_EQ(std::string(e.what()), "Resource not found: mem://nowhere");
    }

    auto sub = session.client->SubscribeResource("mem://nowhere");
    ASSERT_TRUE(isReady(sub));
    EXPECT_THROW(sub.get(), errors::RemoteError);
}

TEST(Resources, UpdatesAreSentOnlyToSubscribers) {
    test::Session session;
    session.server->RegisterResource(notesDescriptor(), textContent("v1"));
    UpdateLog log;
    log.attach(*session.client);
    ASSERT_TRUE(session.ConnectAndInitialize());

    // Without a subscription nothing is sent
    auto unsent = session.server->NotifyResourceUpdated(kUri);
    ASSERT_TRUE(isReady(unsent));
    EXPECT_FALSE(unsent.get());

    auto sub = session.client->SubscribeResource(kUri);
    ASSERT_TRUE(isReady(sub));
    sub.get();
    EXPECT_TRUE(session.server->IsSubscribed(kUri));

    ASSERT_TRUE(session.server->UpdateResourceContent(kUri, textContent("v2")));
    auto sent = session.server->NotifyResourceUpdated(kUri, std::string("Today"));
    ASSERT_TRUE(isReady(sent));
    EXPECT_TRUE(sent.get());
    ASSERT_EQ(log.first.get_future().wait_for(test::kWait), std::future_status::ready);
    EXPECT_EQ(log.size(), 1u);

    // Reading after the notification observes the new content
    auto read = session.client->ReadResource(kUri);
    ASSERT_TRUE(isReady(read));
    EXPECT_EQ(read.get()[0].text.value_or(""), "v2");

    auto unsub = session.client->UnsubscribeResource(kUri);
    ASSERT_TRUE(isReady(unsub));
    unsub.get();
    EXPECT_FALSE(session.server->IsSubscribed(kUri));
    auto after = session.server->NotifyResourceUpdated(kUri);
    ASSERT_TRUE(isReady(after));
    EXPECT_FALSE(after.get());
    session.client->Close();
}

TEST(Resources, UnregisterDropsSubscription) {
    test::Session session;
    session.server->RegisterResource(notesDescriptor(), textContent("v1"));
    ASSERT_TRUE(session.ConnectAndInitialize());
    auto sub = session.client->SubscribeResource(kUri);
    ASSERT_TRUE(isReady(sub));
    sub.get();

    EXPECT_TRUE(session.server->UnregisterResource(kUri));
    EXPECT_FALSE(session.server->IsSubscribed(kUri));
    EXPECT_FALSE(session.server->UpdateResourceContent(kUri, textContent("v2")));
    EXPECT_FALSE(session.server->UnregisterResource(kUri));
}

TEST(Resources, TemplatesAreListed) {
    test::Session session;
    ResourceTemplate tmpl;
    tmpl.uriTemplate = "mem://notes/{day}";
    tmpl.name = "notes";
    tmpl.description = "Notes by day";
    session.server->RegisterResourceTemplate(tmpl);
    ASSERT_TRUE(session.ConnectAndInitialize());

    auto fut = session.client->ListResourceTemplates();
    ASSERT_TRUE(isReady(fut));
    auto templates = fut.get();
    ASSERT_EQ(templates.size(), 1u);
    EXPECT_EQ(templates[0], tmpl);
}

} // namespace mcpengine
