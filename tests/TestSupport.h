//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TestSupport.h
// Purpose: Shared helpers for wiring an in-memory client/server pair in tests
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <initializer_list>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "mcpengine/Client.h"
#include "mcpengine/InMemoryChannel.hpp"
#include "mcpengine/Server.h"
#include "mcpengine/async/Task.h"

namespace mcpengine {
namespace test {

constexpr auto kWait = std::chrono::seconds(2);

template <typename T>
bool isReady(std::future<T>& fut) {
    return fut.wait_for(kWait) == std::future_status::ready;
}

inline JSONValue::Object makeObject(std::initializer_list<std::pair<const std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [key, value] : members) {
        obj[key] = std::make_shared<JSONValue>(value);
    }
    return obj;
}

inline std::string stringAt(const JSONValue& value, const std::string& key) {
    const JSONValue* member = value.find(key);
    if (member == nullptr || !member->isString()) {
        return std::string();
    }
    return std::get<std::string>(member->value);
}

inline ClientCapabilities defaultClientCapabilities() {
    ClientCapabilities caps;
    caps.sampling = SamplingCapability{};
    caps.roots = RootsCapability{true};
    return caps;
}

inline ServerCapabilities defaultServerCapabilities() {
    ServerCapabilities caps;
    caps.tools = ToolsCapability{true};
    caps.resources = ResourcesCapability{true, true};
    caps.prompts = PromptsCapability{true};
    caps.logging = LoggingCapability{};
    return caps;
}

//==========================================================================================================
// Connected client/server over an in-memory channel pair. Initialize() runs the handshake and waits
// until the server has seen notifications/initialized.
//==========================================================================================================
struct Session {
    std::shared_ptr<IEventRecorder> recorder;
    std::unique_ptr<Server> server;
    std::unique_ptr<Client> client;

    explicit Session(std::shared_ptr<IEventRecorder> rec = nullptr)
        : recorder(std::move(rec)),
          server(std::make_unique<Server>(ServerInfo{"TestServer", "1.0.0"}, recorder)),
          client(std::make_unique<Client>(ClientInfo{"TestClient", "1.0.0"}, recorder)) {
        server->SetCapabilities(defaultServerCapabilities());
    }

    void Connect() {
        auto [initiator, responder] = InMemoryChannel::CreatePair();
        server->Start(responder);
        client->Connect(initiator);
    }

    bool Initialize() {
        auto fut = client->Initialize(ClientInfo{"TestClient", "1.0.0"}, defaultClientCapabilities());
        if (!isReady(fut)) {
            return false;
        }
        fut.get();
        const auto deadline = std::chrono::steady_clock::now() + kWait;
        while (!server->GetHandshakeResult().has_value()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

    bool ConnectAndInitialize() {
        Connect();
        return Initialize();
    }
};

} // namespace test
} // namespace mcpengine
