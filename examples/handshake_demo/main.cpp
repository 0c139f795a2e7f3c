//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Runs one client/server handshake over an in-memory channel pair and prints its outcome
//==========================================================================================================

#include <chrono>
#include <cstring>
#include <future>
#include <iostream>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpengine/Client.h"
#include "mcpengine/InMemoryChannel.hpp"
#include "mcpengine/Server.h"

using namespace mcpengine;

static const char* kDefaultInstructions = "Review capabilities and proceed with sampling delegation when ready.";

//==========================================================================================================
// Returns the value following `key` (e.g. "--instructions <text>"), or "key=value".
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        if (a == key && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
        if (a.rfind(key + "=", 0) == 0) {
            return a.substr(key.size() + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && std::strcmp(argv[i], flag) == 0) {
            return true;
        }
    }
    return false;
}

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--instructions <text>] [--help]\n"
              << "  --instructions <text>  Instructions the server returns during initialization\n"
              << "  --help                 Show this message\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(Logger::Level::WARN);
    Logger::configureFromEnvironment();

    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }
    const std::string instructions = getArgValue(argc, argv, "--instructions").value_or(kDefaultInstructions);

    ServerCapabilities serverCaps;
    serverCaps.logging = LoggingCapability{};
    serverCaps.prompts = PromptsCapability{true};
    serverCaps.resources = ResourcesCapability{true, true};
    serverCaps.tools = ToolsCapability{true};

    ClientCapabilities clientCaps;
    clientCaps.sampling = SamplingCapability{};
    clientCaps.roots = RootsCapability{true};
    clientCaps.elicitation = ElicitationCapability{};

    ServerFactory serverFactory;
    auto server = serverFactory.CreateServer(ServerInfo{"ExampleServer", "0.1.0"});
    server->SetCapabilities(serverCaps);
    server->SetInstructions(instructions);

    ClientInfo clientInfo{"ExampleClient", "0.1.0"};
    ClientFactory clientFactory;
    auto client = clientFactory.CreateClient(clientInfo);

    auto [clientChannel, serverChannel] = InMemoryChannel::CreatePair();
    server->Start(serverChannel);
    client->Connect(clientChannel);

    HandshakeResult result;
    try {
        auto fut = client->Initialize(clientInfo, clientCaps);
        if (fut.wait_for(std::chrono::seconds(10)) != std::future_status::ready) {
            LOG_ERROR("Handshake timed out");
            return 1;
        }
        result = fut.get();
    } catch (const std::exception& e) {
        LOG_ERROR("Handshake failed: {}", e.what());
        return 1;
    }

    JSONValue::Object summary;
    summary["protocolVersion"] = std::make_shared<JSONValue>(result.protocolVersion);
    summary["client"] = std::make_shared<JSONValue>(result.clientInfo.ToJSON());
    summary["server"] = std::make_shared<JSONValue>(result.serverInfo.ToJSON());
    summary["clientCapabilities"] = std::make_shared<JSONValue>(result.clientCapabilities.ToJSON());
    summary["serverCapabilities"] = std::make_shared<JSONValue>(result.serverCapabilities.ToJSON());
    summary["instructions"] = std::make_shared<JSONValue>(result.instructions.value_or(""));

    std::cout << "Handshake succeeded between " << result.clientInfo.name << " and " << result.serverInfo.name
              << ".\n";
    std::cout << SerializeJSON(JSONValue{std::move(summary)}, 2) << std::endl;

    client->Close();
    server->Stop();
    return 0;
}
