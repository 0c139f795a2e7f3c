//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LocalModelSamplingProvider.hpp
// Purpose: Sampling provider backed by a llama.cpp-compatible chat-completions HTTP endpoint (Boost.Beast)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "mcpengine/sampling/SamplingProvider.h"

namespace mcpengine {

//==========================================================================================================
// SamplingConfig
// Purpose: Endpoint and generation defaults for LocalModelSamplingProvider.
// Fields:
//   baseUrl: http://host[:port][/prefix]; https is not supported.
//   path: Appended to baseUrl (without its trailing slash).
//   modelName: "model" member of the payload and the fallback model name of responses.
//   temperature: Sampling temperature.
//   maxTokens: Used when the request carries no maxTokens.
//   timeout: Applies to connect and to the request/response exchange separately.
//==========================================================================================================
struct SamplingConfig {
    std::string baseUrl{"http://127.0.0.1:8080"};
    std::string path{"/v1/chat/completions"};
    std::string modelName{"local-llm"};
    double temperature{0.7};
    int64_t maxTokens{512};
    std::chrono::milliseconds timeout{60000};

    //==========================================================================================================
    // Reads MCPENGINE_SAMPLING_BASE_URL, MCPENGINE_SAMPLING_PATH, MCPENGINE_SAMPLING_MODEL,
    // MCPENGINE_SAMPLING_TEMPERATURE, MCPENGINE_SAMPLING_MAX_TOKENS and MCPENGINE_SAMPLING_TIMEOUT_MS.
    // Unset or malformed variables keep the defaults above.
    //==========================================================================================================
    static SamplingConfig FromEnvironment();
};

//==========================================================================================================
// LocalModelSamplingProvider
// Purpose: Posts an OpenAI-style chat-completions payload and converts the reply into a GenerationResponse.
// Notes:
//   - Requests run as coroutines on a private io_context thread.
//   - The returned future never fails: transport errors, HTTP errors and unusable payloads resolve to an
//     assistant response with text "[sampling error] <reason>" and stopReason "error".
//==========================================================================================================
class LocalModelSamplingProvider : public ISamplingProvider {
public:
    explicit LocalModelSamplingProvider(SamplingConfig config = SamplingConfig{});
    ~LocalModelSamplingProvider() override;

    LocalModelSamplingProvider(const LocalModelSamplingProvider&) = delete;
    LocalModelSamplingProvider& operator=(const LocalModelSamplingProvider&) = delete;

    std::future<GenerationResponse> CreateMessage(const GenerationRequest& request) override;

    const SamplingConfig& GetConfig() const;

    // Payload posted for `request`: model, messages (system prompt first), temperature, max_tokens, stream.
    static JSONValue BuildPayload(const SamplingConfig& config, const GenerationRequest& request);

    //==========================================================================================================
    // Converts a chat-completions reply. Accepts choices[0].message or a bare object carrying "content";
    // list content is joined from its text parts and the text is trimmed.
    // Returns:
    //   The response; "[sampling error] Invalid response payload" when no choice can be found.
    //==========================================================================================================
    static GenerationResponse ParseResponse(const SamplingConfig& config, const JSONValue& reply);

    static GenerationResponse ErrorResponse(const SamplingConfig& config, const std::string& reason);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpengine
