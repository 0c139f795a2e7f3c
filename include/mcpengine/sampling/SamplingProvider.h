//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SamplingProvider.h
// Purpose: Generation-provider abstraction consulted by the client for sampling/createMessage
//==========================================================================================================

#pragma once

#include <future>

#include "mcpengine/Protocol.h"

namespace mcpengine {

//==========================================================================================================
// ISamplingProvider
// Purpose: Produces a model response for a delegated generation request. Implementations may fail the
//          returned future; the client converts that failure into an error-flavored response so the
//          protocol exchange itself never fails.
//==========================================================================================================
class ISamplingProvider {
public:
    virtual ~ISamplingProvider() = default;

    //==========================================================================================================
    // Generates a response.
    // Args:
    //   request: Messages, optional system prompt, model preferences and token bound.
    // Returns:
    //   Future resolving to the generated response.
    //==========================================================================================================
    virtual std::future<GenerationResponse> CreateMessage(const GenerationRequest& request) = 0;
};

} // namespace mcpengine
