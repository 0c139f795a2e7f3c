//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientHandlers.h
// Purpose: Client-side collaborators answering server-initiated elicitation and roots requests
//==========================================================================================================

#pragma once

#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpengine/Protocol.h"

namespace mcpengine {

////////////////////////////////////////// Elicitation //////////////////////////////////////////
//==========================================================================================================
// IElicitationHandler
// Purpose: Obtains accept/decline/cancel plus field values for an elicitation/create request.
//==========================================================================================================
class IElicitationHandler {
public:
    virtual ~IElicitationHandler() = default;

    //==========================================================================================================
    // Args:
    //   request: Prompt text and optional JSON schema of the requested fields.
    // Returns:
    //   Future resolving to the user's (or the policy's) answer.
    //==========================================================================================================
    virtual std::future<ElicitationResponse> Elicit(const ElicitationRequest& request) = 0;
};

// Always answers decline without content.
class DecliningElicitationHandler : public IElicitationHandler {
public:
    std::future<ElicitationResponse> Elicit(const ElicitationRequest& request) override;
};

//==========================================================================================================
// AutoFillElicitationHandler
// Purpose: Accepts every request. Field values come from the configured overrides first, then from the
//          "default" of each property in requestedSchema.properties; properties with neither are omitted.
//==========================================================================================================
class AutoFillElicitationHandler : public IElicitationHandler {
public:
    AutoFillElicitationHandler() = default;
    explicit AutoFillElicitationHandler(std::unordered_map<std::string, JSONValue> overrides);

    std::future<ElicitationResponse> Elicit(const ElicitationRequest& request) override;

private:
    std::unordered_map<std::string, JSONValue> overrides;
};

////////////////////////////////////////// Roots //////////////////////////////////////////
//==========================================================================================================
// IRootsHandler
// Purpose: Returns the client's full current root set for roots/list.
//==========================================================================================================
class IRootsHandler {
public:
    virtual ~IRootsHandler() = default;
    virtual std::future<std::vector<RootDescriptor>> ListRoots() = 0;
};

// Thread-safe root set replaced as a whole.
class MutableRootsHandler : public IRootsHandler {
public:
    MutableRootsHandler() = default;
    explicit MutableRootsHandler(std::vector<RootDescriptor> roots);

    void SetRoots(std::vector<RootDescriptor> roots);
    std::vector<RootDescriptor> GetRoots() const;

    std::future<std::vector<RootDescriptor>> ListRoots() override;

private:
    mutable std::mutex mutex;
    std::vector<RootDescriptor> roots;
};

} // namespace mcpengine
