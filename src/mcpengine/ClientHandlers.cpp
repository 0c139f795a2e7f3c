//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientHandlers.cpp
// Purpose: Stock elicitation and roots handlers
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpengine/ClientHandlers.h"
#include "mcpengine/async/Task.h"

namespace mcpengine {

std::future<ElicitationResponse> DecliningElicitationHandler::Elicit(const ElicitationRequest& request) {
    LOG_DEBUG("Declining elicitation: {}", request.message);
    ElicitationResponse response;
    response.action = ElicitationAction::Decline;
    return async::makeReadyFuture(std::move(response));
}

AutoFillElicitationHandler::AutoFillElicitationHandler(std::unordered_map<std::string, JSONValue> values)
    : overrides(std::move(values)) {}

std::future<ElicitationResponse> AutoFillElicitationHandler::Elicit(const ElicitationRequest& request) {
    ElicitationResponse response;
    response.action = ElicitationAction::Accept;
    if (request.requestedSchema.has_value()) {
        if (const JSONValue* props = request.requestedSchema->find("properties"); props && props->isObject()) {
            for (const auto& [field, schema] : std::get<JSONValue::Object>(props->value)) {
                if (!schema) {
                    continue;
                }
                if (const JSONValue* def = schema->find("default")) {
                    response.content[field] = *def;
                }
            }
        }
    }
    for (const auto& [field, value] : overrides) {
        response.content[field] = value;
    }
    LOG_DEBUG("Auto-filled elicitation with {} field(s)", response.content.size());
    return async::makeReadyFuture(std::move(response));
}

MutableRootsHandler::MutableRootsHandler(std::vector<RootDescriptor> initial)
    : roots(std::move(initial)) {}

void MutableRootsHandler::SetRoots(std::vector<RootDescriptor> replacement) {
    std::lock_guard<std::mutex> lock(mutex);
    roots = std::move(replacement);
}

std::vector<RootDescriptor> MutableRootsHandler::GetRoots() const {
    std::lock_guard<std::mutex> lock(mutex);
    return roots;
}

std::future<std::vector<RootDescriptor>> MutableRootsHandler::ListRoots() {
    return async::makeReadyFuture(GetRoots());
}

} // namespace mcpengine
