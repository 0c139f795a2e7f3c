//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventRecorder.cpp
// Purpose: In-memory protocol event recorder
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "mcpengine/EventRecorder.h"

namespace mcpengine {

JSONValue ProtocolEvent::ToJSON() const {
    JSONValue::Object obj;
    obj["id"] = std::make_shared<JSONValue>(id);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timestamp.time_since_epoch()).count();
    obj["timestamp"] = std::make_shared<JSONValue>(static_cast<double>(micros) / 1e6);
    obj["role"] = std::make_shared<JSONValue>(role);
    obj["direction"] = std::make_shared<JSONValue>(direction);
    obj["channel"] = channel.has_value() ? std::make_shared<JSONValue>(channel.value()) : std::make_shared<JSONValue>(nullptr);
    obj["payload"] = std::make_shared<JSONValue>(payload);
    return JSONValue{std::move(obj)};
}

ProtocolEvent InMemoryEventRecorder::Record(const std::string& role, const std::string& direction,
                                            const JSONValue& payload, const std::optional<std::string>& channel) {
    ProtocolEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.role = role;
    event.direction = direction;
    event.channel = channel;
    event.payload = payload;
    {
        std::lock_guard<std::mutex> lock(mutex);
        event.id = static_cast<int64_t>(events.size());
        events.push_back(event);
    }
    LOG_DEBUG("Recorded event {} ({} {})", event.id, role, direction);
    return event;
}

std::vector<ProtocolEvent> InMemoryEventRecorder::Query(int64_t sinceId) const {
    std::lock_guard<std::mutex> lock(mutex);
    if (sinceId < -1) {
        sinceId = -1;
    }
    const auto first = static_cast<size_t>(std::min<int64_t>(sinceId + 1, static_cast<int64_t>(events.size())));
    return std::vector<ProtocolEvent>(events.begin() + static_cast<std::ptrdiff_t>(first), events.end());
}

void InMemoryEventRecorder::Reset() {
    std::lock_guard<std::mutex> lock(mutex);
    events.clear();
}

size_t InMemoryEventRecorder::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return events.size();
}

} // namespace mcpengine
