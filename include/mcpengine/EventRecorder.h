//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventRecorder.h
// Purpose: Injectable observation store for protocol traffic
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

//==========================================================================================================
// ProtocolEvent
// Purpose: One observed message.
// Fields:
//   id: 0-based, strictly increasing per recorder.
//   timestamp: Wall-clock time of recording.
//   role: "client" or "server" (the recording peer).
//   direction: "inbound" or "outbound".
//   channel: Optional channel/session label.
//   payload: The structured envelope.
//==========================================================================================================
struct ProtocolEvent {
    int64_t id{0};
    std::chrono::system_clock::time_point timestamp;
    std::string role;
    std::string direction;
    std::optional<std::string> channel;
    JSONValue payload;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// IEventRecorder
// Purpose: Recorder interface handed to clients and servers. Implementations must be thread-safe.
//==========================================================================================================
class IEventRecorder {
public:
    virtual ~IEventRecorder() = default;

    //==========================================================================================================
    // Records one event.
    // Args:
    //   role: Recording peer role.
    //   direction: "inbound" or "outbound".
    //   payload: Message as sent or received.
    //   channel: Optional channel label.
    // Returns:
    //   The stored event including its assigned id.
    //==========================================================================================================
    virtual ProtocolEvent Record(const std::string& role, const std::string& direction,
                                 const JSONValue& payload,
                                 const std::optional<std::string>& channel = std::nullopt) = 0;

    //==========================================================================================================
    // Returns every event whose id is greater than sinceId, oldest first.
    // Args:
    //   sinceId: Exclusive lower bound; -1 (or anything lower) returns all events.
    //==========================================================================================================
    virtual std::vector<ProtocolEvent> Query(int64_t sinceId = -1) const = 0;
};

//==========================================================================================================
// InMemoryEventRecorder
// Purpose: Mutex-guarded vector-backed recorder. Lifetime is owned by whoever creates it.
//==========================================================================================================
class InMemoryEventRecorder : public IEventRecorder {
public:
    ProtocolEvent Record(const std::string& role, const std::string& direction,
                         const JSONValue& payload,
                         const std::optional<std::string>& channel = std::nullopt) override;
    std::vector<ProtocolEvent> Query(int64_t sinceId = -1) const override;

    // Drops all stored events; ids restart at 0.
    void Reset();
    size_t Size() const;

private:
    mutable std::mutex mutex;
    std::vector<ProtocolEvent> events;
};

} // namespace mcpengine
