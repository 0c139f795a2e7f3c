//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryChannel.cpp
// Purpose: In-memory duplex channel implementation
//==========================================================================================================

#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "mcpengine/InMemoryChannel.hpp"

namespace mcpengine {

// One direction of the pair. `closed` is set by the writer and lets the reader drain what is queued;
// `halted` is set by the reader and takes effect immediately.
class InMemoryChannel::Pipe {
public:
    void push(const JSONValue& message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed || halted) {
                throw TransportClosed();
            }
            queue.push_back(message);
        }
        cv.notify_one();
    }

    JSONValue pop() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this]() { return halted || closed || !queue.empty(); });
        if (halted || queue.empty()) {
            throw TransportClosed();
        }
        JSONValue message = std::move(queue.front());
        queue.pop_front();
        return message;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    void halt() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            halted = true;
        }
        cv.notify_all();
    }

    bool usable() const {
        std::lock_guard<std::mutex> lock(mutex);
        return !closed && !halted;
    }

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<JSONValue> queue;
    bool closed{false};
    bool halted{false};
};

InMemoryChannel::InMemoryChannel(PairToken, std::shared_ptr<Pipe> in, std::shared_ptr<Pipe> out, std::string id)
    : incoming(std::move(in)), outgoing(std::move(out)), sessionId(std::move(id)) {}

InMemoryChannel::~InMemoryChannel() = default;

std::pair<std::shared_ptr<InMemoryChannel>, std::shared_ptr<InMemoryChannel>> InMemoryChannel::CreatePair() {
    FUNC_SCOPE();
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(1000, 9999);
    const std::string sessionId = "memory-" + std::to_string(dis(gen));

    auto initiatorToResponder = std::make_shared<Pipe>();
    auto responderToInitiator = std::make_shared<Pipe>();
    auto initiator = std::make_shared<InMemoryChannel>(PairToken{}, responderToInitiator, initiatorToResponder, sessionId);
    auto responder = std::make_shared<InMemoryChannel>(PairToken{}, initiatorToResponder, responderToInitiator, sessionId);
    LOG_DEBUG("Created in-memory channel pair {}", sessionId);
    return {initiator, responder};
}

void InMemoryChannel::Send(const JSONValue& message) {
    outgoing->push(message);
}

JSONValue InMemoryChannel::Receive() {
    return incoming->pop();
}

void InMemoryChannel::Close() {
    LOG_DEBUG("In-memory channel {} closing outgoing direction", sessionId);
    outgoing->close();
}

void InMemoryChannel::Halt() {
    LOG_DEBUG("In-memory channel {} halting inbound direction", sessionId);
    incoming->halt();
}

bool InMemoryChannel::IsOpen() const {
    return incoming->usable() && outgoing->usable();
}

std::string InMemoryChannel::GetSessionId() const {
    return sessionId;
}

} // namespace mcpengine
