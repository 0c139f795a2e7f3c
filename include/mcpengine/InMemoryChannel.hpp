//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryChannel.hpp
// Purpose: In-memory duplex channel pair for tests and embedding
//==========================================================================================================
#pragma once

#include "mcpengine/Channel.h"
#include <memory>
#include <utility>

namespace mcpengine {

//==========================================================================================================
// InMemoryChannel
// Purpose: In-process channel backed by two FIFO queues, one per direction. Implements IChannel and
//          delivers structured messages to its paired endpoint without copying through text.
//==========================================================================================================
class InMemoryChannel : public IChannel {
    class Pipe;
    // Restricts construction to CreatePair while still allowing std::make_shared.
    struct PairToken {
        explicit PairToken() = default;
    };

public:
    InMemoryChannel(PairToken, std::shared_ptr<Pipe> incoming, std::shared_ptr<Pipe> outgoing, std::string sessionId);
    ~InMemoryChannel() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two endpoints wired to each other.
    // Returns:
    //   pair(initiator, responder) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::shared_ptr<InMemoryChannel>, std::shared_ptr<InMemoryChannel>> CreatePair();

    ////////////////////////////////////////// IChannel //////////////////////////////////////////
    void Send(const JSONValue& message) override;
    JSONValue Receive() override;
    void Close() override;
    void Halt() override;
    bool IsOpen() const override;
    std::string GetSessionId() const override;

private:
    std::shared_ptr<Pipe> incoming;
    std::shared_ptr<Pipe> outgoing;
    std::string sessionId;
};

} // namespace mcpengine
