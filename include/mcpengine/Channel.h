//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Channel.h
// Purpose: Duplex message channel abstraction consumed by the protocol engine
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>

#include "mcpengine/JSONRPCTypes.h"

namespace mcpengine {

//==========================================================================================================
// TransportClosed
// Purpose: Raised when a channel can no longer carry messages in the requested direction. Also used to
//          fail requests still in flight when a connection ends.
//==========================================================================================================
class TransportClosed : public std::runtime_error {
public:
    TransportClosed() : std::runtime_error("Transport closed") {}
    explicit TransportClosed(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// IChannel
// Purpose: Order-preserving, message-oriented duplex conduit. Messages are structured JSON values; the
//          byte encoding (if any) belongs to the implementation.
//==========================================================================================================
class IChannel {
public:
    virtual ~IChannel() = default;

    //==========================================================================================================
    // Sends one message toward the peer.
    // Args:
    //   message: Structured JSON-RPC envelope.
    // Returns:
    //   (none). Throws TransportClosed when the outgoing direction is closed.
    //==========================================================================================================
    virtual void Send(const JSONValue& message) = 0;

    //==========================================================================================================
    // Blocks until the next inbound message is available.
    // Returns:
    //   The message. Throws TransportClosed once the inbound direction is closed or halted.
    //==========================================================================================================
    virtual JSONValue Receive() = 0;

    //==========================================================================================================
    // Closes the outgoing direction; the peer observes closure after draining queued messages.
    //==========================================================================================================
    virtual void Close() = 0;

    //==========================================================================================================
    // Halts the inbound direction; a pending or future Receive() on this endpoint fails immediately.
    //==========================================================================================================
    virtual void Halt() = 0;

    // True while both directions are usable.
    virtual bool IsOpen() const = 0;

    // Diagnostic identifier shared by both endpoints of a connection.
    virtual std::string GetSessionId() const = 0;
};

} // namespace mcpengine
