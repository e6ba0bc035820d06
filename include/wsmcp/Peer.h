//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Peer.h
// Purpose: Reply channel back to the client that sent a message
//==========================================================================================================

#pragma once

#include <string>

namespace wsmcp {

//==========================================================================================================
// IPeer
// Purpose: What the RequestDispatcher needs from a connection. Session implements it.
//==========================================================================================================
class IPeer {
public:
    virtual ~IPeer() = default;

    // Frames and queues one serialized JSON message. A closed peer ignores the call.
    virtual void Send(const std::string& json) = 0;

    virtual bool IsOpen() const = 0;

    // Stable identifier used in logs.
    virtual const std::string& GetSessionId() const = 0;
};

} // namespace wsmcp
