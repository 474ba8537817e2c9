//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Event.h
// Purpose: Transaction outcome events and the handler capability receiving them
//==========================================================================================================

#pragma once

#include <functional>

#include "stun/Message.h"

namespace stun {

// Why a transaction ended without a response.
enum class EventError {
    None,
    TimedOut,    // deadline passed before a response arrived
    Stopped,     // caller stopped the transaction (or the request could not be written)
    AgentClosed  // registry closed while the transaction was pending
};

//==========================================================================================================
// Event
// Purpose: Ephemeral value delivered to a Handler. Either a match (message set, error None) or a failure
//          (message null). The message pointer is only valid for the duration of the handler call.
//==========================================================================================================
struct Event {
    const Message* message{nullptr};
    EventError error{EventError::None};

    bool IsMatch() const { return message != nullptr && error == EventError::None; }
};

// Single-operation capability invoked with a transaction outcome. Used both per transaction and as the
// fallback for inbound messages without a registered transaction.
using Handler = std::function<void(const Event&)>;

inline const char* toString(EventError e) {
    switch (e) {
        case EventError::None: return "none";
        case EventError::TimedOut: return "transaction is timed out";
        case EventError::Stopped: return "transaction is stopped";
        case EventError::AgentClosed: return "agent closed";
    }
    return "unknown";
}

} // namespace stun
