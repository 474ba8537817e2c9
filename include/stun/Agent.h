//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Agent.h
// Purpose: Transaction registry matching inbound messages to pending requests and evicting them on timeout
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "stun/Event.h"
#include "stun/Message.h"
#include "stun/TransactionID.h"
#include "stun/errors/Errors.h"

namespace stun {

using Clock = std::chrono::steady_clock;

//==========================================================================================================
// IAgent
// Purpose: Registry contract used by the Client read and sweep loops.
//==========================================================================================================
class IAgent {
public:
    virtual ~IAgent() = default;

    //==========================================================================================================
    // Register
    // Purpose: Adds a pending transaction.
    // Args:
    //   id: Transaction identifier carried by the request.
    //   handler: Invoked exactly once with the outcome (match, timeout, stop or close).
    //   deadline: Transaction is evicted by the first sweep whose time is strictly after this point.
    // Returns:
    //   Ok; Closed after Close(); DuplicateTransaction when id is already pending (existing entry kept).
    //==========================================================================================================
    virtual errors::AgentStatus Register(const TransactionID& id, Handler handler, Clock::time_point deadline) = 0;

    //==========================================================================================================
    // ProcessInbound
    // Purpose: Matches an inbound message against pending transactions. The matched entry is removed and its
    //          handler invoked; unmatched messages go to the fallback handler when one is set.
    // Returns:
    //   Ok. Any other status is fatal for the read loop.
    //==========================================================================================================
    virtual errors::AgentStatus ProcessInbound(const Message& message) = 0;

    //==========================================================================================================
    // SweepExpired
    // Purpose: Removes every transaction whose deadline is strictly before now and notifies each handler
    //          with a TimedOut event after the registry lock is released.
    // Returns:
    //   Ok (also when nothing expired); Closed after Close(); InvariantViolation on corrupted bookkeeping.
    //==========================================================================================================
    virtual errors::AgentStatus SweepExpired(Clock::time_point now) = 0;

    //==========================================================================================================
    // Stop
    // Purpose: Cancels a pending transaction; its handler receives a Stopped event.
    // Returns:
    //   Ok; UnknownTransaction when not pending; Closed after Close().
    //==========================================================================================================
    virtual errors::AgentStatus Stop(const TransactionID& id) = 0;

    // Handler for inbound messages with no pending transaction. An empty handler drops them.
    virtual void SetFallbackHandler(Handler handler) = 0;

    //==========================================================================================================
    // Close
    // Purpose: Marks the registry closed and notifies all still-pending handlers with AgentClosed.
    // Returns:
    //   Ok on the first call; Closed on subsequent calls.
    //==========================================================================================================
    virtual errors::AgentStatus Close() = 0;

    virtual std::size_t PendingCount() const = 0;
};

//==========================================================================================================
// Agent
// Purpose: Default IAgent. One mutex guards the pending map; handlers always run outside it so they may
//          re-enter the registry (for example to register a retry from a timeout handler).
//==========================================================================================================
class Agent : public IAgent {
public:
    Agent();
    ~Agent() override;

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    errors::AgentStatus Register(const TransactionID& id, Handler handler, Clock::time_point deadline) override;
    errors::AgentStatus ProcessInbound(const Message& message) override;
    errors::AgentStatus SweepExpired(Clock::time_point now) override;
    errors::AgentStatus Stop(const TransactionID& id) override;
    void SetFallbackHandler(Handler handler) override;
    errors::AgentStatus Close() override;
    std::size_t PendingCount() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct AgentTestHooks;
};

// Test-only access to internal bookkeeping.
struct AgentTestHooks {
    // Rewrites the stored id of a pending entry so the next sweep detects an inconsistency.
    static bool corruptEntry(Agent& agent, const TransactionID& key, const TransactionID& storedId);
};

} // namespace stun
