//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Agent.cpp
// Purpose: Transaction registry implementation
//==========================================================================================================

#include <exception>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "stun/Agent.h"

namespace stun {

using errors::AgentStatus;

namespace {

void invokeHandler(const Handler& handler, const Event& event, const TransactionID& id) {
    if (!handler) {
        return;
    }
    try {
        handler(event);
    } catch (const std::exception& e) {
        LOG_ERROR("Agent: handler for transaction {} threw: {}", id.ToHex(), e.what());
    }
}

} // namespace

class Agent::Impl {
public:
    struct PendingTransaction {
        TransactionID id;
        Clock::time_point deadline;
        Handler handler;
    };

    mutable std::mutex mutex;
    std::unordered_map<TransactionID, PendingTransaction, TransactionIDHash> transactions;
    Handler fallbackHandler;
    bool closed{false};
};

Agent::Agent() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
Agent::~Agent() { FUNC_SCOPE(); }

AgentStatus Agent::Register(const TransactionID& id, Handler handler, Clock::time_point deadline) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->closed) {
        return AgentStatus::Closed;
    }
    auto [it, inserted] = pImpl->transactions.try_emplace(id, Impl::PendingTransaction{id, deadline, std::move(handler)});
    if (!inserted) {
        LOG_WARN("Agent: transaction {} already pending; rejecting duplicate registration", id.ToHex());
        return AgentStatus::DuplicateTransaction;
    }
    LOG_DEBUG("Agent: registered transaction {} ({} pending)", id.ToHex(), pImpl->transactions.size());
    return AgentStatus::Ok;
}

AgentStatus Agent::ProcessInbound(const Message& message) {
    FUNC_SCOPE();
    Handler handler;
    bool matched = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->transactions.find(message.transactionId);
        if (it != pImpl->transactions.end()) {
            handler = std::move(it->second.handler);
            pImpl->transactions.erase(it);
            matched = true;
        } else {
            handler = pImpl->fallbackHandler;
        }
    }

    if (!matched && !handler) {
        LOG_DEBUG("Agent: dropping unmatched message {} (no fallback handler)", message.transactionId.ToHex());
        return AgentStatus::Ok;
    }
    Event e;
    e.message = &message;
    invokeHandler(handler, e, message.transactionId);
    return AgentStatus::Ok;
}

AgentStatus Agent::SweepExpired(Clock::time_point now) {
    std::vector<std::pair<TransactionID, Handler>> expired;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            return AgentStatus::Closed;
        }
        for (const auto& [key, tr] : pImpl->transactions) {
            if (tr.id != key) {
                LOG_ERROR("Agent: entry keyed {} carries id {}", key.ToHex(), tr.id.ToHex());
                return AgentStatus::InvariantViolation;
            }
        }
        for (auto it = pImpl->transactions.begin(); it != pImpl->transactions.end();) {
            if (it->second.deadline < now) {
                expired.emplace_back(it->first, std::move(it->second.handler));
                it = pImpl->transactions.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!expired.empty()) {
        LOG_DEBUG("Agent: {} transaction(s) timed out", expired.size());
    }
    Event e;
    e.error = EventError::TimedOut;
    for (const auto& [id, handler] : expired) {
        invokeHandler(handler, e, id);
    }
    return AgentStatus::Ok;
}

AgentStatus Agent::Stop(const TransactionID& id) {
    FUNC_SCOPE();
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            return AgentStatus::Closed;
        }
        auto it = pImpl->transactions.find(id);
        if (it == pImpl->transactions.end()) {
            return AgentStatus::UnknownTransaction;
        }
        handler = std::move(it->second.handler);
        pImpl->transactions.erase(it);
    }
    Event e;
    e.error = EventError::Stopped;
    invokeHandler(handler, e, id);
    return AgentStatus::Ok;
}

void Agent::SetFallbackHandler(Handler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->fallbackHandler = std::move(handler);
}

AgentStatus Agent::Close() {
    FUNC_SCOPE();
    std::unordered_map<TransactionID, Impl::PendingTransaction, TransactionIDHash> pending;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            return AgentStatus::Closed;
        }
        pImpl->closed = true;
        pending.swap(pImpl->transactions);
    }
    if (!pending.empty()) {
        LOG_DEBUG("Agent: closing with {} pending transaction(s)", pending.size());
    }
    Event e;
    e.error = EventError::AgentClosed;
    for (const auto& [id, tr] : pending) {
        invokeHandler(tr.handler, e, id);
    }
    return AgentStatus::Ok;
}

std::size_t Agent::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->transactions.size();
}

bool AgentTestHooks::corruptEntry(Agent& agent, const TransactionID& key, const TransactionID& storedId) {
    std::lock_guard<std::mutex> lock(agent.pImpl->mutex);
    auto it = agent.pImpl->transactions.find(key);
    if (it == agent.pImpl->transactions.end()) {
        return false;
    }
    it->second.id = storedId;
    return true;
}

} // namespace stun
