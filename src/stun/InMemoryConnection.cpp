//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryConnection.cpp
// Purpose: In-memory connection pair implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "stun/Connection.h"

namespace stun {

class InMemoryConnection::Impl {
public:
    std::atomic<bool> open{true};
    std::string sessionId;
    std::weak_ptr<Impl> peer;

    std::mutex inboxMutex;
    std::condition_variable inboxCondition;
    std::string inbox;
    bool peerClosed{false};

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    void deliver(const std::string& data) {
        {
            std::lock_guard<std::mutex> lock(inboxMutex);
            inbox.append(data);
        }
        inboxCondition.notify_all();
    }

    void markPeerClosed() {
        {
            std::lock_guard<std::mutex> lock(inboxMutex);
            peerClosed = true;
        }
        inboxCondition.notify_all();
    }
};

InMemoryConnection::InMemoryConnection() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryConnection::~InMemoryConnection() {
    FUNC_SCOPE();
    Close();
}

std::pair<std::unique_ptr<InMemoryConnection>, std::unique_ptr<InMemoryConnection>> InMemoryConnection::CreatePair() {
    auto left = std::make_unique<InMemoryConnection>();
    auto right = std::make_unique<InMemoryConnection>();
    left->pImpl->peer = right->pImpl;
    right->pImpl->peer = left->pImpl;
    return {std::move(left), std::move(right)};
}

ReadResult InMemoryConnection::Read(std::string& buffer, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pImpl->inboxMutex);
    pImpl->inboxCondition.wait_for(lock, timeout, [this]() {
        return !pImpl->inbox.empty() || pImpl->peerClosed || !pImpl->open.load();
    });
    if (!pImpl->open.load()) {
        return { ReadStatus::Closed, 0 };
    }
    if (!pImpl->inbox.empty()) {
        const std::size_t n = pImpl->inbox.size();
        buffer.append(pImpl->inbox);
        pImpl->inbox.clear();
        return { ReadStatus::Ok, n };
    }
    if (pImpl->peerClosed) {
        return { ReadStatus::Closed, 0 };
    }
    return { ReadStatus::Timeout, 0 };
}

bool InMemoryConnection::Write(const std::string& data) {
    if (!pImpl->open.load()) {
        return false;
    }
    auto peer = pImpl->peer.lock();
    if (!peer || !peer->open.load()) {
        LOG_DEBUG("InMemoryConnection {}: write with no open peer", pImpl->sessionId);
        return false;
    }
    peer->deliver(data);
    return true;
}

void InMemoryConnection::Close() {
    {
        std::lock_guard<std::mutex> lock(pImpl->inboxMutex);
        if (!pImpl->open.exchange(false)) {
            return;
        }
    }
    pImpl->inboxCondition.notify_all();
    if (auto peer = pImpl->peer.lock()) {
        peer->markPeerClosed();
    }
}

bool InMemoryConnection::IsOpen() const { return pImpl->open.load(); }

std::string InMemoryConnection::RemoteEndpoint() const {
    auto peer = pImpl->peer.lock();
    return peer ? peer->sessionId : std::string("memory-unpaired");
}

} // namespace stun
