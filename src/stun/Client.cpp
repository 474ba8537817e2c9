//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: STUN client implementation: lifecycle, read loop and sweep loop
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "stun/Client.h"
#include "stun/MessageCodec.h"
#include "stun/errors/Errors.h"

namespace stun {

using errors::AgentStatus;
using errors::ErrorCategory;

class Client::Impl {
public:
    std::unique_ptr<IConnection> connection;
    ClientOptions options;
    std::unique_ptr<IAgent> agent;
    std::unique_ptr<IMessageCodec> codec;

    // Single broadcast shutdown signal observed by both loops
    std::stop_source shutdown;
    std::jthread readerThread;
    std::jthread sweepThread;
    std::atomic<bool> closed{false};
    std::atomic<bool> reading{false};

    std::mutex sweepMutex;
    std::condition_variable_any sweepCondition;

    std::mutex errorMutex;
    Client::ErrorHandler errorHandler;

    Impl(std::unique_ptr<IConnection> conn, ClientOptions opts, std::unique_ptr<IAgent> ag)
        : connection(std::move(conn)),
          options(std::move(opts)),
          agent(ag ? std::move(ag) : std::make_unique<Agent>()),
          codec(MakeStunHeaderCodec(options.maxMessageSize)) {}

    void reportError(const std::string& msg) {
        Client::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(msg);
        }
    }

    void start() {
        reading = true;
        readerThread = std::jthread([this, st = shutdown.get_token()]() { readLoop(st); });
        sweepThread = std::jthread([this, st = shutdown.get_token()]() { sweepLoop(st); });
    }

    bool onLoopThread() const {
        const auto self = std::this_thread::get_id();
        return self == readerThread.get_id() || self == sweepThread.get_id();
    }

    // Decodes every complete message in buffer. Returns false when dispatch reported a fatal status.
    bool drainMessages(std::string& buffer) {
        while (!buffer.empty()) {
            IMessageCodec::DecodeResult r = codec->tryDecode(buffer);
            if (r.status == IMessageCodec::DecodeStatus::Incomplete) {
                return true;
            }
            if (r.status != IMessageCodec::DecodeStatus::Ok || !r.message.has_value()) {
                const std::size_t drop = (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) ? r.bytesConsumed : buffer.size();
                LOG_WARN("Client: dropping {} undecodable byte(s) from {}", drop, connection->RemoteEndpoint());
                buffer.erase(0, drop);
                continue;
            }
            buffer.erase(0, r.bytesConsumed);
            const AgentStatus status = agent->ProcessInbound(*r.message);
            if (status != AgentStatus::Ok) {
                LOG_ERROR("Client: inbound dispatch failed ({}); read loop stopping", errors::toString(status));
                reportError("Client: inbound dispatch failed: " + errors::toString(status));
                return false;
            }
        }
        return true;
    }

    void readLoop(std::stop_token st) {
        std::string buffer;
        while (!st.stop_requested()) {
            const ReadResult r = connection->Read(buffer, options.readPollInterval);
            if (r.status == ReadStatus::Timeout) {
                continue;
            }
            if (r.status == ReadStatus::Closed) {
                if (!st.stop_requested()) {
                    LOG_INFO("Client: connection to {} closed; read loop stopping", connection->RemoteEndpoint());
                    reportError("Client: connection closed");
                }
                break;
            }
            if (r.status == ReadStatus::Error) {
                LOG_WARN("Client: read error on {}; continuing", connection->RemoteEndpoint());
                reportError("Client: read error");
                continue;
            }
            if (!drainMessages(buffer)) {
                break;
            }
            if (connection->IsDatagram() && !buffer.empty()) {
                // A datagram holds whole messages; a trailing partial one never completes
                LOG_WARN("Client: dropping {} byte(s) of truncated datagram from {}", buffer.size(), connection->RemoteEndpoint());
                buffer.clear();
            }
        }
        reading = false;
        LOG_DEBUG("Client: read loop stopped");
    }

    void sweepLoop(std::stop_token st) {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(sweepMutex);
                // Returns early only when stop is requested
                sweepCondition.wait_for(lock, st, options.timeoutRate, []() { return false; });
            }
            if (st.stop_requested()) {
                break;
            }
            const AgentStatus status = agent->SweepExpired(Clock::now());
            switch (errors::errorCategoryFromStatus(status)) {
                case ErrorCategory::Success:
                    break;
                case ErrorCategory::Terminal:
                    LOG_DEBUG("Client: agent closed; sweep loop stopping");
                    return;
                case ErrorCategory::Rejected:
                case ErrorCategory::Fatal:
                    LOG_FATAL("Client: transaction sweep failed: {}", errors::toString(status));
            }
        }
        LOG_DEBUG("Client: sweep loop stopped");
    }
};

Client::Client(std::unique_ptr<IConnection> connection, ClientOptions options, std::unique_ptr<IAgent> agent) {
    FUNC_SCOPE();
    if (!connection) {
        throw std::invalid_argument("Client: connection must not be null");
    }
    pImpl = std::make_unique<Impl>(std::move(connection), std::move(options), std::move(agent));
    LOG_INFO("Client: starting on {} (sweep every {} ms)", pImpl->connection->RemoteEndpoint(),
             static_cast<long long>(pImpl->options.timeoutRate.count()));
    pImpl->start();
}

Client::~Client() {
    FUNC_SCOPE();
    if (pImpl->onLoopThread()) {
        LOG_FATAL("Client: destroyed from one of its own loop threads");
    }
    Close();
}

std::unique_ptr<Client> Client::Dial(const std::string& network, const std::string& address, ClientOptions options) {
    FUNC_SCOPE();
    auto conn = DialConnection(network, address);
    return std::make_unique<Client>(std::move(conn), std::move(options));
}

bool Client::Do(const Message& message, Handler handler, Clock::time_point deadline) {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        LOG_DEBUG("Client: Do called after Close");
        return false;
    }
    std::string frame;
    try {
        frame = pImpl->codec->encode(message);
    } catch (const std::length_error& e) {
        LOG_WARN("Client: cannot encode transaction {}: {}", message.transactionId.ToHex(), e.what());
        return false;
    }
    const AgentStatus reg = pImpl->agent->Register(message.transactionId, std::move(handler), deadline);
    if (reg != AgentStatus::Ok) {
        LOG_WARN("Client: cannot register transaction {}: {}", message.transactionId.ToHex(), errors::toString(reg));
        return false;
    }
    if (!pImpl->connection->Write(frame)) {
        LOG_WARN("Client: write of transaction {} failed; stopping it", message.transactionId.ToHex());
        const AgentStatus stopped = pImpl->agent->Stop(message.transactionId);
        if (stopped != AgentStatus::Ok) {
            LOG_DEBUG("Client: transaction {} already completed ({})", message.transactionId.ToHex(), errors::toString(stopped));
        }
        return false;
    }
    return true;
}

bool Client::Do(const Message& message, Handler handler) {
    return Do(message, std::move(handler), Clock::now() + pImpl->options.requestTimeout);
}

void Client::SetFallbackHandler(Handler handler) {
    FUNC_SCOPE();
    pImpl->agent->SetFallbackHandler(std::move(handler));
}

void Client::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->errorMutex);
    pImpl->errorHandler = std::move(handler);
}

void Client::Close() {
    FUNC_SCOPE();
    if (pImpl->onLoopThread()) {
        LOG_ERROR("Client: Close called from a loop thread handler; ignored");
        return;
    }
    if (pImpl->closed.exchange(true)) {
        return;
    }
    LOG_INFO("Client: closing connection to {}", pImpl->connection->RemoteEndpoint());
    pImpl->shutdown.request_stop();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    if (pImpl->sweepThread.joinable()) {
        pImpl->sweepThread.join();
    }
    const AgentStatus status = pImpl->agent->Close();
    if (status != AgentStatus::Ok) {
        LOG_DEBUG("Client: agent already closed ({})", errors::toString(status));
    }
    pImpl->connection->Close();
}

bool Client::IsClosed() const { return pImpl->closed.load(); }
bool Client::IsReading() const { return pImpl->reading.load(); }
IAgent& Client::GetAgent() { return *pImpl->agent; }
const ClientOptions& Client::Options() const { return pImpl->options; }

} // namespace stun
