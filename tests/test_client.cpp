//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: Client lifecycle, read loop and sweep loop over an in-memory connection pair
//==========================================================================================================

#include <gtest/gtest.h>
#include "stun/Client.h"
#include "stun/Connection.h"
#include "stun/MessageCodec.h"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace stun;
using namespace std::chrono_literals;
using errors::AgentStatus;

namespace {

ClientOptions fastOptions() {
    ClientOptions opts;
    opts.timeoutRate = 10ms;
    opts.readPollInterval = 10ms;
    opts.requestTimeout = 2000ms;
    return opts;
}

Message bindingRequest() {
    Message m;
    m.type = MessageTypes::BindingRequest;
    m.transactionId = TransactionID::Random();
    return m;
}

// Reads from the peer end until one full message decodes or the timeout passes.
std::optional<Message> readMessage(IConnection& peer, std::chrono::milliseconds timeout) {
    auto codec = MakeStunHeaderCodec();
    std::string buffer;
    const auto until = Clock::now() + timeout;
    while (Clock::now() < until) {
        auto r = peer.Read(buffer, 10ms);
        if (r.status == ReadStatus::Closed) {
            return std::nullopt;
        }
        auto d = codec->tryDecode(buffer);
        if (d.status == IMessageCodec::DecodeStatus::Ok) {
            return d.message;
        }
    }
    return std::nullopt;
}

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout) {
    const auto until = Clock::now() + timeout;
    while (Clock::now() < until) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

// Delegates to a real Agent but reports a configurable status from ProcessInbound.
class ScriptedAgent : public IAgent {
public:
    AgentStatus inboundStatus{AgentStatus::Ok};
    Agent inner;

    AgentStatus Register(const TransactionID& id, Handler handler, Clock::time_point deadline) override {
        return inner.Register(id, std::move(handler), deadline);
    }
    AgentStatus ProcessInbound(const Message& message) override {
        if (inboundStatus != AgentStatus::Ok) {
            return inboundStatus;
        }
        return inner.ProcessInbound(message);
    }
    AgentStatus SweepExpired(Clock::time_point now) override { return inner.SweepExpired(now); }
    AgentStatus Stop(const TransactionID& id) override { return inner.Stop(id); }
    void SetFallbackHandler(Handler handler) override { inner.SetFallbackHandler(std::move(handler)); }
    AgentStatus Close() override { return inner.Close(); }
    std::size_t PendingCount() const override { return inner.PendingCount(); }
};

} // namespace

TEST(Client, NullConnectionThrows) {
    EXPECT_THROW(Client(nullptr, fastOptions()), std::invalid_argument);
}

TEST(Client, RequestResponseMatches) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    auto codec = MakeStunHeaderCodec();

    std::promise<std::string> got;
    auto fut = got.get_future();
    const Message request = bindingRequest();
    ASSERT_TRUE(client.Do(request, [&got](const Event& e) {
        got.set_value(e.IsMatch() ? e.message->payload : std::string(toString(e.error)));
    }));

    auto onWire = readMessage(*server, 2000ms);
    ASSERT_TRUE(onWire.has_value());
    EXPECT_EQ(onWire->type, MessageTypes::BindingRequest);
    EXPECT_EQ(onWire->transactionId, request.transactionId);

    Message response;
    response.type = MessageTypes::BindingSuccessResponse;
    response.transactionId = request.transactionId;
    response.payload = "ADDR";
    ASSERT_TRUE(server->Write(codec->encode(response)));

    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "ADDR");
    EXPECT_EQ(client.GetAgent().PendingCount(), 0u);
    client.Close();
}

TEST(Client, ResponsesSplitAcrossWritesAreReassembled) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    auto codec = MakeStunHeaderCodec();

    std::promise<void> got;
    auto fut = got.get_future();
    const Message request = bindingRequest();
    ASSERT_TRUE(client.Do(request, [&got](const Event& e) {
        if (e.IsMatch()) {
            got.set_value();
        }
    }));

    Message response;
    response.type = MessageTypes::BindingSuccessResponse;
    response.transactionId = request.transactionId;
    const std::string frame = codec->encode(response);
    ASSERT_TRUE(server->Write(frame.substr(0, 7)));
    std::this_thread::sleep_for(30ms);
    ASSERT_TRUE(server->Write(frame.substr(7)));
    EXPECT_EQ(fut.wait_for(2s), std::future_status::ready);
    client.Close();
}

TEST(Client, UnansweredRequestTimesOut) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());

    std::promise<EventError> got;
    auto fut = got.get_future();
    const auto start = Clock::now();
    ASSERT_TRUE(client.Do(bindingRequest(), [&got](const Event& e) { got.set_value(e.error); }, start + 50ms));

    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), EventError::TimedOut);
    EXPECT_GE(Clock::now() - start, 50ms);
    client.Close();
}

TEST(Client, UnsolicitedMessageGoesToFallback) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    auto codec = MakeStunHeaderCodec();

    std::promise<uint16_t> got;
    auto fut = got.get_future();
    client.SetFallbackHandler([&got](const Event& e) { got.set_value(e.message->type); });

    Message indication;
    indication.type = MessageTypes::BindingIndication;
    indication.transactionId = TransactionID::Random();
    ASSERT_TRUE(server->Write(codec->encode(indication)));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), MessageTypes::BindingIndication);
    client.Close();
}

TEST(Client, MalformedBytesAreDroppedAndReadingContinues) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    auto codec = MakeStunHeaderCodec();

    std::promise<void> got;
    auto fut = got.get_future();
    const Message request = bindingRequest();
    ASSERT_TRUE(client.Do(request, [&got](const Event& e) {
        if (e.IsMatch()) {
            got.set_value();
        }
    }));

    ASSERT_TRUE(server->Write(std::string(24, '\x7f')));
    std::this_thread::sleep_for(30ms);
    Message response;
    response.type = MessageTypes::BindingSuccessResponse;
    response.transactionId = request.transactionId;
    ASSERT_TRUE(server->Write(codec->encode(response)));

    EXPECT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(client.IsReading());
    client.Close();
}

TEST(Client, CloseIsIdempotentAndNotifiesPending) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());

    std::atomic<int> closedEvents{0};
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(client.Do(bindingRequest(), [&closedEvents](const Event& e) {
            if (e.error == EventError::AgentClosed) {
                closedEvents.fetch_add(1);
            }
        }, Clock::now() + 10s));
    }

    client.Close();
    EXPECT_TRUE(client.IsClosed());
    EXPECT_FALSE(client.IsReading());
    EXPECT_EQ(closedEvents.load(), 3);
    EXPECT_FALSE(server->Write("late"));

    client.Close();
    EXPECT_EQ(closedEvents.load(), 3);
    EXPECT_EQ(client.GetAgent().Close(), AgentStatus::Closed);
}

TEST(Client, OversizedMessageIsRejectedBeforeRegistration) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());

    Message request = bindingRequest();
    request.payload.assign(65536, 'x');
    bool invoked = false;
    EXPECT_FALSE(client.Do(request, [&invoked](const Event&) { invoked = true; }));
    EXPECT_FALSE(invoked);
    EXPECT_EQ(client.GetAgent().PendingCount(), 0u);

    std::string onWire;
    EXPECT_EQ(server->Read(onWire, 30ms).status, ReadStatus::Timeout);
    EXPECT_TRUE(onWire.empty());
    client.Close();
}

TEST(Client, CloseFromLoopHandlerIsIgnored) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    auto codec = MakeStunHeaderCodec();

    std::promise<bool> closedInside;
    auto fut = closedInside.get_future();
    const Message request = bindingRequest();
    ASSERT_TRUE(client.Do(request, [&client, &closedInside](const Event& e) {
        if (e.IsMatch()) {
            client.Close();
            closedInside.set_value(client.IsClosed());
        }
    }));

    Message response;
    response.type = MessageTypes::BindingSuccessResponse;
    response.transactionId = request.transactionId;
    ASSERT_TRUE(server->Write(codec->encode(response)));

    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(fut.get());
    EXPECT_TRUE(client.IsReading());
    client.Close();
    EXPECT_TRUE(client.IsClosed());
}

TEST(Client, DoAfterCloseFails) {
    auto pair = InMemoryConnection::CreatePair();
    Client client(std::move(pair.first), fastOptions());
    client.Close();
    bool invoked = false;
    EXPECT_FALSE(client.Do(bindingRequest(), [&invoked](const Event&) { invoked = true; }));
    EXPECT_FALSE(invoked);
}

TEST(Client, DuplicateTransactionIsRejected) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    const Message request = bindingRequest();
    ASSERT_TRUE(client.Do(request, [](const Event&) {}));
    bool invoked = false;
    EXPECT_FALSE(client.Do(request, [&invoked](const Event&) { invoked = true; }));
    EXPECT_FALSE(invoked);
    EXPECT_EQ(client.GetAgent().PendingCount(), 1u);
    client.Close();
}

TEST(Client, FailedWriteStopsTransaction) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    server->Close();

    EventError seen = EventError::None;
    EXPECT_FALSE(client.Do(bindingRequest(), [&seen](const Event& e) { seen = e.error; }));
    EXPECT_EQ(seen, EventError::Stopped);
    EXPECT_EQ(client.GetAgent().PendingCount(), 0u);
    client.Close();
}

TEST(Client, PeerCloseStopsReadLoopAndReportsError) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());

    std::mutex mu;
    std::vector<std::string> errors;
    client.SetErrorHandler([&](const std::string& err) {
        std::lock_guard<std::mutex> lock(mu);
        errors.push_back(err);
    });
    server->Close();

    ASSERT_TRUE(waitUntil([&] { return !client.IsReading(); }, 2000ms));
    {
        std::lock_guard<std::mutex> lock(mu);
        ASSERT_EQ(errors.size(), 1u);
        EXPECT_EQ(errors[0], "Client: connection closed");
    }
    // Registry stays usable after the read loop ends; pending requests still time out.
    EXPECT_FALSE(client.IsClosed());
    std::promise<EventError> got;
    auto fut = got.get_future();
    const TransactionID id = TransactionID::Random();
    ASSERT_EQ(client.GetAgent().Register(id, [&got](const Event& e) { got.set_value(e.error); }, Clock::now() + 20ms),
              AgentStatus::Ok);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), EventError::TimedOut);
    client.Close();
}

TEST(Client, DispatchFailureStopsReadLoop) {
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    auto agent = std::make_unique<ScriptedAgent>();
    agent->inboundStatus = AgentStatus::InvariantViolation;
    Client client(std::move(pair.first), fastOptions(), std::move(agent));
    auto codec = MakeStunHeaderCodec();

    std::promise<std::string> got;
    auto fut = got.get_future();
    client.SetErrorHandler([&got](const std::string& err) { got.set_value(err); });

    Message m;
    m.type = MessageTypes::BindingSuccessResponse;
    m.transactionId = TransactionID::Random();
    ASSERT_TRUE(server->Write(codec->encode(m)));

    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "Client: inbound dispatch failed: agent invariant violation");
    EXPECT_TRUE(waitUntil([&] { return !client.IsReading(); }, 2000ms));
    client.Close();
}

TEST(Client, ConcurrentRequestsEachGetOneOutcome) {
    constexpr int kRequests = 200;
    auto pair = InMemoryConnection::CreatePair();
    auto server = std::move(pair.second);
    Client client(std::move(pair.first), fastOptions());
    auto codec = MakeStunHeaderCodec();

    std::vector<std::atomic<int>> outcomes(kRequests);
    std::vector<Message> requests;
    for (int i = 0; i < kRequests; ++i) {
        requests.push_back(bindingRequest());
        // Odd requests are never answered and expire; even ones are answered.
        const auto deadline = (i % 2 == 0) ? Clock::now() + 10s : Clock::now() + 20ms;
        ASSERT_TRUE(client.Do(requests.back(), [&outcomes, i](const Event&) { outcomes[i].fetch_add(1); }, deadline));
    }
    for (int i = 0; i < kRequests; i += 2) {
        Message response;
        response.type = MessageTypes::BindingSuccessResponse;
        response.transactionId = requests[i].transactionId;
        ASSERT_TRUE(server->Write(codec->encode(response)));
    }

    ASSERT_TRUE(waitUntil([&] { return client.GetAgent().PendingCount() == 0; }, 3000ms));
    client.Close();
    for (int i = 0; i < kRequests; ++i) {
        EXPECT_EQ(outcomes[i].load(), 1) << "request " << i;
    }
}
