//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: STUN client composing a connection, a transaction registry and the read and sweep loops
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "stun/Agent.h"
#include "stun/ClientOptions.h"
#include "stun/Connection.h"
#include "stun/Event.h"
#include "stun/Message.h"

namespace stun {

//==========================================================================================================
// Client
// Purpose: Owns one connection's transaction space. Construction starts two threads:
//   - read loop: reads from the connection, decodes messages and hands them to the agent;
//   - sweep loop: every timeoutRate evicts transactions whose deadline has passed.
// Both observe one shared shutdown signal raised by Close().
//==========================================================================================================
class Client {
public:
    using ErrorHandler = std::function<void(const std::string& error)>;

    //==========================================================================================================
    // Wraps an established connection and starts the background loops.
    // Args:
    //   connection: Connected transport (ownership taken; must not be null).
    //   options: Loop tunables.
    //   agent: Registry to use; a default Agent with no fallback handler when null.
    // Throws:
    //   std::invalid_argument when connection is null.
    //==========================================================================================================
    explicit Client(std::unique_ptr<IConnection> connection,
                    ClientOptions options = ClientOptions::Defaults(),
                    std::unique_ptr<IAgent> agent = nullptr);

    // Closes the client (see Close()). Destroying the client from one of its loops is fatal.
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    //==========================================================================================================
    // Dial
    // Purpose: Dials (network, address) and wraps the resulting connection.
    // Throws:
    //   std::invalid_argument or boost::system::system_error as DialConnection.
    //==========================================================================================================
    static std::unique_ptr<Client> Dial(const std::string& network, const std::string& address,
                                        ClientOptions options = ClientOptions::Defaults());

    //==========================================================================================================
    // Do
    // Purpose: Registers message.transactionId with handler, then writes the encoded message.
    // Args:
    //   message: Request to send.
    //   handler: Receives the response, or TimedOut / Stopped / AgentClosed.
    //   deadline: Eviction deadline (the overload without it uses now + options.requestTimeout).
    // Returns:
    //   true when registered and written. On a failed write the transaction is stopped and the handler
    //   receives Stopped before Do returns false. A message too large to encode or a rejected
    //   registration returns false without registering or invoking the handler.
    //==========================================================================================================
    bool Do(const Message& message, Handler handler, Clock::time_point deadline);
    bool Do(const Message& message, Handler handler);

    // Handler for inbound messages matching no pending transaction.
    void SetFallbackHandler(Handler handler);

    // Receives read-loop termination and transport error descriptions.
    void SetErrorHandler(ErrorHandler handler);

    //==========================================================================================================
    // Close
    // Purpose: Raises the shutdown signal, joins both loops, closes the agent (pending transactions receive
    //          AgentClosed) and then the connection. Safe to call repeatedly; only the first call acts.
    //          A call from a Handler running on one of the client's loops is logged and ignored.
    //==========================================================================================================
    void Close();

    bool IsClosed() const;

    // false once the read loop has stopped (shutdown, connection closed or fatal dispatch status).
    bool IsReading() const;

    IAgent& GetAgent();

    const ClientOptions& Options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace stun
