//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: Byte-stream connection abstraction consumed by the client read loop
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>

namespace stun {

enum class ReadStatus {
    Ok,       // bytesRead > 0
    Timeout,  // nothing arrived within the timeout; connection still usable
    Closed,   // peer closed or Close() was called
    Error     // I/O failure reported once; datagram sockets keep receiving afterwards
};

struct ReadResult {
    ReadStatus status{ReadStatus::Error};
    std::size_t bytesRead{0};
};

//==========================================================================================================
// IConnection
// Purpose: Bidirectional byte stream. Read is bounded by a timeout so that callers can poll a shutdown
//          signal between reads.
//==========================================================================================================
class IConnection {
public:
    virtual ~IConnection() = default;

    //==========================================================================================================
    // Read
    // Purpose: Waits up to timeout for data and appends whatever arrives to buffer.
    // Args:
    //   buffer: Destination; received bytes are appended.
    //   timeout: Maximum time to wait for the first byte.
    // Returns:
    //   ReadResult with status and number of bytes appended.
    //==========================================================================================================
    virtual ReadResult Read(std::string& buffer, std::chrono::milliseconds timeout) = 0;

    //==========================================================================================================
    // Write
    // Purpose: Writes all of data (one datagram for datagram connections).
    // Returns:
    //   true when everything was written; false on failure or when closed.
    //==========================================================================================================
    virtual bool Write(const std::string& data) = 0;

    // Closes the connection; idempotent. A Read in progress returns Closed.
    virtual void Close() = 0;

    virtual bool IsOpen() const = 0;

    // Diagnostic peer description.
    virtual std::string RemoteEndpoint() const = 0;

    // true when each successful Read returns exactly one datagram; a datagram never continues in the next Read.
    virtual bool IsDatagram() const { return false; }
};

//==========================================================================================================
// DialConnection
// Purpose: Resolves address and connects a socket for the given network.
// Args:
//   network: "tcp", "tcp4", "tcp6", "udp", "udp4" or "udp6".
//   address: "host:port"; IPv6 literals in brackets ("[::1]:3478").
// Returns:
//   Connected IConnection.
// Throws:
//   std::invalid_argument for an unknown network or malformed address;
//   boost::system::system_error when resolving or connecting fails.
//==========================================================================================================
std::unique_ptr<IConnection> DialConnection(const std::string& network, const std::string& address);

// Connects directly to a resolved endpoint. Each connection owns a private io_context and I/O thread.
// Throws boost::system::system_error when connecting fails.
std::unique_ptr<IConnection> ConnectTcp(const boost::asio::ip::tcp::endpoint& remote);
std::unique_ptr<IConnection> ConnectUdp(const boost::asio::ip::udp::endpoint& remote);

//==========================================================================================================
// InMemoryConnection
// Purpose: In-process byte pipe used for tests and embedding. Bytes written on one end of a pair are read
//          from the other.
//==========================================================================================================
class InMemoryConnection : public IConnection {
public:
    InMemoryConnection();
    ~InMemoryConnection() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two connections wired to each other.
    // Returns:
    //   pair(left,right) where writing on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryConnection>, std::unique_ptr<InMemoryConnection>> CreatePair();

    ReadResult Read(std::string& buffer, std::chrono::milliseconds timeout) override;
    bool Write(const std::string& data) override;
    void Close() override;
    bool IsOpen() const override;
    std::string RemoteEndpoint() const override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace stun
