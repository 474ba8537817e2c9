//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/stun/AsioConnection.cpp
// Purpose: TCP/UDP connections using Boost.Asio with a private io_context and I/O thread
//==========================================================================================================

#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "stun/Connection.h"

namespace stun {
namespace net = boost::asio;
using tcp = net::ip::tcp;
using udp = net::ip::udp;

namespace {

bool isClosedError(const boost::system::error_code& ec) {
    return ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::connection_aborted ||
           ec == net::error::not_connected ||
           ec == net::error::bad_descriptor ||
           ec == net::error::operation_aborted;
}

template <typename Protocol>
class AsioConnection : public IConnection {
public:
    static constexpr bool IsStream = std::is_same_v<Protocol, tcp>;

    AsioConnection() : socket(ioc) {}

    ~AsioConnection() override {
        Close();
    }

    template <typename EndpointSequence>
    void connect(const EndpointSequence& endpoints) {
        // Throws boost::system::system_error when no endpoint accepts the connection
        auto ep = net::connect(socket, endpoints);
        std::ostringstream oss;
        oss << ep;
        remote = oss.str();
    }

    void start() {
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(ioc.get_executor());
        startReceive();
        ioThread = std::thread([this]() {
            ioc.run();
        });
        LOG_DEBUG("AsioConnection: connected to {} ({})", remote, IsStream ? "tcp" : "udp");
    }

    ReadResult Read(std::string& buffer, std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lk(inboxMutex);
        inboxCv.wait_for(lk, timeout, [this]{ return !inbox.empty() || pendingError || peerClosed; });
        if (!inbox.empty()) {
            std::size_t n = 0;
            if constexpr (IsStream) {
                for (const auto& chunk : inbox) {
                    buffer.append(chunk);
                    n += chunk.size();
                }
                inbox.clear();
            } else {
                // One datagram per read
                n = inbox.front().size();
                buffer.append(inbox.front());
                inbox.pop_front();
            }
            return { ReadStatus::Ok, n };
        }
        if (pendingError) {
            pendingError = false;
            return { ReadStatus::Error, 0 };
        }
        if (peerClosed) {
            return { ReadStatus::Closed, 0 };
        }
        return { ReadStatus::Timeout, 0 };
    }

    bool Write(const std::string& data) override {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        if (!open.load()) {
            return false;
        }
        std::promise<bool> done;
        auto fut = done.get_future();
        net::post(ioc, [this, &data, &done]() {
            boost::system::error_code ec;
            if constexpr (IsStream) {
                net::write(socket, net::buffer(data), ec);
            } else {
                socket.send(net::buffer(data), 0, ec);
            }
            if (ec) {
                LOG_WARN("AsioConnection: write to {} failed: {}", remote, ec.message());
            }
            done.set_value(!ec);
        });
        return fut.get();
    }

    void Close() override {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        if (!open.exchange(false)) {
            return;
        }
        if (!ioThread.joinable()) {
            boost::system::error_code ec;
            socket.close(ec);
            return;
        }
        net::post(ioc, [this]() {
            boost::system::error_code ec;
            if constexpr (IsStream) {
                socket.shutdown(tcp::socket::shutdown_both, ec);
            }
            socket.close(ec);
        });
        workGuard.reset();
        ioThread.join();
        {
            std::lock_guard<std::mutex> lk(inboxMutex);
            peerClosed = true;
        }
        inboxCv.notify_all();
        LOG_DEBUG("AsioConnection: closed connection to {}", remote);
    }

    bool IsOpen() const override { return open.load(); }
    std::string RemoteEndpoint() const override { return remote; }
    bool IsDatagram() const override { return !IsStream; }

private:
    void startReceive() {
        auto handler = [this](const boost::system::error_code& ec, std::size_t n) {
            bool again = false;
            {
                std::lock_guard<std::mutex> lk(inboxMutex);
                if (!ec) {
                    if (!IsStream && n >= scratch.size()) {
                        LOG_WARN("AsioConnection: dropping oversized datagram from {}", remote);
                    } else if (n > 0) {
                        inbox.emplace_back(scratch.data(), n);
                    }
                    again = true;
                } else if (isClosedError(ec)) {
                    peerClosed = true;
                } else {
                    LOG_WARN("AsioConnection: receive from {} failed: {}", remote, ec.message());
                    pendingError = true;
                    // Datagram errors (e.g. ICMP port unreachable) do not end the association
                    again = !IsStream;
                    if (IsStream) {
                        peerClosed = true;
                    }
                }
            }
            inboxCv.notify_all();
            if (again && open.load()) {
                startReceive();
            }
        };
        if constexpr (IsStream) {
            socket.async_read_some(net::buffer(scratch), handler);
        } else {
            socket.async_receive(net::buffer(scratch), handler);
        }
    }

    net::io_context ioc;
    typename Protocol::socket socket;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::mutex lifecycleMutex;
    std::atomic<bool> open{true};
    std::string remote;

    // Larger than any UDP payload, so a full buffer means the datagram was truncated
    std::array<char, 65536> scratch{};
    std::mutex inboxMutex;
    std::condition_variable inboxCv;
    // Received chunks; each entry is one datagram for udp
    std::deque<std::string> inbox;
    bool pendingError{false};
    bool peerClosed{false};
};

struct HostPort {
    std::string host;
    std::string port;
};

HostPort splitHostPort(const std::string& address) {
    HostPort hp;
    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
            throw std::invalid_argument("malformed address: " + address);
        }
        hp.host = address.substr(1, close - 1);
        hp.port = address.substr(close + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos || address.find(':') != colon) {
            throw std::invalid_argument("malformed address (expected host:port): " + address);
        }
        hp.host = address.substr(0, colon);
        hp.port = address.substr(colon + 1);
    }
    if (hp.host.empty() || hp.port.empty()) {
        throw std::invalid_argument("malformed address (empty host or port): " + address);
    }
    return hp;
}

template <typename Protocol>
std::unique_ptr<IConnection> dial(const HostPort& hp, std::optional<Protocol> family) {
    auto conn = std::make_unique<AsioConnection<Protocol>>();
    net::io_context resolveCtx;
    typename Protocol::resolver resolver(resolveCtx);
    auto results = family.has_value() ? resolver.resolve(*family, hp.host, hp.port)
                                      : resolver.resolve(hp.host, hp.port);
    conn->connect(results);
    conn->start();
    return conn;
}

} // namespace

std::unique_ptr<IConnection> DialConnection(const std::string& network, const std::string& address) {
    FUNC_SCOPE();
    const HostPort hp = splitHostPort(address);
    LOG_INFO("Dialing {} {}", network, address);
    if (network == "tcp") return dial<tcp>(hp, std::nullopt);
    if (network == "tcp4") return dial<tcp>(hp, tcp::v4());
    if (network == "tcp6") return dial<tcp>(hp, tcp::v6());
    if (network == "udp") return dial<udp>(hp, std::nullopt);
    if (network == "udp4") return dial<udp>(hp, udp::v4());
    if (network == "udp6") return dial<udp>(hp, udp::v6());
    throw std::invalid_argument("unknown network: " + network);
}

std::unique_ptr<IConnection> ConnectTcp(const tcp::endpoint& remote) {
    auto conn = std::make_unique<AsioConnection<tcp>>();
    conn->connect(std::array<tcp::endpoint, 1>{remote});
    conn->start();
    return conn;
}

std::unique_ptr<IConnection> ConnectUdp(const udp::endpoint& remote) {
    auto conn = std::make_unique<AsioConnection<udp>>();
    conn->connect(std::array<udp::endpoint, 1>{remote});
    conn->start();
    return conn;
}

} // namespace stun
