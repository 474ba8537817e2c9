//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientOptions.h
// Purpose: Tunables of the STUN client background loops
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "stun/MessageCodec.h"

namespace stun {

//==========================================================================================================
// ClientOptions
// Fields:
//   timeoutRate: Sweep loop period; transactions are evicted at most this late after their deadline.
//   readPollInterval: Longest a single connection read blocks before the read loop re-checks shutdown.
//   requestTimeout: Deadline offset used by Client::Do when no explicit deadline is given.
//   maxMessageSize: Largest accepted message (header + body) in bytes.
//==========================================================================================================
struct ClientOptions {
    std::chrono::milliseconds timeoutRate{100};
    std::chrono::milliseconds readPollInterval{100};
    std::chrono::milliseconds requestTimeout{5000};
    std::size_t maxMessageSize{DefaultMaxMessageSize};

    //==========================================================================================================
    // Defaults
    // Purpose: Built-in defaults with STUN_CLIENT_TIMEOUT_RATE_MS applied when set to a positive integer.
    //==========================================================================================================
    static ClientOptions Defaults();

    //==========================================================================================================
    // FromConfigString
    // Purpose: Applies key=value pairs separated by ';' or whitespace on top of Defaults().
    //          Keys: timeout_rate_ms, read_poll_ms, request_timeout_ms, max_message_size.
    //          Unknown keys and malformed or zero values are ignored.
    //==========================================================================================================
    static ClientOptions FromConfigString(const std::string& config);
};

} // namespace stun
