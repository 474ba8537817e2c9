//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Interface for STUN message framing over a byte stream
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "stun/Message.h"

namespace stun {

inline constexpr uint32_t MagicCookie = 0x2112A442u;
inline constexpr std::size_t HeaderSize = 20;
inline constexpr std::size_t DefaultMaxMessageSize = 1024;

class IMessageCodec {
public:
    virtual ~IMessageCodec() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<Message> message; // present when status==Ok
        std::size_t bytesConsumed{0};   // bytes to drop from the front of the buffer (0 when Incomplete)
    };

    //==========================================================================================================
    // encode
    // Purpose: Serializes message into one wire frame. Implementations are stateless: encode may run
    //          concurrently with tryDecode.
    // Throws:
    //   std::length_error when the frame would exceed the wire length field or the codec's maximum size.
    //==========================================================================================================
    virtual std::string encode(const Message& message) = 0;

    //==========================================================================================================
    // tryDecode
    // Purpose: Attempts to decode one message from the front of buffer without modifying it.
    // Returns:
    //   Ok with the message and its wire size, Incomplete when more bytes are needed, or an error status
    //   with the number of bytes the caller must discard before retrying.
    //==========================================================================================================
    virtual DecodeResult tryDecode(const std::string& buffer) = 0;
};

std::unique_ptr<IMessageCodec> MakeStunHeaderCodec(std::size_t maxMessageSize = DefaultMaxMessageSize);

} // namespace stun
