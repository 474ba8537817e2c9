//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StunHeaderCodec.cpp
// Purpose: Header-level STUN framing (type, length, magic cookie, transaction id, opaque body)
//========================================================================================================

#include <algorithm>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "stun/MessageCodec.h"

namespace stun {

namespace {

// Largest body the 16-bit length field can describe while staying 4-byte aligned
constexpr std::size_t MaxBodyLength = 0xFFFC;

uint16_t readU16(const std::string& b, std::size_t off) {
    return static_cast<uint16_t>((static_cast<uint8_t>(b[off]) << 8) | static_cast<uint8_t>(b[off + 1]));
}

uint32_t readU32(const std::string& b, std::size_t off) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(b[off])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(b[off + 2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(b[off + 3]));
}

void appendU16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

void appendU32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

class StunHeaderCodec : public IMessageCodec {
public:
    explicit StunHeaderCodec(std::size_t maxSize) : maxMessageSize(maxSize < HeaderSize ? HeaderSize : maxSize) {}

    std::string encode(const Message& message) override {
        // Body is padded to a 4-byte boundary; the padding is counted in the length field
        const std::size_t padded = (message.payload.size() + 3) & ~static_cast<std::size_t>(3);
        if (padded > MaxBodyLength || HeaderSize + padded > maxMessageSize) {
            throw std::length_error(std::format("message size {} exceeds max {}", HeaderSize + padded,
                                                std::min(maxMessageSize, HeaderSize + MaxBodyLength)));
        }
        std::string frame;
        frame.reserve(HeaderSize + padded);
        appendU16(frame, static_cast<uint16_t>(message.type & 0x3FFF));
        appendU16(frame, static_cast<uint16_t>(padded));
        appendU32(frame, MagicCookie);
        frame.append(reinterpret_cast<const char*>(message.transactionId.bytes.data()), TransactionID::Size);
        frame.append(message.payload);
        frame.append(padded - message.payload.size(), '\0');
        return frame;
    }

    DecodeResult tryDecode(const std::string& buffer) override {
        if (buffer.size() < HeaderSize) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        const uint16_t type = readU16(buffer, 0);
        const uint16_t length = readU16(buffer, 2);
        const uint32_t cookie = readU32(buffer, 4);

        if ((type & 0xC000) != 0) {
            LOG_WARN("StunHeaderCodec: leading bits set in message type 0x{:04x}", type);
            return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
        }
        if (cookie != MagicCookie) {
            LOG_WARN("StunHeaderCodec: bad magic cookie 0x{:08x}", cookie);
            return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
        }
        if ((length % 4) != 0) {
            LOG_WARN("StunHeaderCodec: message length {} is not 4-byte aligned", length);
            return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
        }

        const std::size_t frameTotal = HeaderSize + length;
        if (frameTotal > maxMessageSize) {
            LOG_WARN("StunHeaderCodec: message size {} exceeds max {}", frameTotal, maxMessageSize);
            return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
        }
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        Message m;
        m.type = type;
        m.transactionId = TransactionID::FromBytes(reinterpret_cast<const uint8_t*>(buffer.data() + 8));
        m.payload = buffer.substr(HeaderSize, length);
        return { DecodeStatus::Ok, std::make_optional(std::move(m)), frameTotal };
    }

private:
    std::size_t maxMessageSize;
};

} // namespace

std::unique_ptr<IMessageCodec> MakeStunHeaderCodec(std::size_t maxMessageSize) {
    return std::make_unique<StunHeaderCodec>(maxMessageSize);
}

} // namespace stun
