//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransactionID.cpp
// Purpose: TransactionID generation, hex rendering and hashing
//==========================================================================================================

#include <cstring>
#include <random>

#include "stun/TransactionID.h"

namespace stun {

TransactionID TransactionID::Random() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    TransactionID id;
    std::size_t i = 0;
    while (i < Size) {
        uint64_t word = gen();
        for (int b = 0; b < 8 && i < Size; ++b, ++i) {
            id.bytes[i] = static_cast<uint8_t>(word & 0xFFu);
            word >>= 8;
        }
    }
    return id;
}

TransactionID TransactionID::FromBytes(const uint8_t* data) {
    TransactionID id;
    std::memcpy(id.bytes.data(), data, Size);
    return id;
}

std::string TransactionID::ToHex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(Size * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::size_t TransactionIDHash::operator()(const TransactionID& id) const noexcept {
    // FNV-1a over the 12 bytes
    uint64_t h = 1469598103934665603ull;
    for (uint8_t b : id.bytes) {
        h ^= b;
        h *= 1099511628211ull;
    }
    return static_cast<std::size_t>(h);
}

} // namespace stun
