//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransactionID.h
// Purpose: 96-bit transaction identifier correlating requests with their responses
//==========================================================================================================

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace stun {

//==========================================================================================================
// TransactionID
// Purpose: Fixed-size opaque key of the transaction registry. Equality is exact bytewise equality.
//==========================================================================================================
struct TransactionID {
    static constexpr std::size_t Size = 12;

    std::array<uint8_t, Size> bytes{};

    //==========================================================================================================
    // Random
    // Purpose: Generates a fresh identifier for a new outstanding request.
    // Returns:
    //   TransactionID filled from a per-thread pseudo random generator seeded by std::random_device.
    //==========================================================================================================
    static TransactionID Random();

    //==========================================================================================================
    // FromBytes
    // Purpose: Copies Size bytes starting at data.
    // Args:
    //   data: Pointer to at least Size readable bytes.
    //==========================================================================================================
    static TransactionID FromBytes(const uint8_t* data);

    // Lowercase hex rendering, 24 characters.
    std::string ToHex() const;

    bool operator==(const TransactionID& other) const { return bytes == other.bytes; }
    bool operator!=(const TransactionID& other) const { return !(*this == other); }
};

struct TransactionIDHash {
    std::size_t operator()(const TransactionID& id) const noexcept;
};

} // namespace stun
