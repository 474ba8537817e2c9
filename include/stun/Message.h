//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Message.h
// Purpose: Decoded STUN message unit handed from the codec to the transaction registry
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>

#include "stun/TransactionID.h"

namespace stun {

// STUN message types used by the engine and its examples. Other types pass through untouched.
namespace MessageTypes {
    inline constexpr uint16_t BindingRequest = 0x0001;
    inline constexpr uint16_t BindingSuccessResponse = 0x0101;
    inline constexpr uint16_t BindingErrorResponse = 0x0111;
    inline constexpr uint16_t BindingIndication = 0x0011;
}

//==========================================================================================================
// Message
// Purpose: Transient decoded unit. payload holds the raw attribute bytes following the 20-byte header;
//          attributes are not interpreted by the engine.
//==========================================================================================================
struct Message {
    uint16_t type{0};
    TransactionID transactionId;
    std::string payload;
};

} // namespace stun
