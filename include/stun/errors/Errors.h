//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Status codes returned by transaction registry operations and their categorization
//==========================================================================================================

#pragma once

#include <string>

namespace stun {
namespace errors {

// Result of a registry operation. Ok is the only success value.
enum class AgentStatus {
    Ok,
    Closed,                // registry no longer accepts registration or sweeping
    DuplicateTransaction,  // id already pending; the existing transaction is kept
    UnknownTransaction,    // no pending transaction with that id
    InvariantViolation     // internal bookkeeping inconsistent; unrecoverable
};

// How the background loops treat a status.
enum class ErrorCategory {
    Success,
    Terminal,     // quiet end-of-life (Closed)
    Rejected,     // caller error, reported to the caller only
    Fatal         // must abort the process
};

inline ErrorCategory errorCategoryFromStatus(AgentStatus status) {
    switch (status) {
        case AgentStatus::Ok: return ErrorCategory::Success;
        case AgentStatus::Closed: return ErrorCategory::Terminal;
        case AgentStatus::DuplicateTransaction: return ErrorCategory::Rejected;
        case AgentStatus::UnknownTransaction: return ErrorCategory::Rejected;
        case AgentStatus::InvariantViolation: return ErrorCategory::Fatal;
    }
    return ErrorCategory::Fatal;
}

inline std::string toString(AgentStatus status) {
    switch (status) {
        case AgentStatus::Ok: return "ok";
        case AgentStatus::Closed: return "agent closed";
        case AgentStatus::DuplicateTransaction: return "duplicate transaction id";
        case AgentStatus::UnknownTransaction: return "unknown transaction id";
        case AgentStatus::InvariantViolation: return "agent invariant violation";
    }
    return "unknown status";
}

} // namespace errors
} // namespace stun
