// MINTGATE - Operation Status
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Every state-mutating operation reports its outcome as a Status. A failed
// operation leaves all state untouched.

#ifndef MINTGATE_CORE_STATUS_H
#define MINTGATE_CORE_STATUS_H

#include <string>

namespace mintgate {

// ============================================================================
// Error Codes
// ============================================================================

enum class CollectionError {
    None = 0,

    // Mint validation
    ZeroAmount,
    AmountExceedsCap,
    SupplyExhausted,
    InsufficientPayment,
    InvalidProof,
    StageNotReady,
    AlreadyClaimed,

    // Queries
    NonExistentToken,

    // Treasury
    IndexOutOfRange,
    AlreadyConfirmed,
    NotConfirmed,
    QuorumNotMet,
    AlreadyExecuted,
    MetadataNotConfigured,
    InsufficientBalance,
    TransferFailed,

    // Access and execution
    Unauthorized,
    ReentrantCall,
    ArithmeticOverflow,
    InvalidArgument,
};

/// Name of an error code ("SupplyExhausted")
const char* ErrorToString(CollectionError error);

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    Status() : code_(CollectionError::None) {}
    Status(CollectionError code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Error(CollectionError code, const std::string& msg = "") {
        return Status(code, msg);
    }

    bool ok() const { return code_ == CollectionError::None; }
    bool Is(CollectionError code) const { return code_ == code; }

    CollectionError code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK" or "<Code>: <message>"
    std::string ToString() const;

private:
    CollectionError code_;
    std::string message_;
};

} // namespace mintgate

#endif // MINTGATE_CORE_STATUS_H
