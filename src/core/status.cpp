// MINTGATE - Operation Status Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/core/status.h>

namespace mintgate {

const char* ErrorToString(CollectionError error) {
    switch (error) {
        case CollectionError::None: return "None";
        case CollectionError::ZeroAmount: return "ZeroAmount";
        case CollectionError::AmountExceedsCap: return "AmountExceedsCap";
        case CollectionError::SupplyExhausted: return "SupplyExhausted";
        case CollectionError::InsufficientPayment: return "InsufficientPayment";
        case CollectionError::InvalidProof: return "InvalidProof";
        case CollectionError::StageNotReady: return "StageNotReady";
        case CollectionError::AlreadyClaimed: return "AlreadyClaimed";
        case CollectionError::NonExistentToken: return "NonExistentToken";
        case CollectionError::IndexOutOfRange: return "IndexOutOfRange";
        case CollectionError::AlreadyConfirmed: return "AlreadyConfirmed";
        case CollectionError::NotConfirmed: return "NotConfirmed";
        case CollectionError::QuorumNotMet: return "QuorumNotMet";
        case CollectionError::AlreadyExecuted: return "AlreadyExecuted";
        case CollectionError::MetadataNotConfigured: return "MetadataNotConfigured";
        case CollectionError::InsufficientBalance: return "InsufficientBalance";
        case CollectionError::TransferFailed: return "TransferFailed";
        case CollectionError::Unauthorized: return "Unauthorized";
        case CollectionError::ReentrantCall: return "ReentrantCall";
        case CollectionError::ArithmeticOverflow: return "ArithmeticOverflow";
        case CollectionError::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) {
        return "OK";
    }
    std::string result = ErrorToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace mintgate
