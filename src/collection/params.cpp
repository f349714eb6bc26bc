// MINTGATE - Collection Parameters Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/params.h>

#include <algorithm>
#include <cctype>

namespace mintgate {
namespace collection {

const char* CapPolicyToString(CapPolicy policy) {
    switch (policy) {
        case CapPolicy::CumulativePerWallet: return "cumulative";
        case CapPolicy::PerTransaction: return "per-transaction";
        default: return "unknown";
    }
}

std::optional<CapPolicy> ParseCapPolicy(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cumulative") return CapPolicy::CumulativePerWallet;
    if (lower == "per-transaction" || lower == "pertransaction") return CapPolicy::PerTransaction;
    return std::nullopt;
}

const char* ClaimPolicyToString(ClaimPolicy policy) {
    switch (policy) {
        case ClaimPolicy::Repeatable: return "repeatable";
        case ClaimPolicy::ClaimOnce: return "claim-once";
        default: return "unknown";
    }
}

std::optional<ClaimPolicy> ParseClaimPolicy(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "repeatable") return ClaimPolicy::Repeatable;
    if (lower == "claim-once" || lower == "claimonce") return ClaimPolicy::ClaimOnce;
    return std::nullopt;
}

} // namespace collection
} // namespace mintgate
