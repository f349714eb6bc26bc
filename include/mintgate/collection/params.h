// MINTGATE - Collection Parameters
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Constants, deploy-time configuration and per-participant state of a
// fixed-supply collection sale.

#ifndef MINTGATE_COLLECTION_PARAMS_H
#define MINTGATE_COLLECTION_PARAMS_H

#include <mintgate/core/types.h>

#include <optional>
#include <string>

namespace mintgate {
namespace collection {

// ============================================================================
// Collection Constants
// ============================================================================

/// Hard cap on tokens ever minted
constexpr uint64_t TOTAL_SUPPLY = 5000;

/// Length of the OG priority window (seconds)
constexpr Timestamp PRESALE_INTERVAL = 900;

/// Tokens minted to the admin at construction
constexpr uint64_t RESERVED_TOKENS = 50;

/// OG presale price per token (0.025)
constexpr Amount PRESALE_PRICE_OG = 25000000;

/// WL presale price per token (0.025)
constexpr Amount PRESALE_PRICE_WL = 25000000;

/// OG allocation per participant
constexpr uint64_t PRESALE_MAX_TOKEN_PER_OG = 3;

/// WL allocation per participant
constexpr uint64_t PRESALE_MAX_TOKEN_PER_WL = 2;

/// Default public price per token (0.03)
constexpr Amount DEFAULT_PUBLIC_PRICE = 30000000;

/// Default public-sale allocation per wallet
constexpr uint64_t DEFAULT_MAX_TOKEN_PER_WALLET = 5;

/// Default public-sale per-call cap
constexpr uint64_t DEFAULT_MAX_MINT_PER_TX = 5;

// ============================================================================
// Sale Policy
// ============================================================================

/// How per-participant caps are counted
enum class CapPolicy {
    /// Running total across all calls is bounded by the cap
    CumulativePerWallet,

    /// Each call is bounded by the cap independently
    PerTransaction,
};

/// How often an allowlist allocation can be used
enum class ClaimPolicy {
    /// Any number of calls until the cap is reached
    Repeatable,

    /// A single successful call consumes the allocation
    ClaimOnce,
};

const char* CapPolicyToString(CapPolicy policy);
std::optional<CapPolicy> ParseCapPolicy(const std::string& str);

const char* ClaimPolicyToString(ClaimPolicy policy);
std::optional<ClaimPolicy> ParseClaimPolicy(const std::string& str);

/// Behavioral choices fixed at deploy time
struct SalePolicy {
    CapPolicy capPolicy{CapPolicy::CumulativePerWallet};
    ClaimPolicy allowlistClaim{ClaimPolicy::Repeatable};

    /// Withdrawals execute only once the public sale has started
    bool withdrawalRequiresPublicSale{true};

    /// Merkle roots can only change while Idle
    bool lockRootsOutsideIdle{true};
};

// ============================================================================
// Collection Configuration
// ============================================================================

struct CollectionConfig {
    /// Public-sale price per token
    Amount price{DEFAULT_PUBLIC_PRICE};

    /// Public-sale allocation per wallet
    uint64_t maxTokenPerWallet{DEFAULT_MAX_TOKEN_PER_WALLET};

    /// Public-sale per-call cap
    uint64_t maxMintPerTx{DEFAULT_MAX_MINT_PER_TX};

    Timestamp presaleDate{0};
    Timestamp publicSaleDate{0};
    Timestamp revealDate{0};

    Hash256 ogMerkleRoot;
    Hash256 wlMerkleRoot;

    /// Must be non-empty before funds can be withdrawn
    std::string metadataBaseURI;

    SalePolicy policy;
};

// ============================================================================
// Call Context
// ============================================================================

/// Who is calling, how much they attached and when
struct CallContext {
    Address caller;
    Amount value{0};
    Timestamp timestamp{0};

    CallContext() = default;
    CallContext(const Address& c, Amount v, Timestamp t)
        : caller(c), value(v), timestamp(t) {}
};

// ============================================================================
// Participant Record
// ============================================================================

/// Per-address sale state. Absent participants read as the default record.
struct ParticipantRecord {
    bool ogClaimed{false};
    bool wlClaimed{false};
    uint64_t ogMinted{0};
    uint64_t wlMinted{0};
    uint64_t publicSaleBalance{0};

    bool operator==(const ParticipantRecord& other) const {
        return ogClaimed == other.ogClaimed && wlClaimed == other.wlClaimed &&
               ogMinted == other.ogMinted && wlMinted == other.wlMinted &&
               publicSaleBalance == other.publicSaleBalance;
    }
    bool operator!=(const ParticipantRecord& other) const { return !(*this == other); }
};

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_PARAMS_H
