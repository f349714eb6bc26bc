// MINTGATE - Mint Relayer
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// A separate front door that sells an allowlist mint during its own time
// window and forwards each purchase to Collection::OperatorMint. The relayer
// address must hold the collection's Operator role; the collection's own sale
// stages, caps and prices do not apply to relayed mints, only its supply cap.

#ifndef MINTGATE_COLLECTION_RELAYER_H
#define MINTGATE_COLLECTION_RELAYER_H

#include <mintgate/allowlist/merkle.h>
#include <mintgate/collection/collection.h>
#include <mintgate/collection/events.h>
#include <mintgate/collection/guard.h>
#include <mintgate/core/status.h>
#include <mintgate/core/types.h>

#include <vector>

namespace mintgate {
namespace collection {

/// Default relay price per token (0.025)
constexpr Amount DEFAULT_RELAY_PRICE = 25000000;

struct RelayerConfig {
    /// Identity the relayer uses when calling the collection
    Address address;

    /// May change the relayer's parameters
    Address owner;

    Hash256 merkleRoot;
    Amount price{DEFAULT_RELAY_PRICE};

    /// Window start; zero keeps the relay closed
    Timestamp presaleStartDate{0};

    /// Window end (exclusive); zero leaves the window open-ended
    Timestamp presaleEndDate{0};
};

class Relayer {
public:
    /// The collection must outlive the relayer
    Relayer(const RelayerConfig& config, Collection& collection);

    /**
     * Buy `amount` tokens for the caller through the collection.
     *
     * StageNotReady outside the window, ZeroAmount, InvalidProof against
     * the relayer's root, InsufficientPayment, then whatever OperatorMint
     * reports. The full attached value is forwarded.
     */
    Status MintRelay(const CallContext& ctx, uint64_t amount,
                     const allowlist::MerkleProof& proof,
                     std::vector<TokenId>* tokenIds = nullptr);

    /// Owner only
    Status SetPresaleStartDate(const CallContext& ctx, Timestamp date);
    Status SetPresaleEndDate(const CallContext& ctx, Timestamp date);
    Status SetMerkleRoot(const CallContext& ctx, const Hash256& root);
    Status SetPrice(const CallContext& ctx, Amount price);

    bool IsMintWindowActive(Timestamp now) const;

    const Address& GetAddress() const { return config_.address; }
    const RelayerConfig& GetConfig() const { return config_; }
    const std::vector<Event>& GetEvents() const { return events_.GetEvents(); }

private:
    Status CheckOwner(const CallContext& ctx, const char* operation);
    void RecordChange(const CallContext& ctx, const char* name, const std::string& value);

    RelayerConfig config_;
    Collection& collection_;
    ReentrancyGuard guard_;
    EventLog events_;
};

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_RELAYER_H
