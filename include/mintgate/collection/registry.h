// MINTGATE - Ownership Registry
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// The registry records which participant owns each token. The collection only
// ever appends to it through Mint(); transfers are out of scope.

#ifndef MINTGATE_COLLECTION_REGISTRY_H
#define MINTGATE_COLLECTION_REGISTRY_H

#include <mintgate/collection/params.h>
#include <mintgate/core/status.h>
#include <mintgate/core/types.h>

#include <map>
#include <optional>
#include <vector>

namespace mintgate {
namespace collection {

/**
 * Token ownership store consumed by the collection.
 *
 * Mint() is all-or-nothing: it either creates every requested token or
 * none of them.
 */
class IOwnershipRegistry {
public:
    virtual ~IOwnershipRegistry() = default;

    /**
     * Create `count` tokens owned by `owner`.
     *
     * @param owner Recipient of the new tokens
     * @param count Number of tokens (must be positive)
     * @param tokenIds If non-null, receives the new ids in ascending order
     * @return SupplyExhausted if the cap would be exceeded
     */
    virtual Status Mint(const Address& owner, uint64_t count,
                        std::vector<TokenId>* tokenIds) = 0;

    /// Number of tokens held by `owner`
    virtual uint64_t BalanceOf(const Address& owner) const = 0;

    /// Number of tokens minted so far
    virtual uint64_t TotalSupply() const = 0;

    /// Owner of `tokenId`, or nullopt if it was never minted
    virtual std::optional<Address> OwnerOf(TokenId tokenId) const = 0;
};

/// In-memory registry with sequential ids starting at zero
class TokenRegistry : public IOwnershipRegistry {
public:
    explicit TokenRegistry(uint64_t cap = TOTAL_SUPPLY);

    Status Mint(const Address& owner, uint64_t count,
                std::vector<TokenId>* tokenIds) override;
    uint64_t BalanceOf(const Address& owner) const override;
    uint64_t TotalSupply() const override { return owners_.size(); }
    std::optional<Address> OwnerOf(TokenId tokenId) const override;

    uint64_t GetCap() const { return cap_; }

    /// Tokens that can still be minted
    uint64_t Remaining() const { return cap_ - owners_.size(); }

private:
    uint64_t cap_;
    std::vector<Address> owners_;
    std::map<Address, uint64_t> balances_;
};

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_REGISTRY_H
