// MINTGATE - Ownership Registry Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/registry.h>

namespace mintgate {
namespace collection {

TokenRegistry::TokenRegistry(uint64_t cap) : cap_(cap) {}

Status TokenRegistry::Mint(const Address& owner, uint64_t count,
                           std::vector<TokenId>* tokenIds) {
    if (count == 0) {
        return Status::Error(CollectionError::ZeroAmount, "mint count is zero");
    }
    if (count > Remaining()) {
        return Status::Error(CollectionError::SupplyExhausted,
                             std::to_string(Remaining()) + " tokens left");
    }

    TokenId first = owners_.size();
    owners_.insert(owners_.end(), count, owner);
    balances_[owner] += count;

    if (tokenIds) {
        tokenIds->clear();
        tokenIds->reserve(count);
        for (uint64_t i = 0; i < count; ++i) {
            tokenIds->push_back(first + i);
        }
    }
    return Status::Ok();
}

uint64_t TokenRegistry::BalanceOf(const Address& owner) const {
    auto it = balances_.find(owner);
    return it != balances_.end() ? it->second : 0;
}

std::optional<Address> TokenRegistry::OwnerOf(TokenId tokenId) const {
    if (tokenId >= owners_.size()) {
        return std::nullopt;
    }
    return owners_[tokenId];
}

} // namespace collection
} // namespace mintgate
