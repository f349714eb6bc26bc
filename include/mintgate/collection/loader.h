// MINTGATE - Deployment Loader
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Maps a parsed configuration file onto deployment parameters.
//
//   [collection]  admin, price, maxTokenPerWallet, maxMintPerTx, presaleDate,
//                 publicSaleDate, revealDate, ogMerkleRoot, wlMerkleRoot,
//                 metadataBaseURI
//   [treasury]    approver (repeatable or comma separated), quorum
//   [policy]      capPolicy, allowlistClaim, withdrawalRequiresPublicSale,
//                 lockRootsOutsideIdle
//   [relayer]     address, owner, merkleRoot, price, presaleStartDate,
//                 presaleEndDate (section optional)
//
// Amounts are decimal text ("0.03"); dates are unix seconds.

#ifndef MINTGATE_COLLECTION_LOADER_H
#define MINTGATE_COLLECTION_LOADER_H

#include <mintgate/collection/collection.h>
#include <mintgate/collection/params.h>
#include <mintgate/collection/relayer.h>
#include <mintgate/core/status.h>
#include <mintgate/util/config.h>

#include <memory>
#include <optional>
#include <vector>

namespace mintgate {
namespace collection {

struct Deployment {
    Address admin;
    std::vector<Address> approvers;
    size_t quorum{0};
    CollectionConfig config;
    std::optional<RelayerConfig> relayer;

    /// Construct the collection described by this deployment
    std::unique_ptr<Collection> Deploy(std::shared_ptr<IOwnershipRegistry> registry = nullptr) const;
};

/**
 * Read a deployment from `config`.
 *
 * Missing required keys and malformed values fail with InvalidArgument; the
 * message names the offending "section.key". `deployment` is only written
 * on success.
 */
Status LoadDeployment(const util::ConfigManager& config, Deployment* deployment);

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_LOADER_H
