// MINTGATE - Allowlist Merkle Proofs
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Membership proofs for allowlist commitments. Trees are built with
// sorted-pair hashing: every internal node is keccak256(min(a,b) || max(a,b))
// so a proof is just the list of siblings, with no left/right flags. A node
// without a sibling on its level is promoted to the next level unchanged.
// This matches trees produced by the common JavaScript tooling when
// configured with sorted pairs.

#ifndef MINTGATE_ALLOWLIST_MERKLE_H
#define MINTGATE_ALLOWLIST_MERKLE_H

#include <mintgate/core/status.h>
#include <mintgate/core/types.h>

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace mintgate {
namespace allowlist {

/// Sibling hashes from leaf level to root
using MerkleProof = std::vector<Hash256>;

// ============================================================================
// Verification
// ============================================================================

/// Leaf for a participant: keccak256 of the 20 address bytes
Hash256 HashLeaf(const Address& participant);

/// keccak256 of the two hashes in ascending byte order
Hash256 HashSortedPair(const Hash256& a, const Hash256& b);

/// Fold a proof onto a leaf, returning the implied root
Hash256 ProcessProof(const Hash256& leaf, const MerkleProof& proof);

/// True iff the proof folds the leaf to exactly `root`. A null root never
/// verifies.
bool VerifyProof(const MerkleProof& proof, const Hash256& root, const Hash256& leaf);

/// VerifyProof(proof, root, HashLeaf(participant))
bool VerifyMembership(const Address& participant, const MerkleProof& proof,
                      const Hash256& root);

// ============================================================================
// Tree Construction
// ============================================================================

/**
 * Sorted-pair merkle tree over a fixed list of leaves.
 *
 * Leaves are kept in the order given; no deduplication is performed.
 * An empty tree has a null root.
 */
class MerkleTree {
public:
    explicit MerkleTree(std::vector<Hash256> leaves);

    /// Build from participant addresses (leaves hashed with HashLeaf)
    static MerkleTree FromAddresses(const std::vector<Address>& participants);

    /// Root of the tree (null when empty)
    const Hash256& GetRoot() const { return root_; }

    /// Proof for the first occurrence of `leaf`, or nullopt if absent
    std::optional<MerkleProof> GetProof(const Hash256& leaf) const;

    /// Proof for the leaf at `index`, or nullopt if out of range
    std::optional<MerkleProof> GetProofAt(size_t index) const;

    bool Contains(const Hash256& leaf) const;

    size_t GetLeafCount() const { return levels_.empty() ? 0 : levels_[0].size(); }

    /// Number of levels including leaves and root
    size_t GetDepth() const { return levels_.size(); }

private:
    std::vector<std::vector<Hash256>> levels_;
    Hash256 root_;
};

// ============================================================================
// Text Forms
// ============================================================================

/// Comma-separated 0x-prefixed hashes; "-" for an empty proof
std::string FormatProof(const MerkleProof& proof);

/// Inverse of FormatProof(); nullopt on a malformed hash
std::optional<MerkleProof> ParseProof(const std::string& str);

/// Read one address per line. Blank lines and lines starting with '#' are
/// skipped. Fails with InvalidArgument naming the first bad line.
Status ReadAddressList(std::istream& in, std::vector<Address>* participants);

} // namespace allowlist
} // namespace mintgate

#endif // MINTGATE_ALLOWLIST_MERKLE_H
