// MINTGATE - Allowlist Merkle Proofs Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/allowlist/merkle.h>
#include <mintgate/crypto/keccak.h>

#include <algorithm>
#include <cstring>
#include <sstream>

namespace mintgate {
namespace allowlist {

// ============================================================================
// Verification
// ============================================================================

Hash256 HashLeaf(const Address& participant) {
    return Keccak256Hash(participant.data(), participant.size());
}

Hash256 HashSortedPair(const Hash256& a, const Hash256& b) {
    Byte combined[64];
    const Hash256& lo = (b < a) ? b : a;
    const Hash256& hi = (b < a) ? a : b;
    std::memcpy(combined, lo.data(), 32);
    std::memcpy(combined + 32, hi.data(), 32);
    return Keccak256Hash(combined, sizeof(combined));
}

Hash256 ProcessProof(const Hash256& leaf, const MerkleProof& proof) {
    Hash256 current = leaf;
    for (const Hash256& sibling : proof) {
        current = HashSortedPair(current, sibling);
    }
    return current;
}

bool VerifyProof(const MerkleProof& proof, const Hash256& root, const Hash256& leaf) {
    if (root.IsNull()) {
        return false;
    }
    return ProcessProof(leaf, proof) == root;
}

bool VerifyMembership(const Address& participant, const MerkleProof& proof,
                      const Hash256& root) {
    return VerifyProof(proof, root, HashLeaf(participant));
}

// ============================================================================
// Tree Construction
// ============================================================================

MerkleTree::MerkleTree(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        return;
    }

    levels_.push_back(std::move(leaves));

    while (levels_.back().size() > 1) {
        const std::vector<Hash256>& below = levels_.back();
        std::vector<Hash256> next;
        next.reserve((below.size() + 1) / 2);

        for (size_t i = 0; i < below.size(); i += 2) {
            if (i + 1 < below.size()) {
                next.push_back(HashSortedPair(below[i], below[i + 1]));
            } else {
                // Odd node is promoted as-is
                next.push_back(below[i]);
            }
        }
        levels_.push_back(std::move(next));
    }

    root_ = levels_.back()[0];
}

MerkleTree MerkleTree::FromAddresses(const std::vector<Address>& participants) {
    std::vector<Hash256> leaves;
    leaves.reserve(participants.size());
    for (const auto& p : participants) {
        leaves.push_back(HashLeaf(p));
    }
    return MerkleTree(std::move(leaves));
}

std::optional<MerkleProof> MerkleTree::GetProofAt(size_t index) const {
    if (levels_.empty() || index >= levels_[0].size()) {
        return std::nullopt;
    }

    MerkleProof proof;
    size_t pos = index;

    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& nodes = levels_[level];
        size_t sibling = (pos & 1) ? pos - 1 : pos + 1;
        if (sibling < nodes.size()) {
            proof.push_back(nodes[sibling]);
        }
        pos /= 2;
    }

    return proof;
}

std::optional<MerkleProof> MerkleTree::GetProof(const Hash256& leaf) const {
    if (levels_.empty()) {
        return std::nullopt;
    }
    const auto& leaves = levels_[0];
    auto it = std::find(leaves.begin(), leaves.end(), leaf);
    if (it == leaves.end()) {
        return std::nullopt;
    }
    return GetProofAt(static_cast<size_t>(it - leaves.begin()));
}

bool MerkleTree::Contains(const Hash256& leaf) const {
    if (levels_.empty()) {
        return false;
    }
    const auto& leaves = levels_[0];
    return std::find(leaves.begin(), leaves.end(), leaf) != leaves.end();
}

// ============================================================================
// Text Forms
// ============================================================================

std::string FormatProof(const MerkleProof& proof) {
    if (proof.empty()) {
        return "-";
    }
    std::string result;
    for (size_t i = 0; i < proof.size(); ++i) {
        if (i > 0) {
            result += ',';
        }
        result += proof[i].ToString();
    }
    return result;
}

std::optional<MerkleProof> ParseProof(const std::string& str) {
    MerkleProof proof;
    if (str.empty() || str == "-") {
        return proof;
    }

    std::istringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto hash = ParseHash256(item);
        if (!hash) {
            return std::nullopt;
        }
        proof.push_back(*hash);
    }
    return proof;
}

Status ReadAddressList(std::istream& in, std::vector<Address>* participants) {
    std::vector<Address> result;
    std::string line;
    int lineNum = 0;

    while (std::getline(in, line)) {
        ++lineNum;
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }
        size_t end = line.find_last_not_of(" \t\r");
        std::string token = line.substr(start, end - start + 1);

        auto address = ParseAddress(token);
        if (!address) {
            return Status::Error(CollectionError::InvalidArgument,
                                 "line " + std::to_string(lineNum) + ": bad address '" +
                                 token + "'");
        }
        result.push_back(*address);
    }

    if (participants) {
        *participants = std::move(result);
    }
    return Status::Ok();
}

} // namespace allowlist
} // namespace mintgate
