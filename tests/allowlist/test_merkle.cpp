// MINTGATE - Allowlist Merkle Tests
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <gtest/gtest.h>
#include <mintgate/allowlist/merkle.h>
#include <mintgate/crypto/keccak.h>

#include <sstream>
#include <vector>

namespace mintgate {
namespace allowlist {
namespace {

Address MakeAddress(Byte tag) {
    Address addr;
    for (size_t i = 0; i < addr.size(); ++i) {
        addr[i] = static_cast<Byte>(tag + i);
    }
    return addr;
}

std::vector<Address> MakeParticipants(size_t count) {
    std::vector<Address> result;
    for (size_t i = 0; i < count; ++i) {
        result.push_back(MakeAddress(static_cast<Byte>(0x10 * (i + 1))));
    }
    return result;
}

// ============================================================================
// Hashing
// ============================================================================

TEST(MerkleHashTest, LeafIsKeccakOfAddressBytes) {
    Address addr = MakeAddress(0x01);
    EXPECT_EQ(HashLeaf(addr), Keccak256Hash(addr.data(), addr.size()));
}

TEST(MerkleHashTest, SortedPairIsSymmetric) {
    Hash256 a = HashLeaf(MakeAddress(0x01));
    Hash256 b = HashLeaf(MakeAddress(0x02));
    EXPECT_EQ(HashSortedPair(a, b), HashSortedPair(b, a));
    EXPECT_NE(HashSortedPair(a, b), HashSortedPair(a, a));
}

// ============================================================================
// Tree Construction
// ============================================================================

TEST(MerkleTreeTest, EmptyTreeHasNullRoot) {
    MerkleTree tree(std::vector<Hash256>{});
    EXPECT_TRUE(tree.GetRoot().IsNull());
    EXPECT_EQ(tree.GetLeafCount(), 0u);
    EXPECT_FALSE(tree.GetProofAt(0).has_value());
}

TEST(MerkleTreeTest, SingleLeafIsRoot) {
    Address addr = MakeAddress(0x42);
    MerkleTree tree = MerkleTree::FromAddresses({addr});

    EXPECT_EQ(tree.GetRoot(), HashLeaf(addr));
    auto proof = tree.GetProofAt(0);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proof->empty());
    EXPECT_TRUE(VerifyMembership(addr, *proof, tree.GetRoot()));
}

TEST(MerkleTreeTest, TwoLeaves) {
    auto participants = MakeParticipants(2);
    MerkleTree tree = MerkleTree::FromAddresses(participants);

    EXPECT_EQ(tree.GetRoot(),
              HashSortedPair(HashLeaf(participants[0]), HashLeaf(participants[1])));

    auto proof = tree.GetProofAt(1);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->size(), 1u);
    EXPECT_EQ((*proof)[0], HashLeaf(participants[0]));
}

TEST(MerkleTreeTest, OddNodeIsPromoted) {
    auto participants = MakeParticipants(3);
    MerkleTree tree = MerkleTree::FromAddresses(participants);

    Hash256 h0 = HashLeaf(participants[0]);
    Hash256 h1 = HashLeaf(participants[1]);
    Hash256 h2 = HashLeaf(participants[2]);
    EXPECT_EQ(tree.GetRoot(), HashSortedPair(HashSortedPair(h0, h1), h2));
    EXPECT_EQ(tree.GetDepth(), 3u);

    // The promoted leaf skips the level where it has no sibling
    auto proof = tree.GetProofAt(2);
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->size(), 1u);
    EXPECT_EQ((*proof)[0], HashSortedPair(h0, h1));
}

TEST(MerkleTreeTest, EveryLeafVerifies) {
    auto participants = MakeParticipants(5);
    MerkleTree tree = MerkleTree::FromAddresses(participants);

    for (size_t i = 0; i < participants.size(); ++i) {
        auto proof = tree.GetProof(HashLeaf(participants[i]));
        ASSERT_TRUE(proof.has_value()) << "leaf " << i;
        EXPECT_TRUE(VerifyMembership(participants[i], *proof, tree.GetRoot()))
            << "leaf " << i;
    }
}

TEST(MerkleTreeTest, ContainsAndMissingProof) {
    auto participants = MakeParticipants(4);
    MerkleTree tree = MerkleTree::FromAddresses(participants);

    EXPECT_TRUE(tree.Contains(HashLeaf(participants[3])));
    EXPECT_FALSE(tree.Contains(HashLeaf(MakeAddress(0xEE))));
    EXPECT_FALSE(tree.GetProof(HashLeaf(MakeAddress(0xEE))).has_value());
    EXPECT_FALSE(tree.GetProofAt(4).has_value());
}

// ============================================================================
// Verification Failures
// ============================================================================

TEST(MerkleVerifyTest, WrongParticipantFails) {
    auto participants = MakeParticipants(4);
    MerkleTree tree = MerkleTree::FromAddresses(participants);
    auto proof = tree.GetProofAt(0);
    ASSERT_TRUE(proof.has_value());

    EXPECT_FALSE(VerifyMembership(participants[1], *proof, tree.GetRoot()));
    EXPECT_FALSE(VerifyMembership(MakeAddress(0xEE), *proof, tree.GetRoot()));
}

TEST(MerkleVerifyTest, TamperedProofFails) {
    auto participants = MakeParticipants(4);
    MerkleTree tree = MerkleTree::FromAddresses(participants);
    auto proof = tree.GetProofAt(2);
    ASSERT_TRUE(proof.has_value());

    MerkleProof tampered = *proof;
    tampered[0][0] ^= 0x01;
    EXPECT_FALSE(VerifyMembership(participants[2], tampered, tree.GetRoot()));

    MerkleProof truncated(proof->begin(), proof->end() - 1);
    EXPECT_FALSE(VerifyMembership(participants[2], truncated, tree.GetRoot()));
}

TEST(MerkleVerifyTest, NullRootNeverVerifies) {
    Address addr = MakeAddress(0x01);
    EXPECT_FALSE(VerifyMembership(addr, {}, Hash256()));
    EXPECT_FALSE(VerifyProof({}, Hash256(), Hash256()));
}

// ============================================================================
// Text Forms
// ============================================================================

TEST(MerkleTextTest, FormatAndParseProof) {
    auto participants = MakeParticipants(5);
    MerkleTree tree = MerkleTree::FromAddresses(participants);
    auto proof = tree.GetProofAt(3);
    ASSERT_TRUE(proof.has_value());

    std::string text = FormatProof(*proof);
    EXPECT_EQ(text.substr(0, 2), "0x");
    auto parsed = ParseProof(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, *proof);
}

TEST(MerkleTextTest, EmptyProofIsDash) {
    EXPECT_EQ(FormatProof({}), "-");
    auto parsed = ParseProof("-");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->empty());
}

TEST(MerkleTextTest, ParseProofRejectsGarbage) {
    EXPECT_FALSE(ParseProof("0x1234").has_value());
    EXPECT_FALSE(ParseProof("zz").has_value());
}

TEST(MerkleTextTest, ReadAddressList) {
    std::istringstream in(
        "# allowlist\n"
        "\n"
        "0x00112233445566778899aabbccddeeff00112233\n"
        "  0xAABBCCDDEEFF00112233445566778899AABBCCDD  \n");

    std::vector<Address> participants;
    Status status = ReadAddressList(in, &participants);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_EQ(participants.size(), 2u);
    EXPECT_EQ(participants[0].ToString(), "0x00112233445566778899aabbccddeeff00112233");
    EXPECT_EQ(participants[1].ToString(), "0xaabbccddeeff00112233445566778899aabbccdd");
}

TEST(MerkleTextTest, ReadAddressListReportsBadLine) {
    std::istringstream in(
        "0x00112233445566778899aabbccddeeff00112233\n"
        "not-an-address\n");

    std::vector<Address> participants;
    Status status = ReadAddressList(in, &participants);
    EXPECT_TRUE(status.Is(CollectionError::InvalidArgument));
    EXPECT_NE(status.message().find("line 2"), std::string::npos);
    EXPECT_TRUE(participants.empty());
}

} // namespace
} // namespace allowlist
} // namespace mintgate
