// MINTGATE - secp256k1 Key Tests
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <gtest/gtest.h>
#include <mintgate/crypto/keys.h>
#include <mintgate/core/hex.h>

#include <vector>

namespace mintgate {
namespace {

// Well-known development keys
constexpr const char* DEV_KEY_0 =
    "ac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80";
constexpr const char* DEV_ADDR_0 = "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266";
constexpr const char* DEV_KEY_1 =
    "59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d";
constexpr const char* DEV_ADDR_1 = "0x70997970c51812dc3a010c7d01b50e0d17dc79c8";

TEST(PrivateKeyTest, DerivesKnownAddresses) {
    auto key0 = PrivateKey::FromHex(DEV_KEY_0);
    ASSERT_TRUE(key0.has_value());
    auto addr0 = key0->GetAddress();
    ASSERT_TRUE(addr0.has_value());
    EXPECT_EQ(addr0->ToString(), DEV_ADDR_0);

    auto key1 = PrivateKey::FromHex(std::string("0x") + DEV_KEY_1);
    ASSERT_TRUE(key1.has_value());
    EXPECT_EQ(key1->GetAddress()->ToString(), DEV_ADDR_1);
}

TEST(PrivateKeyTest, PublicKeyIsUncompressed) {
    auto key = PrivateKey::FromHex(DEV_KEY_0);
    ASSERT_TRUE(key.has_value());
    auto pub = key->GetPublicKey();
    ASSERT_TRUE(pub.has_value());
    EXPECT_TRUE(pub->IsValid());
    EXPECT_EQ(pub->ToHex().size(), 2 * UNCOMPRESSED_PUBKEY_SIZE);
    EXPECT_EQ(pub->GetAddress(), *key->GetAddress());
}

TEST(PrivateKeyTest, RejectsZero) {
    std::vector<Byte> zero(PRIVATE_KEY_SIZE, 0);
    EXPECT_FALSE(PrivateKey::FromBytes(zero.data(), zero.size()).has_value());
}

TEST(PrivateKeyTest, RejectsCurveOrder) {
    EXPECT_FALSE(PrivateKey::FromHex(
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141").has_value());
    EXPECT_TRUE(PrivateKey::FromHex(
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140").has_value());
}

TEST(PrivateKeyTest, RejectsWrongLength) {
    EXPECT_FALSE(PrivateKey::FromHex("abcd").has_value());
    EXPECT_FALSE(PrivateKey::FromHex("not hex at all").has_value());
}

TEST(PublicKeyTest, DefaultIsInvalid) {
    PublicKey pub;
    EXPECT_FALSE(pub.IsValid());
}

} // namespace
} // namespace mintgate
