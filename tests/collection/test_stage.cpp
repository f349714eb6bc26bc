// MINTGATE - Sale Stage Clock Tests
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <gtest/gtest.h>
#include <mintgate/collection/roles.h>
#include <mintgate/collection/stage.h>

#include <limits>

namespace mintgate {
namespace collection {
namespace {

constexpr Timestamp PRESALE = 1700000000;
constexpr Timestamp PUBLIC = PRESALE + 3600;

CollectionConfig MakeConfig(Timestamp presale, Timestamp publicSale) {
    CollectionConfig config;
    config.presaleDate = presale;
    config.publicSaleDate = publicSale;
    return config;
}

TEST(SaleStageTest, Boundaries) {
    CollectionConfig config = MakeConfig(PRESALE, PUBLIC);

    EXPECT_EQ(GetSaleStage(config, 0), SaleStage::Idle);
    EXPECT_EQ(GetSaleStage(config, PRESALE - 1), SaleStage::Idle);
    EXPECT_EQ(GetSaleStage(config, PRESALE), SaleStage::PresaleOg);
    EXPECT_EQ(GetSaleStage(config, PRESALE + PRESALE_INTERVAL - 1), SaleStage::PresaleOg);
    EXPECT_EQ(GetSaleStage(config, PRESALE + PRESALE_INTERVAL), SaleStage::PresaleWl);
    EXPECT_EQ(GetSaleStage(config, PUBLIC - 1), SaleStage::PresaleWl);
    EXPECT_EQ(GetSaleStage(config, PUBLIC), SaleStage::PublicSale);
    EXPECT_EQ(GetSaleStage(config, std::numeric_limits<Timestamp>::max()),
              SaleStage::PublicSale);
}

TEST(SaleStageTest, MonotonicInTime) {
    CollectionConfig config = MakeConfig(PRESALE, PUBLIC);
    SaleStage previous = SaleStage::Idle;
    for (Timestamp t = PRESALE - 10; t < PUBLIC + 10; ++t) {
        SaleStage current = GetSaleStage(config, t);
        EXPECT_GE(static_cast<int>(current), static_cast<int>(previous)) << "at " << t;
        previous = current;
    }
}

TEST(SaleStageTest, PublicBeforeOgWindowEnds) {
    // Public sale starts inside the OG window: no WL stage at all
    CollectionConfig config = MakeConfig(PRESALE, PRESALE + 300);
    EXPECT_EQ(GetSaleStage(config, PRESALE + 299), SaleStage::PresaleOg);
    EXPECT_EQ(GetSaleStage(config, PRESALE + 300), SaleStage::PublicSale);
}

TEST(SaleStageTest, PublicBeforePresale) {
    CollectionConfig config = MakeConfig(PUBLIC, PRESALE);
    EXPECT_EQ(GetSaleStage(config, PRESALE - 1), SaleStage::Idle);
    EXPECT_EQ(GetSaleStage(config, PRESALE), SaleStage::PublicSale);
    EXPECT_EQ(GetSaleStage(config, PUBLIC + PRESALE_INTERVAL), SaleStage::PublicSale);
}

TEST(SaleStageTest, SaturatesNearMax) {
    constexpr Timestamp MAX = std::numeric_limits<Timestamp>::max();
    CollectionConfig config = MakeConfig(MAX - 100, MAX);

    EXPECT_EQ(GetSaleStage(config, MAX - 101), SaleStage::Idle);
    EXPECT_EQ(GetSaleStage(config, MAX - 100), SaleStage::PresaleOg);
    EXPECT_EQ(GetSaleStage(config, MAX - 1), SaleStage::PresaleOg);
    EXPECT_EQ(GetSaleStage(config, MAX), SaleStage::PublicSale);
}

TEST(SaleStageTest, ZeroDatesMeanOpen) {
    CollectionConfig config = MakeConfig(0, 0);
    EXPECT_EQ(GetSaleStage(config, 0), SaleStage::PublicSale);
}

TEST(SaleStageTest, Reveal) {
    CollectionConfig config = MakeConfig(PRESALE, PUBLIC);
    config.revealDate = PUBLIC + 100;
    EXPECT_FALSE(IsRevealed(config, PUBLIC + 99));
    EXPECT_TRUE(IsRevealed(config, PUBLIC + 100));
}

TEST(SaleStageTest, Names) {
    EXPECT_STREQ(SaleStageToString(SaleStage::PresaleWl), "PresaleWl");
    EXPECT_EQ(ParseSaleStage("publicsale"), SaleStage::PublicSale);
    EXPECT_EQ(ParseSaleStage("PresaleOg"), SaleStage::PresaleOg);
    EXPECT_FALSE(ParseSaleStage("closed").has_value());
}

TEST(SalePolicyTest, Names) {
    EXPECT_STREQ(CapPolicyToString(CapPolicy::PerTransaction), "per-transaction");
    EXPECT_EQ(ParseCapPolicy("Cumulative"), CapPolicy::CumulativePerWallet);
    EXPECT_FALSE(ParseCapPolicy("sometimes").has_value());
    EXPECT_STREQ(ClaimPolicyToString(ClaimPolicy::ClaimOnce), "claim-once");
    EXPECT_EQ(ParseClaimPolicy("repeatable"), ClaimPolicy::Repeatable);
    EXPECT_FALSE(ParseClaimPolicy("twice").has_value());
}

TEST(SalePolicyTest, NamesWithHighBytes) {
    EXPECT_EQ(ParseCapPolicy("PER-TRANSACTION"), CapPolicy::PerTransaction);
    EXPECT_EQ(ParseRole("Operator"), Role::Operator);

    // Latin-1 and UTF-8 bytes are compared, never folded into a match
    EXPECT_FALSE(ParseCapPolicy("cumulativ\xC9").has_value());
    EXPECT_FALSE(ParseClaimPolicy("\xC3\x89repeatable").has_value());
    EXPECT_FALSE(ParseRole("op\xFFerator").has_value());
    EXPECT_FALSE(ParseSaleStage("\x80idle").has_value());
}

} // namespace
} // namespace collection
} // namespace mintgate
