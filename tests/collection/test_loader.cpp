// MINTGATE - Deployment Loader Tests
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <gtest/gtest.h>
#include <mintgate/collection/loader.h>

namespace mintgate {
namespace collection {
namespace test {

constexpr const char* ADMIN = "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266";
constexpr const char* APPROVER_1 = "0x70997970c51812dc3a010c7d01b50e0d17dc79c8";
constexpr const char* APPROVER_2 = "0x3c44cdddb6a900fa2b585dd299e03d12fa4293bc";
constexpr const char* APPROVER_3 = "0x90f79bf6eb2c4f870365e785982e1f101e93b906";

class LoaderTest : public ::testing::Test {
protected:
    Status Load(const std::string& content) {
        auto parsed = config_.ParseString(content, "deploy.conf");
        EXPECT_TRUE(parsed.success) << parsed.errorMessage;
        return LoadDeployment(config_, &deployment_);
    }

    static std::string MinimalCollection() {
        return std::string("[collection]\n") +
               "admin=" + ADMIN + "\n"
               "presaleDate=1700000000\n"
               "publicSaleDate=1700003600\n";
    }

    util::ConfigManager config_;
    Deployment deployment_;
};

TEST_F(LoaderTest, MinimalDeployment) {
    Status status = Load(MinimalCollection() +
                         "[treasury]\n"
                         "approver=" + APPROVER_1 + "\n");
    ASSERT_TRUE(status.ok()) << status.ToString();

    EXPECT_EQ(deployment_.admin.ToString(), ADMIN);
    EXPECT_EQ(deployment_.config.presaleDate, 1700000000u);
    EXPECT_EQ(deployment_.config.publicSaleDate, 1700003600u);
    EXPECT_EQ(deployment_.config.price, DEFAULT_PUBLIC_PRICE);
    EXPECT_EQ(deployment_.config.maxTokenPerWallet, DEFAULT_MAX_TOKEN_PER_WALLET);
    EXPECT_TRUE(deployment_.config.ogMerkleRoot.IsNull());
    EXPECT_TRUE(deployment_.config.metadataBaseURI.empty());
    ASSERT_EQ(deployment_.approvers.size(), 1u);
    EXPECT_EQ(deployment_.quorum, 1u);
    EXPECT_FALSE(deployment_.relayer.has_value());

    // Policy defaults
    EXPECT_EQ(deployment_.config.policy.capPolicy, CapPolicy::CumulativePerWallet);
    EXPECT_EQ(deployment_.config.policy.allowlistClaim, ClaimPolicy::Repeatable);
    EXPECT_TRUE(deployment_.config.policy.withdrawalRequiresPublicSale);
    EXPECT_TRUE(deployment_.config.policy.lockRootsOutsideIdle);
}

TEST_F(LoaderTest, FullDeployment) {
    std::string content = MinimalCollection() +
        "price=0.05\n"
        "maxTokenPerWallet=10\n"
        "maxMintPerTx=3\n"
        "revealDate=1700090000\n"
        "ogMerkleRoot=0x" + std::string(64, 'a') + "\n"
        "metadataBaseURI=\"ipfs://collection/\"\n"
        "[treasury]\n"
        "approver=" + APPROVER_1 + "\n"
        "approver=" + APPROVER_2 + ", " + APPROVER_3 + "\n"
        "quorum=2\n"
        "[policy]\n"
        "capPolicy=per-transaction\n"
        "allowlistClaim=claim-once\n"
        "withdrawalRequiresPublicSale=no\n"
        "lockRootsOutsideIdle=false\n"
        "[relayer]\n"
        "address=" + APPROVER_3 + "\n"
        "owner=" + ADMIN + "\n"
        "price=0.02\n"
        "presaleStartDate=1699990000\n";

    Status status = Load(content);
    ASSERT_TRUE(status.ok()) << status.ToString();

    const CollectionConfig& c = deployment_.config;
    EXPECT_EQ(c.price, 50000000u);
    EXPECT_EQ(c.maxTokenPerWallet, 10u);
    EXPECT_EQ(c.maxMintPerTx, 3u);
    EXPECT_EQ(c.revealDate, 1700090000u);
    EXPECT_EQ(c.ogMerkleRoot.ToHex(), std::string(64, 'a'));
    EXPECT_EQ(c.metadataBaseURI, "ipfs://collection/");

    ASSERT_EQ(deployment_.approvers.size(), 3u);
    EXPECT_EQ(deployment_.approvers[2].ToString(), APPROVER_3);
    EXPECT_EQ(deployment_.quorum, 2u);

    EXPECT_EQ(c.policy.capPolicy, CapPolicy::PerTransaction);
    EXPECT_EQ(c.policy.allowlistClaim, ClaimPolicy::ClaimOnce);
    EXPECT_FALSE(c.policy.withdrawalRequiresPublicSale);
    EXPECT_FALSE(c.policy.lockRootsOutsideIdle);

    ASSERT_TRUE(deployment_.relayer.has_value());
    EXPECT_EQ(deployment_.relayer->address.ToString(), APPROVER_3);
    EXPECT_EQ(deployment_.relayer->price, 20000000u);
    EXPECT_EQ(deployment_.relayer->presaleStartDate, 1699990000u);
    EXPECT_EQ(deployment_.relayer->presaleEndDate, 0u);
}

TEST_F(LoaderTest, DeployBuildsCollection) {
    ASSERT_TRUE(Load(MinimalCollection() +
                     "[treasury]\n"
                     "approver=" + APPROVER_1 + "," + APPROVER_2 + "\n").ok());

    auto collection = deployment_.Deploy();
    ASSERT_NE(collection, nullptr);
    EXPECT_EQ(collection->GetQuorum(), 2u);
    EXPECT_EQ(collection->TotalSupply(), RESERVED_TOKENS);
    EXPECT_TRUE(collection->HasRole(Role::DefaultAdmin, deployment_.admin));
    EXPECT_TRUE(collection->HasRole(Role::Operator, deployment_.approvers[1]));
}

TEST_F(LoaderTest, MissingRequiredKeys) {
    Status status = Load("[collection]\npresaleDate=1\npublicSaleDate=2\n");
    EXPECT_TRUE(status.Is(CollectionError::InvalidArgument));
    EXPECT_EQ(status.message(), "collection.admin: required");

    config_.Clear();
    status = Load(std::string("[collection]\nadmin=") + ADMIN + "\npublicSaleDate=2\n");
    EXPECT_EQ(status.message(), "collection.presaleDate: required");
}

TEST_F(LoaderTest, MalformedValues) {
    Status status = Load(MinimalCollection() + "price=cheap\n");
    EXPECT_EQ(status.message(), "collection.price: not a decimal amount");

    config_.Clear();
    status = Load(MinimalCollection() + "maxMintPerTx=-1\n");
    EXPECT_EQ(status.message(), "collection.maxMintPerTx: not an unsigned integer");

    config_.Clear();
    status = Load(MinimalCollection() + "wlMerkleRoot=0x1234\n");
    EXPECT_EQ(status.message(), "collection.wlMerkleRoot: not a 32-byte hex value");

    config_.Clear();
    status = Load(MinimalCollection() + "[treasury]\napprover=0xnothex\n");
    EXPECT_TRUE(status.Is(CollectionError::InvalidArgument));
    EXPECT_EQ(status.message().rfind("treasury.approver:", 0), 0u);

    config_.Clear();
    status = Load(MinimalCollection() + "[treasury]\napprover=" + APPROVER_1 + "\n" +
                  "[policy]\ncapPolicy=sometimes\n");
    EXPECT_EQ(status.message().rfind("policy.capPolicy:", 0), 0u);

    config_.Clear();
    status = Load(MinimalCollection() + "[treasury]\napprover=" + APPROVER_1 + "\n" +
                  "[policy]\nlockRootsOutsideIdle=maybe\n");
    EXPECT_EQ(status.message(), "policy.lockRootsOutsideIdle: not a boolean");
}

TEST_F(LoaderTest, ZeroQuorumRejected) {
    Status status = Load(MinimalCollection() + "[treasury]\napprover=" + APPROVER_1 +
                         "\nquorum=0\n");
    EXPECT_EQ(status.message(), "treasury.quorum: must be at least 1");

    // No approvers and no explicit quorum defaults to zero
    config_.Clear();
    status = Load(MinimalCollection());
    EXPECT_TRUE(status.Is(CollectionError::InvalidArgument));
}

TEST_F(LoaderTest, RelayerRequiresAddressAndOwner) {
    Status status = Load(MinimalCollection() +
                         "[treasury]\napprover=" + APPROVER_1 + "\n"
                         "[relayer]\nowner=" + ADMIN + "\n");
    EXPECT_EQ(status.message(), "relayer.address: required");
}

TEST_F(LoaderTest, FailureLeavesOutputUntouched) {
    deployment_.quorum = 42;
    Status status = Load("[collection]\n");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(deployment_.quorum, 42u);
}

} // namespace test
} // namespace collection
} // namespace mintgate
