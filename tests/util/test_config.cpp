// MINTGATE - Configuration File Parser Tests
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <gtest/gtest.h>

#include <mintgate/util/config.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace mintgate {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/mintgate_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# key=value
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("key=value");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("key"));
    EXPECT_EQ(config_.GetString("key", ""), "value");
}

TEST_F(ConfigTest, ParseWhitespaceAroundEquals) {
    auto result = config_.ParseString("  price   =   0.03  ");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("price", ""), "0.03");
}

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
admin=0x01
[collection]
price=0.03
[treasury]
quorum=2
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("admin"));
    EXPECT_TRUE(config_.HasKey("price", "collection"));
    EXPECT_FALSE(config_.HasKey("price"));
    EXPECT_EQ(config_.GetUInt("quorum", 0, "treasury"), 2u);

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "collection");
    EXPECT_EQ(sections[1], "treasury");
}

TEST_F(ConfigTest, QuotedValues) {
    std::string content = R"(
uri="ipfs://base/"
single='a b c'
escaped="line\nnext \"q\""
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("uri", ""), "ipfs://base/");
    EXPECT_EQ(config_.GetString("single", ""), "a b c");
    EXPECT_EQ(config_.GetString("escaped", ""), "line\nnext \"q\"");
}

TEST_F(ConfigTest, LineContinuation) {
    std::string content = "approver=0x01,\\\n0x02\n";
    ASSERT_TRUE(config_.ParseString(content).success);
    auto list = config_.GetList("approver");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1], "0x02");
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(ConfigTest, MissingEqualsIsError) {
    auto result = config_.ParseString("good=1\njust a line\n", "deploy.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "deploy.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, UnclosedSectionIsError) {
    auto result = config_.ParseString("[collection\nprice=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/mintgate/deploy.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

// ============================================================================
// Typed Values
// ============================================================================

TEST_F(ConfigTest, IntegerValues) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=\n").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
}

TEST_F(ConfigTest, UnsignedValues) {
    ASSERT_TRUE(config_.ParseString(
        "a=1700000000\nb=-1\nc= 5\nd=18446744073709551616\n").success);
    EXPECT_EQ(config_.TryGetUInt("a"), 1700000000u);
    EXPECT_FALSE(config_.TryGetUInt("b").has_value());
    EXPECT_EQ(config_.TryGetUInt("c"), 5u);  // value is trimmed
    EXPECT_FALSE(config_.TryGetUInt("d").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 9), 9u);
}

TEST_F(ConfigTest, BooleanValues) {
    ASSERT_TRUE(config_.ParseString(
        "a=true\nb=no\nc=ON\nd=0\ne=maybe\n").success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_EQ(config_.TryGetBool("c"), true);
    EXPECT_EQ(config_.TryGetBool("d"), false);
    EXPECT_FALSE(config_.TryGetBool("e").has_value());
    EXPECT_TRUE(config_.GetBool("e", true));
}

// ============================================================================
// Lists
// ============================================================================

TEST_F(ConfigTest, RepeatedKeysBuildList) {
    std::string content = R"(
[treasury]
approver=0x01
approver=0x02, 0x03
approver=0x04
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    auto list = config_.GetList("approver", "treasury");
    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list[0], "0x01");
    EXPECT_EQ(list[1], "0x02");
    EXPECT_EQ(list[2], "0x03");
    EXPECT_EQ(list[3], "0x04");

    // First value wins for scalar access
    EXPECT_EQ(config_.GetString("approver", "", "treasury"), "0x01");
    EXPECT_EQ(config_.Size(), 1u);
}

TEST_F(ConfigTest, SetReplacesList) {
    ASSERT_TRUE(config_.ParseString("k=a\nk=b\n").success);
    config_.Set("k", "c");
    auto list = config_.GetList("k");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], "c");
}

TEST_F(ConfigTest, GetKeysBySection) {
    ASSERT_TRUE(config_.ParseString("g=1\n[relayer]\nowner=0x1\nprice=0.02\n").success);
    auto keys = config_.GetKeys("relayer");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "owner");
    EXPECT_EQ(keys[1], "price");
    EXPECT_EQ(config_.GetKeys().size(), 1u);
    EXPECT_TRUE(config_.GetKeys("absent").empty());
}

// ============================================================================
// Environment and Files
// ============================================================================

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("MINTGATE_TEST_URI", "ipfs://env/", 1);
    unsetenv("MINTGATE_TEST_UNSET");
    ASSERT_TRUE(config_.ParseString(
        "uri=${MINTGATE_TEST_URI}meta\nempty=x${MINTGATE_TEST_UNSET}y\n").success);
    EXPECT_EQ(config_.GetString("uri", ""), "ipfs://env/meta");
    EXPECT_EQ(config_.GetString("empty", ""), "xy");
    unsetenv("MINTGATE_TEST_URI");
}

TEST_F(ConfigTest, ParseFileReportsPath) {
    std::string path = CreateTempFile("[collection]\nprice=0.03\nbroken\n");
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, path);
    EXPECT_EQ(result.errorLine, 3);
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[collection]\nprice=0.03\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetString("price", "", "collection"), "0.03");
}

} // namespace test
} // namespace util
} // namespace mintgate
