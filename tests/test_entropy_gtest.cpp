// ==============================================================================
// test_entropy_gtest.cpp - Тесты Entropy Analyzer (GoogleTest)
// ==============================================================================

#include "logveil/entropy.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <string>

namespace logveil::entropy::test {

// 20 различных символов: энтропия log2(20) ~ 4.32
constexpr const char* HIGH = "aB3dE5fG7hJ9kL1mN2pQ";

TEST(EntropyTest, Score_EmptyIsZero) {
    EXPECT_DOUBLE_EQ(score(""), 0.0);
}

TEST(EntropyTest, Score_SingleSymbolIsZero) {
    EXPECT_DOUBLE_EQ(score("aaaaaaaaaaaa"), 0.0);
}

TEST(EntropyTest, Score_DistinctSymbols) {
    EXPECT_NEAR(score("abcd"), 2.0, 1e-9);
    EXPECT_NEAR(score(HIGH), std::log2(20.0), 1e-9);
}

TEST(EntropyTest, Tokenize_SplitsOnNonAlphanumeric) {
    auto tokens = tokenize("key=abc123, token:XYZ_9");

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].text, "key");
    EXPECT_EQ(tokens[0].offset, 0u);
    EXPECT_EQ(tokens[1].text, "abc123");
    EXPECT_EQ(tokens[1].offset, 4u);
    EXPECT_EQ(tokens[4].text, "9");
}

TEST(EntropyTest, Tokenize_KeepsBase64TokenWhole) {
    auto tokens = tokenize("k=Zq8Xv3+Lm9/Tp2== done");

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].text, "k");
    EXPECT_EQ(tokens[1].text, "Zq8Xv3+Lm9/Tp2==");
    EXPECT_EQ(tokens[1].offset, 2u);
    EXPECT_EQ(tokens[2].text, "done");
}

TEST(EntropyTest, Tokenize_InnerEqualsSplits) {
    auto tokens = tokenize("a==b");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].text, "a");
    EXPECT_EQ(tokens[1].text, "b");
}

TEST(EntropyTest, Scan_FindsHighEntropyToken) {
    EntropyConfig cfg;
    std::string line = std::string("auth ") + HIGH + " ok";

    auto findings = scan(line, cfg);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].offset, 5u);
    EXPECT_EQ(findings[0].length, 20u);
    EXPECT_GE(findings[0].score, cfg.threshold);
}

TEST(EntropyTest, Scan_ShortTokenIgnored) {
    EntropyConfig cfg;
    cfg.min_length = 24;

    EXPECT_TRUE(scan(HIGH, cfg).empty());
}

TEST(EntropyTest, Scan_LowEntropyWordIgnored) {
    EntropyConfig cfg;

    EXPECT_TRUE(scan("internationalization failed", cfg).empty());
}

TEST(EntropyTest, Scan_Base64SecretIsOneFinding) {
    // Куски между '+' и '/' короче min_length; целиком токен длиной 43
    EntropyConfig cfg;
    cfg.threshold = 4.5;
    cfg.min_length = 20;
    std::string line = "secret: Zq8Xv3Lm9Tp2+Rk7Wn4Hs6/Jd1Fb5Gc0Ya+QeUiOo==";

    auto findings = scan(line, cfg);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].offset, 8u);
    EXPECT_EQ(findings[0].length, 43u);
}

TEST(EntropyTest, Scan_MinLengthBoundary) {
    // 40 различных символов: энтропия log2(40) ~ 5.32
    const std::string token = "aB3dE5fG7hJ9kL1mN2pQrS4tU6vW8xY0zCDeFgHi";
    EntropyConfig cfg;
    cfg.threshold = 4.5;

    cfg.min_length = 40;
    auto at_limit = scan(token, cfg);
    cfg.min_length = 41;
    auto over_limit = scan(token, cfg);

    ASSERT_EQ(at_limit.size(), 1u);
    EXPECT_EQ(at_limit[0].length, 40u);
    EXPECT_TRUE(over_limit.empty());
}

TEST(EntropyTest, Scan_Disabled) {
    EntropyConfig cfg;
    cfg.enabled = false;

    EXPECT_TRUE(scan(HIGH, cfg).empty());
}

TEST(EntropyTest, IsSecret_RespectsBothLimits) {
    EntropyConfig cfg;

    EXPECT_TRUE(is_secret(HIGH, cfg));
    cfg.threshold = 5.0;
    EXPECT_FALSE(is_secret(HIGH, cfg));
}

TEST(EntropyTest, Validate) {
    EntropyConfig cfg;
    EXPECT_FALSE(validate(cfg).has_value());

    cfg.threshold = 0.0;
    EXPECT_TRUE(validate(cfg).has_value());

    cfg.threshold = 8.5;
    EXPECT_TRUE(validate(cfg).has_value());

    cfg.threshold = 4.0;
    cfg.min_length = 0;
    EXPECT_TRUE(validate(cfg).has_value());
}

TEST(EntropyTest, MarkerIsBelowDefaultThreshold) {
    EntropyConfig cfg;
    EXPECT_TRUE(scan(SECRET_MARKER, cfg).empty());
}

}  // namespace logveil::entropy::test
