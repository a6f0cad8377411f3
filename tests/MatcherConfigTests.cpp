#include "IndicatorSuite/Errors.hpp"
#include "IndicatorSuite/MatcherConfig.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

const std::string kDataDir = INDICATOR_SUITE_TEST_DATA_DIR;

TEST(MatcherConfigTest, DefaultsAreUsable) {
    const indicators::MatcherConfig config;
    EXPECT_EQ(config.maxDepth, indicators::MatcherConfig::kDefaultMaxDepth);
    EXPECT_EQ(config.requestTimeout.count(), indicators::MatcherConfig::kDefaultTimeoutMs);
    EXPECT_TRUE(config.unshorten);
    EXPECT_TRUE(config.proxyHost.empty());
    EXPECT_TRUE(config.buildShortenerRegistry().contains("bit.ly"));
    EXPECT_EQ(config.buildPublicSuffixList().registrableDomain("a.example.co.uk"), "example.co.uk");
}

TEST(MatcherConfigTest, LoadsEveryKnownKeyFromFile) {
    const auto config = indicators::MatcherConfig::fromFile(kDataDir + "/config.json");
    EXPECT_EQ(config.maxDepth, 3);
    EXPECT_EQ(config.requestTimeout.count(), 1500);
    EXPECT_FALSE(config.unshorten);
    EXPECT_EQ(config.proxyHost, "127.0.0.1");
    EXPECT_EQ(config.proxyPort, 9050);
    EXPECT_EQ(config.userAgent, "forensics/2.0");
    EXPECT_EQ(config.logLevel, "warn");

    const auto registry = config.buildShortenerRegistry();
    EXPECT_TRUE(registry.contains("short.example"));
    EXPECT_TRUE(registry.contains("bit.ly"));
}

TEST(MatcherConfigTest, ShortenersKeyReplacesDefaults) {
    const auto config = indicators::MatcherConfig::fromString(R"({"shorteners": ["only.example"]})");
    const auto registry = config.buildShortenerRegistry();
    EXPECT_TRUE(registry.contains("only.example"));
    EXPECT_FALSE(registry.contains("bit.ly"));
}

TEST(MatcherConfigTest, ExternalListsAreLoaded) {
    const auto config = indicators::MatcherConfig::fromString(
        R"({"shortener_file": ")" + kDataDir + R"(/shorteners.txt", "public_suffix_file": ")" + kDataDir +
        R"(/suffixes.dat"})");

    EXPECT_TRUE(config.buildShortenerRegistry().contains("go.example.net"));
    EXPECT_EQ(config.buildPublicSuffixList().publicSuffix("a.b.sch.uk"), "b.sch.uk");
}

TEST(MatcherConfigTest, MissingExternalListRaisesConfigError) {
    indicators::MatcherConfig config;
    config.shortenerFile = kDataDir + "/missing.txt";
    EXPECT_THROW(config.buildShortenerRegistry(), indicators::ConfigError);

    config.publicSuffixFile = kDataDir + "/missing.dat";
    EXPECT_THROW(config.buildPublicSuffixList(), indicators::ConfigError);
}

TEST(MatcherConfigTest, InvalidValuesRaiseConfigError) {
    EXPECT_THROW(indicators::MatcherConfig::fromString(R"({"max_depth": "deep"})"), indicators::ConfigError);
    EXPECT_THROW(indicators::MatcherConfig::fromString(R"({"max_depth": -1})"), indicators::ConfigError);
    EXPECT_THROW(indicators::MatcherConfig::fromString(R"({"request_timeout_ms": 0})"), indicators::ConfigError);
    EXPECT_THROW(indicators::MatcherConfig::fromString(R"({"shorteners": "bit.ly"})"), indicators::ConfigError);
    EXPECT_THROW(indicators::MatcherConfig::fromString("[1, 2]"), indicators::ConfigError);
    EXPECT_THROW(indicators::MatcherConfig::fromString("{\"max_depth\": "), indicators::ConfigError);
    EXPECT_THROW(indicators::MatcherConfig::fromFile(kDataDir + "/missing.json"), indicators::ConfigError);
}

TEST(MatcherConfigTest, LogLevelMustBeKnown) {
    EXPECT_THROW(indicators::MatcherConfig::fromString(R"({"log_level": "verbose"})"), indicators::ConfigError);
    EXPECT_THROW(indicators::MatcherConfig::fromString(R"({"log_level": "INFO "})"), indicators::ConfigError);

    EXPECT_EQ(indicators::MatcherConfig::fromString(R"({"log_level": "off"})").logLevel, "off");
    EXPECT_EQ(indicators::MatcherConfig::fromString(R"({"log_level": "warning"})").logLevel, "warning");
    EXPECT_EQ(indicators::MatcherConfig::fromString(R"({"log_level": "trace"})").logLevel, "trace");
}

TEST(MatcherConfigTest, ProxyMustBeHostAndPort) {
    indicators::MatcherConfig config;
    config.setProxy("tor.local:9150");
    EXPECT_EQ(config.proxyHost, "tor.local");
    EXPECT_EQ(config.proxyPort, 9150);

    EXPECT_THROW(config.setProxy("tor.local"), indicators::ConfigError);
    EXPECT_THROW(config.setProxy(":9050"), indicators::ConfigError);
    EXPECT_THROW(config.setProxy("tor.local:"), indicators::ConfigError);
    EXPECT_THROW(config.setProxy("tor.local:70000"), indicators::ConfigError);
    EXPECT_THROW(config.setProxy("tor.local:90a"), indicators::ConfigError);

    config.setProxy("");
    EXPECT_TRUE(config.proxyHost.empty());
    EXPECT_EQ(config.proxyPort, 0);
}

} // namespace
