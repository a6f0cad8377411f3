#include "IndicatorSuite/Errors.hpp"
#include "IndicatorSuite/IndicatorSet.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

namespace {

const std::string kDataDir = INDICATOR_SUITE_TEST_DATA_DIR;

TEST(IndicatorSetTest, LoadsFourCategoriesFromBundle) {
    const auto set = indicators::IndicatorSet::fromFile(kDataDir + "/basic_bundle.json");

    EXPECT_EQ(set.domains(), (std::unordered_set<std::string>{"evil.com"}));
    EXPECT_EQ(set.processes(), (std::unordered_set<std::string>{"badproc"}));
    EXPECT_EQ(set.emails(), (std::unordered_set<std::string>{"attacker@evil.com"}));
    EXPECT_EQ(set.files(), (std::unordered_set<std::string>{"Payload.DLL"}));

    const auto summary = set.summary();
    EXPECT_EQ(summary.total(), 4u);
}

TEST(IndicatorSetTest, LoadingTheSameBundleTwiceIsIdempotent) {
    indicators::IndicatorSet set;
    set.loadBundle(kDataDir + "/basic_bundle.json");
    set.loadBundle(kDataDir + "/basic_bundle.json");

    EXPECT_EQ(set.domains().size(), 1u);
    EXPECT_EQ(set.processes().size(), 1u);
    EXPECT_EQ(set.emails().size(), 1u);
    EXPECT_EQ(set.files().size(), 1u);
}

TEST(IndicatorSetTest, DomainsAndEmailsAreLowerCasedButNamesKeepCase) {
    indicators::IndicatorSet set;
    EXPECT_TRUE(set.addPattern("[domain-name:value='Bad.Example.COM']"));
    EXPECT_TRUE(set.addPattern("[email-addr:value='Someone@Example.com']"));
    EXPECT_TRUE(set.addPattern("[process:name='BadProc']"));
    EXPECT_TRUE(set.addPattern("[file:name='Dropper.EXE']"));

    EXPECT_TRUE(set.hasDomain("bad.example.com"));
    EXPECT_TRUE(set.hasDomain("BAD.example.com"));
    EXPECT_TRUE(set.hasEmail("someone@example.com"));
    EXPECT_TRUE(set.hasProcess("BadProc"));
    EXPECT_FALSE(set.hasProcess("badproc"));
    EXPECT_TRUE(set.hasFile("Dropper.EXE"));
    EXPECT_FALSE(set.hasFile("dropper.exe"));
}

TEST(IndicatorSetTest, DuplicatePatternsAreNotInsertedTwice) {
    indicators::IndicatorSet set;
    EXPECT_TRUE(set.addPattern("[domain-name:value='evil.com']"));
    EXPECT_FALSE(set.addPattern("[domain-name:value='EVIL.COM']"));
    EXPECT_EQ(set.domains().size(), 1u);
}

TEST(IndicatorSetTest, UnknownKeysAreIgnored) {
    indicators::IndicatorSet set;
    EXPECT_FALSE(set.addPattern("[ipv4-addr:value='198.51.100.1']"));
    EXPECT_FALSE(set.addPattern("[url:value='http://evil.com/x']"));
    EXPECT_TRUE(set.empty());
}

TEST(IndicatorSetTest, EmptyValuesAreSkipped) {
    indicators::IndicatorSet set;
    EXPECT_FALSE(set.addPattern("[domain-name:value='']"));
    EXPECT_FALSE(set.addIndicator(indicators::IndicatorKind::Process, "   "));
    EXPECT_TRUE(set.empty());
}

TEST(IndicatorSetTest, MalformedPatternRaisesSchemaError) {
    indicators::IndicatorSet set;
    EXPECT_THROW(set.addPattern("[domain-name:value]"), indicators::BundleSchemaError);
    EXPECT_THROW(set.addPattern("[domain-name:value='a=b']"), indicators::BundleSchemaError);
    EXPECT_THROW(set.addPattern(""), indicators::BundleSchemaError);
}

TEST(IndicatorSetTest, BundleWithMalformedPatternFailsToLoad) {
    indicators::IndicatorSet set;
    EXPECT_THROW(set.loadBundle(kDataDir + "/bad_pattern_bundle.json"), indicators::BundleSchemaError);
}

TEST(IndicatorSetTest, MalformedJsonRaisesParseError) {
    EXPECT_THROW(indicators::IndicatorSet::fromFile(kDataDir + "/malformed_bundle.json"),
                 indicators::BundleParseError);
    EXPECT_THROW(indicators::IndicatorSet::fromFile(kDataDir + "/no_objects_bundle.json"),
                 indicators::BundleParseError);
}

TEST(IndicatorSetTest, MissingFileRaisesIOError) {
    EXPECT_THROW(indicators::IndicatorSet::fromFile(kDataDir + "/does_not_exist.json"), indicators::BundleIOError);
}

TEST(IndicatorSetTest, ObjectsWithoutTypeOrPatternAreSkipped) {
    indicators::IndicatorSet set;
    set.loadBundleFromString(R"({"objects": [
        {"id": "x"},
        {"type": "indicator"},
        {"type": "attack-pattern", "pattern": "not a pattern"},
        "not an object",
        {"type": "indicator", "pattern": "[file:name='implant.bin']"}
    ]})");
    EXPECT_EQ(set.summary().total(), 1u);
    EXPECT_TRUE(set.hasFile("implant.bin"));
}

TEST(IndicatorSetTest, NonStringPatternRaisesSchemaError) {
    indicators::IndicatorSet set;
    EXPECT_THROW(set.loadBundleFromString(R"({"objects": [{"type": "indicator", "pattern": 42}]})"),
                 indicators::BundleSchemaError);
}

TEST(IndicatorSetTest, KindNames) {
    EXPECT_EQ(indicators::toString(indicators::IndicatorKind::Domain), "domain");
    EXPECT_EQ(indicators::toString(indicators::IndicatorKind::Process), "process");
    EXPECT_EQ(indicators::toString(indicators::IndicatorKind::Email), "email");
    EXPECT_EQ(indicators::toString(indicators::IndicatorKind::File), "file");
}

} // namespace
