/**
 * @file test_region_naming.cpp
 * @brief Unit tests for region slugs and output paths
 */

#include <gtest/gtest.h>
#include "RegionNaming.hpp"

#include <filesystem>

using namespace FSPLIT;

TEST(RegionNamingTest, ApostrophesAreDropped) {
    EXPECT_EQ(makeRegionSlug("People's Republic of China"), "peoples_republic_of_china");
}

TEST(RegionNamingTest, BlankNamesFallBack) {
    EXPECT_EQ(makeRegionSlug("   "), FALLBACK_REGION_SLUG);
    EXPECT_EQ(makeRegionSlug(""), "unknown_region");
    EXPECT_EQ(makeRegionSlug("'''"), "unknown_region");
    EXPECT_EQ(makeRegionSlug("---"), "unknown_region");
}

TEST(RegionNamingTest, PunctuationRunsCollapse) {
    EXPECT_EQ(makeRegionSlug("Bosnia and Herzegovina"), "bosnia_and_herzegovina");
    EXPECT_EQ(makeRegionSlug("Congo (Kinshasa)"), "congo_kinshasa");
    EXPECT_EQ(makeRegionSlug("  St. Kitts & Nevis  "), "st_kitts_nevis");
    EXPECT_EQ(makeRegionSlug("Guinea-Bissau"), "guinea_bissau");
}

TEST(RegionNamingTest, UnderscoresAndDigitsSurvive) {
    EXPECT_EQ(makeRegionSlug("Zone_51"), "zone_51");
    EXPECT_EQ(makeRegionSlug("__Alpha__"), "alpha");
}

TEST(RegionNamingTest, NonAsciiIsReplaced) {
    EXPECT_EQ(makeRegionSlug("C\xC3\xB4te d'Ivoire"), "c_te_divoire");
    EXPECT_EQ(makeRegionSlug("\xC3\x85land"), "land");
}

TEST(RegionNamingTest, SlugIsIdempotent) {
    const char* names[] = {
        "People's Republic of China", "   ", "Bosnia and Herzegovina",
        "C\xC3\xB4te d'Ivoire", "Zone_51", "S. Geo. & S. Sandwich Is.", "alpha"
    };
    for (const char* name : names) {
        const std::string once = makeRegionSlug(name);
        EXPECT_EQ(makeRegionSlug(once), once) << "for input '" << name << "'";
    }
}

TEST(RegionNamingTest, SlugCharacterSet) {
    const std::string slug = makeRegionSlug("  !!Foo -- BAR?? baz's  ");
    EXPECT_EQ(slug, "foo_bar_bazs");
    for (char c : slug) {
        EXPECT_TRUE((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_');
    }
    EXPECT_NE(slug.front(), '_');
    EXPECT_NE(slug.back(), '_');
}

TEST(RegionNamingTest, OutputPath) {
    const std::string path = regionOutputPath("out/faults", "faults_", "alpha", ".geojson");
    EXPECT_EQ(path, (std::filesystem::path("out/faults") / "faults_alpha.geojson").string());
}
