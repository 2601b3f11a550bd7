#include <spotalloc/core/spot.hpp>

#include <gtest/gtest.h>

using namespace spotalloc::core;

// =============================================================================
// Parsing
// =============================================================================

TEST(SpotTest, ParseWellFormedToken) {
    auto address = parse_spot("B1_F2_V3");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->garage, "B1");
    EXPECT_EQ(address->lane, "F2");
    EXPECT_EQ(address->number, 3u);
}

TEST(SpotTest, ParseRejectsMalformedTokens) {
    EXPECT_FALSE(parse_spot("").has_value());
    EXPECT_FALSE(parse_spot("B1").has_value());
    EXPECT_FALSE(parse_spot("B1_F1").has_value());
    EXPECT_FALSE(parse_spot("B1-F1-V1").has_value());
    EXPECT_FALSE(parse_spot("_F1_V1").has_value());
    EXPECT_FALSE(parse_spot("B1__V1").has_value());
    EXPECT_FALSE(parse_spot("B1_F1_1").has_value());
    EXPECT_FALSE(parse_spot("B1_F1_V").has_value());
    EXPECT_FALSE(parse_spot("B1_F1_Vx").has_value());
    EXPECT_FALSE(parse_spot("B1_F1_V1a").has_value());
    EXPECT_FALSE(parse_spot("X_B1_F1_V1").has_value());
}

TEST(SpotTest, ParseRejectsOutOfRangeNumbers) {
    EXPECT_FALSE(parse_spot("B1_F1_V0").has_value());
    EXPECT_FALSE(parse_spot("B1_F1_V4").has_value());
    EXPECT_TRUE(parse_spot("B1_F1_V1").has_value());
}

TEST(SpotTest, FormatMatchesParse) {
    SpotAddress address{"B3", "F1", 2};
    EXPECT_EQ(format_spot(address), "B3_F1_V2");
    EXPECT_EQ(parse_spot(format_spot(address)), address);
}

// =============================================================================
// Classification and labels
// =============================================================================

TEST(SpotTest, NormalAndOverflowSpots) {
    EXPECT_TRUE(is_normal_spot(1));
    EXPECT_TRUE(is_normal_spot(2));
    EXPECT_FALSE(is_normal_spot(3));
    EXPECT_FALSE(is_normal_spot(0));

    EXPECT_TRUE(is_overflow_spot(3));
    EXPECT_FALSE(is_overflow_spot(2));
}

TEST(SpotTest, LabelUsesDashes) {
    EXPECT_EQ(spot_label(std::string("B1_F1_V1")), "B1-F1-V1");
    EXPECT_EQ(spot_label(std::nullopt), "unassigned");
    EXPECT_EQ(spot_label(std::string("garbage")), "garbage");
}

TEST(SpotTest, GarageOfToken) {
    EXPECT_EQ(spot_garage(std::string("B2_F3_V1")), "B2");
    EXPECT_FALSE(spot_garage(std::nullopt).has_value());
    EXPECT_FALSE(spot_garage(std::string("nope")).has_value());
}
