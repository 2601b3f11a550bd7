#include <spotalloc/core/truck.hpp>
#include <spotalloc/core/truck_length.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace spotalloc::core;

class TruckLengthTest : public ::testing::Test {
protected:
    static std::vector<LayoutSection> sections(std::initializer_list<double> widths) {
        std::vector<LayoutSection> result;
        for (double w : widths) {
            result.push_back(LayoutSection{w});
        }
        return result;
    }

    LengthRules rules;
};

// =============================================================================
// Threshold-gated rule
// =============================================================================

TEST_F(TruckLengthTest, NoSectionsYieldsMinimum) {
    EXPECT_DOUBLE_EQ(truck_length(std::vector<LayoutSection>{}, rules), 5.0);
}

TEST_F(TruckLengthTest, ShortBodyGetsCabin) {
    EXPECT_DOUBLE_EQ(truck_length(sections({4.0, 3.0}), rules), 8.8);
    EXPECT_DOUBLE_EQ(truck_length(sections({9.9}), rules), 11.7);
}

TEST_F(TruckLengthTest, LongBodyUsedAsIs) {
    EXPECT_DOUBLE_EQ(truck_length(sections({12.0}), rules), 12.0);
    EXPECT_DOUBLE_EQ(truck_length(sections({6.0, 6.5}), rules), 12.5);
}

TEST_F(TruckLengthTest, ThresholdIsExclusive) {
    EXPECT_DOUBLE_EQ(truck_length(sections({10.0}), rules), 10.0);
}

TEST_F(TruckLengthTest, ResultNeverBelowMinimum) {
    EXPECT_DOUBLE_EQ(truck_length(sections({2.0}), rules), 5.0);
    EXPECT_DOUBLE_EQ(truck_length(sections({0.0}), rules), 5.0);
}

TEST_F(TruckLengthTest, CustomRules) {
    LengthRules custom{4.0, 8.0, 2.0};
    EXPECT_DOUBLE_EQ(truck_length(sections({3.0}), custom), 5.0);
    EXPECT_DOUBLE_EQ(truck_length(sections({8.0}), custom), 8.0);
    EXPECT_DOUBLE_EQ(truck_length(sections({1.0}), custom), 4.0);
}

// =============================================================================
// Side layouts
// =============================================================================

TEST_F(TruckLengthTest, LeftLayoutTakesPrecedence) {
    Truck truck;
    truck.id = "t1";
    truck.layout = BothLayouts{sections({12.0}), sections({4.0})};
    EXPECT_DOUBLE_EQ(truck_length(truck, rules), 12.0);
}

TEST_F(TruckLengthTest, RightLayoutUsedWhenAlone) {
    Truck truck;
    truck.id = "t1";
    truck.layout = RightLayout{sections({4.0})};
    EXPECT_DOUBLE_EQ(truck_length(truck, rules), 5.8);
}

TEST_F(TruckLengthTest, TruckWithoutLayout) {
    Truck truck;
    truck.id = "t1";
    EXPECT_DOUBLE_EQ(truck_length(truck, rules), 5.0);
}

TEST_F(TruckLengthTest, MakeSideLayoutPicksVariant) {
    EXPECT_TRUE(std::holds_alternative<NoLayout>(make_side_layout(std::nullopt, std::nullopt)));
    EXPECT_TRUE(std::holds_alternative<LeftLayout>(make_side_layout(sections({1.0}), std::nullopt)));
    EXPECT_TRUE(std::holds_alternative<RightLayout>(make_side_layout(std::nullopt, sections({1.0}))));
    EXPECT_TRUE(std::holds_alternative<BothLayouts>(make_side_layout(sections({1.0}), sections({2.0}))));
}

// =============================================================================
// Legacy rule
// =============================================================================

TEST_F(TruckLengthTest, LegacyRuleAlwaysAddsCabin) {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
    EXPECT_DOUBLE_EQ(legacy_truck_length(sections({12.0}), rules), 13.8);
    EXPECT_DOUBLE_EQ(legacy_truck_length(sections({2.0}), rules), 3.8);
#pragma GCC diagnostic pop
}
