#include <spotalloc/algo/lane_layout.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace spotalloc::algo;
using namespace spotalloc::core;

class LaneLayoutTest : public ::testing::Test {
protected:
    static GarageConfig make_config() {
        GarageSpec garage;
        garage.id = "G1";
        garage.name = "Test garage";
        garage.lane_length = 12.0;
        garage.lanes = {LaneSpec{"F1", "Lane 1", 2.75}, LaneSpec{"F2", "Lane 2", 8.5}};
        return GarageConfig({garage}, LengthRules{1.0, 1.0, 0.0});
    }

    static Truck truck(std::string id, std::optional<std::string> spot, double length) {
        Truck t;
        t.id = std::move(id);
        t.spot = std::move(spot);
        t.layout = LeftLayout{{LayoutSection{length}}};
        return t;
    }

    GarageConfig config = make_config();
    const LaneSpec& lane = config.garages()[0].lanes[0];
};

// =============================================================================
// Lanes
// =============================================================================

TEST_F(LaneLayoutTest, EmptyLane) {
    auto layout = layout_lane(lane, 12.0, {}, config);
    EXPECT_EQ(layout.lane_id, "F1");
    EXPECT_TRUE(layout.trucks.empty());
    EXPECT_DOUBLE_EQ(layout.remaining_length, 12.0);
}

TEST_F(LaneLayoutTest, SingleTruckAtTop) {
    std::vector<Truck> trucks{truck("a", "G1_F1_V1", 11.5)};
    auto layout = layout_lane(lane, 12.0, trucks, config);

    ASSERT_EQ(layout.trucks.size(), 1u);
    EXPECT_DOUBLE_EQ(layout.trucks[0].y_position, 0.0);
    EXPECT_DOUBLE_EQ(layout.trucks[0].x_position, 2.75);
    EXPECT_DOUBLE_EQ(layout.occupied_length, 11.5);
    EXPECT_DOUBLE_EQ(layout.remaining_length, 0.5);
}

TEST_F(LaneLayoutTest, PackedWithMinimumSpacingWhileRoomRemains) {
    std::vector<Truck> trucks{truck("b", "G1_F1_V2", 3.0), truck("a", "G1_F1_V1", 3.0)};
    auto layout = layout_lane(lane, 12.0, trucks, config);

    ASSERT_EQ(layout.trucks.size(), 2u);
    EXPECT_EQ(layout.trucks[0].truck_id, "a");
    EXPECT_DOUBLE_EQ(layout.trucks[0].y_position, 0.0);
    EXPECT_EQ(layout.trucks[1].truck_id, "b");
    EXPECT_DOUBLE_EQ(layout.trucks[1].y_position, 4.0);
    EXPECT_DOUBLE_EQ(layout.occupied_length, 7.0);
    EXPECT_DOUBLE_EQ(layout.remaining_length, 5.0);
}

TEST_F(LaneLayoutTest, SpreadEvenlyWhenLaneIsFull) {
    std::vector<Truck> trucks{truck("a", "G1_F1_V1", 5.0), truck("b", "G1_F1_V2", 5.0)};
    auto layout = layout_lane(lane, 12.0, trucks, config);

    ASSERT_EQ(layout.trucks.size(), 2u);
    EXPECT_DOUBLE_EQ(layout.trucks[0].y_position, 0.0);
    EXPECT_DOUBLE_EQ(layout.trucks[1].y_position, 7.0);
    EXPECT_DOUBLE_EQ(layout.trucks[1].length, 5.0);
    EXPECT_DOUBLE_EQ(layout.remaining_length, 1.0);
}

TEST_F(LaneLayoutTest, OverfullLaneHasNoRemainingLength) {
    std::vector<Truck> trucks{truck("a", "G1_F1_V1", 7.0), truck("b", "G1_F1_V2", 7.0)};
    auto layout = layout_lane(lane, 12.0, trucks, config);

    EXPECT_DOUBLE_EQ(layout.occupied_length, 15.0);
    EXPECT_DOUBLE_EQ(layout.remaining_length, 0.0);
}

// =============================================================================
// Garages
// =============================================================================

TEST_F(LaneLayoutTest, GarageGroupsTrucksByLane) {
    std::vector<Truck> trucks{truck("a", "G1_F1_V1", 3.0), truck("b", "G1_F2_V1", 3.0),
                              truck("c", "G2_F1_V1", 3.0), truck("d", std::nullopt, 3.0)};
    auto layout = layout_garage("G1", trucks, config);

    EXPECT_EQ(layout.garage_id, "G1");
    ASSERT_EQ(layout.lanes.size(), 2u);
    ASSERT_EQ(layout.lanes[0].trucks.size(), 1u);
    EXPECT_EQ(layout.lanes[0].trucks[0].truck_id, "a");
    ASSERT_EQ(layout.lanes[1].trucks.size(), 1u);
    EXPECT_EQ(layout.lanes[1].trucks[0].truck_id, "b");
    EXPECT_DOUBLE_EQ(layout.lanes[1].trucks[0].x_position, 8.5);
}

TEST_F(LaneLayoutTest, UnknownGarageHasNoLanes) {
    std::vector<Truck> trucks{truck("a", "G1_F1_V1", 3.0)};
    auto layout = layout_garage("G9", trucks, config);
    EXPECT_TRUE(layout.lanes.empty());
}

// =============================================================================
// Yard
// =============================================================================

TEST_F(LaneLayoutTest, YardGridOfUnparkedTrucks) {
    std::vector<Truck> trucks;
    for (int i = 0; i < 7; ++i) {
        trucks.push_back(truck("t" + std::to_string(i), std::nullopt, 3.0));
    }
    trucks.push_back(truck("parked", "G1_F1_V1", 3.0));

    auto layout = layout_yard(trucks, config);

    // floor(25.0 / (2.8 + 1.0)) columns
    EXPECT_EQ(layout.columns, 6u);
    EXPECT_EQ(layout.rows, 2u);
    ASSERT_EQ(layout.trucks.size(), 7u);
    EXPECT_DOUBLE_EQ(layout.trucks[0].x_position, 1.0);
    EXPECT_DOUBLE_EQ(layout.trucks[0].y_position, 1.0);
    EXPECT_DOUBLE_EQ(layout.trucks[1].x_position, 4.8);
    EXPECT_DOUBLE_EQ(layout.trucks[6].x_position, 1.0);
    EXPECT_DOUBLE_EQ(layout.trucks[6].y_position, 5.0);
    EXPECT_DOUBLE_EQ(layout.height, 9.0);
}

TEST_F(LaneLayoutTest, EmptyYard) {
    std::vector<Truck> trucks{truck("parked", "G1_F1_V1", 3.0)};
    auto layout = layout_yard(trucks, config);
    EXPECT_TRUE(layout.trucks.empty());
    EXPECT_EQ(layout.columns, 0u);
    EXPECT_EQ(layout.rows, 0u);
}
