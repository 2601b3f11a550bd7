#include <spotalloc/io/error.hpp>
#include <spotalloc/io/fleet_loader.hpp>

#include <spotalloc/core/truck_length.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

using namespace spotalloc::io;
using namespace spotalloc::core;

class FleetLoaderTest : public ::testing::Test {
protected:
    GarageConfig config = GarageConfig::reference();
    InMemoryEntityStore store;
};

// =============================================================================
// Loading
// =============================================================================

TEST_F(FleetLoaderTest, LoadTrucksWithAllFields) {
    const char* json = R"({
        "trucks": [
            {
                "id": "t1",
                "spot": "B1_F1_V1",
                "plate": "AB-123-CD",
                "chassis_number": "CH-1",
                "category": "semi",
                "implement_type": "crane",
                "job_name": "Job 1",
                "x_position": 1.5,
                "y_position": null,
                "left_sections": [4.0, 3.0]
            },
            {"id": "t2"}
        ]
    })";

    EXPECT_EQ(load_fleet_from_string(store, json, config), 2u);
    EXPECT_EQ(store.size(), 2u);

    auto t1 = store.find_truck("t1");
    ASSERT_TRUE(t1.has_value());
    EXPECT_EQ(t1->spot, "B1_F1_V1");
    EXPECT_EQ(t1->plate, "AB-123-CD");
    EXPECT_EQ(t1->chassis_number, "CH-1");
    EXPECT_EQ(t1->category, "semi");
    EXPECT_EQ(t1->implement_type, "crane");
    EXPECT_EQ(t1->job_name, "Job 1");
    EXPECT_EQ(t1->x_position, 1.5);
    EXPECT_FALSE(t1->y_position.has_value());
    EXPECT_TRUE(std::holds_alternative<LeftLayout>(t1->layout));
    EXPECT_DOUBLE_EQ(truck_length(*t1, config.length_rules()), 8.8);

    auto t2 = store.find_truck("t2");
    ASSERT_TRUE(t2.has_value());
    EXPECT_FALSE(t2->spot.has_value());
    EXPECT_TRUE(std::holds_alternative<NoLayout>(t2->layout));
}

TEST_F(FleetLoaderTest, BothSideLayouts) {
    const char* json = R"({
        "trucks": [{"id": "t1", "left_sections": [12.0], "right_sections": [3.0]}]
    })";

    load_fleet_from_string(store, json, config);
    const auto& layout = store.find_truck("t1")->layout;
    ASSERT_TRUE(std::holds_alternative<BothLayouts>(layout));
    EXPECT_EQ(std::get<BothLayouts>(layout).right.size(), 1u);
}

TEST_F(FleetLoaderTest, EmptyFleet) {
    EXPECT_EQ(load_fleet_from_string(store, "{}", config), 0u);
    EXPECT_EQ(store.size(), 0u);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(FleetLoaderTest, DuplicateIdThrows) {
    const char* json = R"({"trucks": [{"id": "t1"}, {"id": "t1"}]})";
    EXPECT_THROW(load_fleet_from_string(store, json, config), LoaderError);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(FleetLoaderTest, DuplicateSpotThrows) {
    const char* json = R"({"trucks": [
        {"id": "t1", "spot": "B1_F1_V1"},
        {"id": "t2", "spot": "B1_F1_V1"}
    ]})";
    EXPECT_THROW(load_fleet_from_string(store, json, config), LoaderError);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(FleetLoaderTest, UnknownSpotThrows) {
    const char* json = R"({"trucks": [{"id": "t1", "spot": "B9_F1_V1"}]})";
    try {
        load_fleet_from_string(store, json, config);
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("trucks[0]"), std::string::npos);
        EXPECT_NE(msg.find("B9_F1_V1"), std::string::npos);
    }
}

TEST_F(FleetLoaderTest, NegativeSectionWidthThrows) {
    const char* json = R"({"trucks": [{"id": "t1", "left_sections": [4.0, -1.0]}]})";
    EXPECT_THROW(load_fleet_from_string(store, json, config), LoaderError);
}

TEST_F(FleetLoaderTest, WrongTypesThrow) {
    EXPECT_THROW(load_fleet_from_string(store, R"({"trucks": [{"id": 7}]})", config),
                 LoaderError);
    EXPECT_THROW(load_fleet_from_string(store, R"({"trucks": [{"id": "t", "plate": 1}]})", config),
                 LoaderError);
    EXPECT_THROW(load_fleet_from_string(store, R"({"trucks": {}})", config), LoaderError);
    EXPECT_THROW(load_fleet_from_string(store, R"({"trucks": [42]})", config), LoaderError);
}

// =============================================================================
// Writing
// =============================================================================

TEST_F(FleetLoaderTest, WriteThenReloadPreservesTrucks) {
    const char* json = R"({
        "trucks": [
            {"id": "a", "spot": "B2_F3_V2", "plate": "P1", "job_name": "J",
             "x_position": 2.5, "right_sections": [6.0, 1.5]},
            {"id": "b", "left_sections": [3.0], "right_sections": [4.0]}
        ]
    })";
    load_fleet_from_string(store, json, config);

    std::ostringstream oss;
    write_fleet_to_stream(store, oss);

    InMemoryEntityStore reloaded;
    EXPECT_EQ(load_fleet_from_string(reloaded, oss.str(), config), 2u);
    EXPECT_EQ(reloaded.trucks(), store.trucks());
}

TEST_F(FleetLoaderTest, WriteTruckUsesNullForUnsetFields) {
    Truck truck;
    truck.id = "t1";

    std::ostringstream oss;
    write_truck_to_stream(truck, oss);
    std::string out = oss.str();
    EXPECT_NE(out.find("\"spot\":null"), std::string::npos);
    EXPECT_NE(out.find("\"id\":\"t1\""), std::string::npos);
    EXPECT_EQ(out.find("left_sections"), std::string::npos);
}

TEST_F(FleetLoaderTest, WriteFleetToFile) {
    load_fleet_from_string(store, R"({"trucks": [{"id": "t1", "spot": "B1_F1_V3"}]})", config);

    auto path = std::filesystem::temp_directory_path() / "spotalloc_test_fleet.json";
    write_fleet(store, path);

    InMemoryEntityStore reloaded;
    EXPECT_EQ(load_fleet(reloaded, path, config), 1u);
    EXPECT_EQ(reloaded.find_truck("t1")->spot, "B1_F1_V3");

    std::filesystem::remove(path);
}

TEST_F(FleetLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_fleet(store, "/nonexistent/spotalloc/fleet.json", config), LoaderError);
}
