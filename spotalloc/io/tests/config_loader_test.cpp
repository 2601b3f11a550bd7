#include <spotalloc/io/config_loader.hpp>
#include <spotalloc/io/error.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace spotalloc::io;
using namespace spotalloc::core;

class ConfigLoaderTest : public ::testing::Test {};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(ConfigLoaderTest, EmptyObjectYieldsReferenceDeployment) {
    auto config = load_config_from_string("{}");

    ASSERT_EQ(config.garages().size(), 3u);
    EXPECT_EQ(config.garages()[0].id, "B1");
    EXPECT_DOUBLE_EQ(config.find_garage("B3")->lane_length, 30.0);
    EXPECT_DOUBLE_EQ(config.length_rules().min_truck_length, 5.0);
    EXPECT_DOUBLE_EQ(config.spacing_rules().end_margin, 0.2);
    EXPECT_DOUBLE_EQ(config.layout_rules().yard_width, 25.0);
}

TEST_F(ConfigLoaderTest, PartialRuleOverrides) {
    const char* json = R"({
        "length_rules": {"cabin_length": 2.0},
        "spacing_rules": {"min_spacing": 0.5},
        "layout_rules": {"truck_width": 3.0}
    })";

    auto config = load_config_from_string(json);
    EXPECT_DOUBLE_EQ(config.length_rules().cabin_length, 2.0);
    EXPECT_DOUBLE_EQ(config.length_rules().cabin_threshold, 10.0);
    EXPECT_DOUBLE_EQ(config.spacing_rules().min_spacing, 0.5);
    EXPECT_DOUBLE_EQ(config.spacing_rules().end_margin, 0.2);
    EXPECT_DOUBLE_EQ(config.layout_rules().truck_width, 3.0);
}

TEST_F(ConfigLoaderTest, NonPositiveYardWidthRejected) {
    EXPECT_THROW(load_config_from_string(R"({"layout_rules": {"yard_width": -1.0}})"),
                 LoaderError);
    EXPECT_THROW(load_config_from_string(R"({"layout_rules": {"truck_width": 0}})"),
                 LoaderError);
}

// =============================================================================
// Garages
// =============================================================================

TEST_F(ConfigLoaderTest, GarageWithLaneIds) {
    const char* json = R"({
        "garages": [{
            "id": "G1",
            "name": "North",
            "length": 20.0,
            "padding_top": 2.0,
            "padding_bottom": 2.0,
            "lanes": ["A", "B"]
        }]
    })";

    auto config = load_config_from_string(json);
    ASSERT_EQ(config.garages().size(), 1u);
    const auto& garage = config.garages()[0];
    EXPECT_EQ(garage.name, "North");
    EXPECT_DOUBLE_EQ(garage.lane_length, 16.0);
    ASSERT_EQ(garage.lanes.size(), 2u);
    EXPECT_EQ(garage.lanes[1].id, "B");
    EXPECT_DOUBLE_EQ(garage.lanes[0].x_position, 2.75);
    EXPECT_DOUBLE_EQ(garage.lanes[1].x_position, 8.5);
    EXPECT_TRUE(config.is_valid_token("G1_B_V3"));
}

TEST_F(ConfigLoaderTest, GarageWithLaneObjectsAndExplicitLength) {
    const char* json = R"({
        "garages": [{
            "id": "G1",
            "lane_length": 12.0,
            "lanes": [
                {"id": "F1", "label": "Left", "x_position": 1.0},
                {"id": "F2"}
            ]
        }]
    })";

    auto config = load_config_from_string(json);
    const auto& garage = config.garages()[0];
    EXPECT_EQ(garage.name, "G1");
    EXPECT_DOUBLE_EQ(garage.lane_length, 12.0);
    EXPECT_EQ(garage.lanes[0].label, "Left");
    EXPECT_DOUBLE_EQ(garage.lanes[0].x_position, 1.0);
    EXPECT_EQ(garage.lanes[1].label, "F2");
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ConfigLoaderTest, MalformedJsonThrows) {
    EXPECT_THROW(load_config_from_string("{not json"), LoaderError);
    EXPECT_THROW(load_config_from_string("[]"), LoaderError);
}

TEST_F(ConfigLoaderTest, MissingGarageIdThrows) {
    EXPECT_THROW(load_config_from_string(R"({"garages": [{"lanes": ["F1"]}]})"), LoaderError);
}

TEST_F(ConfigLoaderTest, EmptyLanesThrows) {
    EXPECT_THROW(load_config_from_string(R"({"garages": [{"id": "G1", "lanes": []}]})"),
                 LoaderError);
}

TEST_F(ConfigLoaderTest, MixedLaneFormsThrow) {
    EXPECT_THROW(
        load_config_from_string(R"({"garages": [{"id": "G1", "lanes": ["F1", {"id": "F2"}]}]})"),
        LoaderError);
}

TEST_F(ConfigLoaderTest, InconsistentConfigurationBecomesLoaderError) {
    const char* json = R"({
        "garages": [
            {"id": "G1", "lanes": ["F1"]},
            {"id": "G1", "lanes": ["F1"]}
        ]
    })";

    try {
        load_config_from_string(json);
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("config"), std::string::npos);
        EXPECT_NE(msg.find("duplicate garage id"), std::string::npos);
    }
}

TEST_F(ConfigLoaderTest, SeparatorInLaneIdRejected) {
    EXPECT_THROW(load_config_from_string(R"({"garages": [{"id": "G1", "lanes": ["F_1"]}]})"),
                 LoaderError);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ConfigLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "spotalloc_test_config.json";
    {
        std::ofstream file(path);
        file << R"({"garages": [{"id": "G7", "lane_length": 15.0, "lanes": ["F1"]}]})";
    }

    auto config = load_config(path);
    EXPECT_NE(config.find_garage("G7"), nullptr);
    EXPECT_DOUBLE_EQ(config.find_garage("G7")->lane_length, 15.0);

    std::filesystem::remove(path);
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_config("/nonexistent/spotalloc/config.json"), LoaderError);
}
