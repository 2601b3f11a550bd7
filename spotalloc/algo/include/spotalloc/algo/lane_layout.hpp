#pragma once

/// @file lane_layout.hpp
/// @brief Drawing positions of parked and unparked trucks.
/// @ingroup algo_layout

#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/truck.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spotalloc::algo {

/// @brief A truck with its drawing position.
/// @ingroup algo_layout
struct PositionedTruck {
    core::TruckId truck_id;
    std::string job_name;
    std::optional<std::string> spot;
    double length{};
    double x_position{};  ///< From the garage's (or yard's) left edge (m).
    double y_position{};  ///< From the top of the lane (or yard) (m).
};

/// @brief Positions of the trucks in one lane.
/// @ingroup algo_layout
struct LaneLayout {
    std::string lane_id;
    std::vector<PositionedTruck> trucks;  ///< Ordered by spot number.
    double occupied_length{};             ///< Truck lengths plus minimum spacing.
    double remaining_length{};            ///< Never negative.
};

/// @brief Positions of every lane of a garage.
/// @ingroup algo_layout
struct GarageLayout {
    std::string garage_id;
    std::vector<LaneLayout> lanes;  ///< Empty for an unknown garage.
};

/// @brief Grid placement of unparked trucks.
/// @ingroup algo_layout
struct YardLayout {
    std::vector<PositionedTruck> trucks;
    double width{};
    double height{};
    std::size_t columns{};
    std::size_t rows{};
};

/// @brief Position the trucks of one lane.
///
/// Trucks are packed from the top with the minimum spacing while another
/// minimum-length truck would still fit (or when there is a single truck);
/// otherwise the free length is spread evenly between them.
///
/// @param lane         Lane specification.
/// @param lane_length  Usable lane length.
/// @param trucks       Trucks parked in this lane.
/// @param config       Rule constants.
[[nodiscard]] LaneLayout layout_lane(const core::LaneSpec& lane, double lane_length,
                                     std::span<const core::Truck> trucks,
                                     const core::GarageConfig& config);

/// @brief Position every parked truck of a garage, lane by lane.
/// @param garage_id  Garage to lay out.
/// @param trucks     Trucks of any garage; others are ignored.
/// @param config     Configuration.
[[nodiscard]] GarageLayout layout_garage(std::string_view garage_id,
                                         std::span<const core::Truck> trucks,
                                         const core::GarageConfig& config);

/// @brief Place unparked trucks on a grid.
/// @param trucks  Trucks of any status; parked ones are ignored.
/// @param config  Configuration.
[[nodiscard]] YardLayout layout_yard(std::span<const core::Truck> trucks,
                                     const core::GarageConfig& config);

} // namespace spotalloc::algo
