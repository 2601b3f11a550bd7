#pragma once

/// @file lane_availability.hpp
/// @brief Fit computation for one lane.
/// @ingroup algo_availability

#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/spot.hpp>
#include <spotalloc/core/truck.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace spotalloc::algo {

/// @brief A truck currently parked in a lane, as shown to the operator.
/// @ingroup algo_availability
struct SpotOccupant {
    core::SpotNumber spot_number{};
    core::TruckId truck_id;
    std::string job_name;
    double length{};  ///< Rounded to two decimals.

    bool operator==(const SpotOccupant&) const = default;
};

/// @brief Availability of one lane for a candidate truck.
///
/// @c available_space is what is left with the current occupants; whether
/// the candidate fits is decided on the hypothetical lane that includes
/// it, which can require extra gaps. A candidate may therefore not fit
/// even though its length is below @c available_space.
///
/// @ingroup algo_availability
struct LaneAvailability {
    std::string garage_id;
    std::string lane_id;
    double lane_length{};
    double available_space{};                       ///< Rounded, never negative.
    std::size_t truck_count{};
    bool can_fit{};                                 ///< Normal or overflow fit.
    bool can_fit_in_normal{};
    bool can_fit_in_overflow{};
    std::optional<core::SpotNumber> next_spot_number;
    std::vector<core::SpotNumber> occupied_spots;   ///< Ascending.
    std::vector<SpotOccupant> trucks;               ///< Ordered by spot number.
};

/// @brief Mandatory gaps between trucks for a given occupant count.
///
/// Up to two trucks need no gap; a third truck (the middle spot in use)
/// needs one gap unit on each side.
///
/// @param truck_count  Number of trucks in the lane.
/// @param rules        Spacing constants.
/// @return Total gap length.
[[nodiscard]] double required_gaps(std::size_t truck_count,
                                   const core::SpacingRules& rules) noexcept;

/// @brief Margins at both ends of a lane, independent of occupancy.
[[nodiscard]] double end_margins(const core::SpacingRules& rules) noexcept;

/// @brief Round to two decimals for display.
[[nodiscard]] double round_length(double value) noexcept;

/// @brief Compute availability of one lane.
///
/// Trucks whose spot does not belong to (@p garage_id, @p lane.id) are
/// ignored, as is @p exclude_truck. Trucks without layout count with the
/// minimum length. Never throws for data irregularities.
///
/// @param garage_id         Garage the lane belongs to.
/// @param lane              Lane specification.
/// @param lane_length       Fixed usable length of the lane.
/// @param trucks            Trucks currently parked (any lane).
/// @param candidate_length  Length of the truck to place.
/// @param exclude_truck     Truck to leave out (the one being moved).
/// @param config            Rule constants.
/// @return The lane's availability.
[[nodiscard]] LaneAvailability compute_lane_availability(
    const std::string& garage_id,
    const core::LaneSpec& lane,
    double lane_length,
    std::span<const core::Truck> trucks,
    double candidate_length,
    const std::optional<core::TruckId>& exclude_truck,
    const core::GarageConfig& config);

} // namespace spotalloc::algo
