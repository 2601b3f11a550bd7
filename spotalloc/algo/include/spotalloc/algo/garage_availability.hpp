#pragma once

/// @file garage_availability.hpp
/// @brief Availability across the lanes of a garage and across garages.
/// @ingroup algo_availability

#include <spotalloc/algo/lane_availability.hpp>

#include <spotalloc/core/entity_store.hpp>
#include <spotalloc/core/garage_config.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spotalloc::algo {

/// @brief Availability of one garage for a candidate truck.
/// @ingroup algo_availability
struct GarageAvailability {
    std::string garage_id;
    std::string name;
    std::vector<LaneAvailability> lanes;  ///< In configuration order.
    std::size_t total_spots{};            ///< lanes * SPOTS_PER_LANE.
    std::size_t occupied_spots{};         ///< Trucks currently parked.
    bool can_fit{};                       ///< True if any lane can fit.
};

/// @brief Read-only view of lane occupancy for spot selection screens.
///
/// Results are advisory snapshots: nothing is locked between computing
/// availability and a later SpotAssignmentService call, so a result can
/// be stale by the time an assignment is made.
///
/// @ingroup algo_availability
/// @see compute_lane_availability, SpotAssignmentService
class AvailabilityService {
public:
    /// @brief Construct over a store and a configuration.
    /// @param store   Entity store (must outlive the service).
    /// @param config  Configuration (must outlive the service).
    AvailabilityService(const core::EntityStore& store, const core::GarageConfig& config);

    /// @brief Availability of one garage.
    ///
    /// An unknown garage yields an empty result with @c can_fit false.
    ///
    /// @param garage_id         Garage to evaluate.
    /// @param candidate_length  Length of the truck to place.
    /// @param exclude_truck     Truck to leave out of the occupancy.
    [[nodiscard]] GarageAvailability garage_availability(
        std::string_view garage_id, double candidate_length,
        const std::optional<core::TruckId>& exclude_truck = std::nullopt) const;

    /// @brief Availability of every configured garage.
    ///
    /// Garages are evaluated concurrently, one thread each; the result keeps
    /// configuration order.
    [[nodiscard]] std::vector<GarageAvailability> all_garages(
        double candidate_length,
        const std::optional<core::TruckId>& exclude_truck = std::nullopt) const;

    /// @brief Length of a stored truck, for use as candidate length.
    /// @return Its computed length, or the minimum length if it does not exist.
    [[nodiscard]] double candidate_length_of(const core::TruckId& truck_id) const;

private:
    const core::EntityStore& store_;
    const core::GarageConfig& config_;
};

} // namespace spotalloc::algo
