#pragma once

/// @file spot_assignment.hpp
/// @brief Transactional write path for spot assignments.
/// @ingroup algo_assignment

#include <spotalloc/core/entity_store.hpp>
#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/truck.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace spotalloc::algo {

/// @brief Field update that can also set a value to null.
///
/// Outer nullopt: leave the field alone. Inner nullopt: clear it.
template<typename T>
using Nullable = std::optional<std::optional<T>>;

/// @brief Fields a single update may change. Unset fields are left alone.
/// @ingroup algo_assignment
struct TruckPatch {
    Nullable<std::string> spot;
    Nullable<std::string> plate;
    Nullable<std::string> chassis_number;
    Nullable<std::string> category;
    Nullable<std::string> implement_type;
    Nullable<double> x_position;
    Nullable<double> y_position;
};

/// @brief One item of a batch update.
/// @ingroup algo_assignment
struct SpotRequest {
    core::TruckId truck_id;
    std::optional<std::string> spot;  ///< nullopt unparks the truck.
};

/// @brief Outcome of a batch update.
/// @ingroup algo_assignment
struct BatchUpdateResult {
    std::size_t updated_count{};          ///< Trucks found and written.
    std::vector<core::TruckId> skipped;   ///< Missing trucks, unknown tokens, superseded items.
    std::vector<core::TruckId> evicted;   ///< Non-batch occupants cleared from target spots.
};

/// @brief Applies spot assignments inside one unit of work each.
///
/// Protects the one invariant the engine owns: no two trucks reference the
/// same spot token at commit time. Whether a truck physically fits is not
/// checked here; callers consult AvailabilityService first.
///
/// Audit records produced, all within the same transaction:
///  - one per changed tracked field (cause UserAction);
///  - "vehicle_movement" when the garage part of the spot changes;
///  - "parking_position" when x/y change;
///  - one per eviction of a conflicting occupant (cause SystemGenerated).
///
/// @ingroup algo_assignment
/// @see AvailabilityService, core::EntityStore
class SpotAssignmentService {
public:
    /// @brief Construct over a store and a configuration.
    /// @param store   Entity store (must outlive the service).
    /// @param config  Configuration (must outlive the service).
    SpotAssignmentService(core::EntityStore& store, const core::GarageConfig& config);

    /// @brief Update one truck.
    ///
    /// If the spot changes to a token held by another truck, that truck is
    /// evicted first, as in batch_update().
    ///
    /// @param truck_id  Truck to update.
    /// @param patch     Fields to change.
    /// @param user_id   Acting user for the audit trail.
    /// @return The truck as committed.
    /// @throws core::NotFoundError if the truck does not exist (nothing changes).
    /// @throws core::InvalidSpotError if the new spot is not a configured spot.
    core::Truck update_truck(const core::TruckId& truck_id, const TruckPatch& patch,
                             const std::optional<std::string>& user_id = std::nullopt);

    /// @brief Assign spots to several trucks at once.
    ///
    /// Before any assignment is applied, every truck outside the batch that
    /// sits on one of the requested spots is cleared, even when the spot was
    /// requested for a missing truck. Items for missing trucks or unknown
    /// tokens are skipped. When a truck appears more than once, or several
    /// existing trucks ask for the same spot, the last item wins and earlier
    /// ones are skipped.
    ///
    /// @param requests  Truck/spot pairs.
    /// @param user_id   Acting user for the audit trail.
    /// @return Counts of applied items plus skipped and evicted trucks.
    BatchUpdateResult batch_update(std::span<const SpotRequest> requests,
                                   const std::optional<std::string>& user_id = std::nullopt);

private:
    core::EntityStore& store_;
    const core::GarageConfig& config_;
};

} // namespace spotalloc::algo
