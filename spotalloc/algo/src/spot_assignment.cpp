#include <spotalloc/algo/spot_assignment.hpp>

#include <spotalloc/core/audit.hpp>
#include <spotalloc/core/error.hpp>
#include <spotalloc/core/spot.hpp>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace spotalloc::algo {

namespace {

using core::AuditObject;
using core::AuditRecord;
using core::AuditValue;
using core::ChangeCause;
using core::StoreTransaction;
using core::Truck;
using core::TruckId;

AuditValue to_value(const std::optional<std::string>& value) {
    return core::to_audit_value(value);
}

AuditValue to_value(const std::optional<double>& value) {
    if (!value) {
        return std::monostate{};
    }
    return *value;
}

AuditRecord make_record(const TruckId& truck_id, std::string field, AuditValue old_value,
                        AuditValue new_value, ChangeCause cause,
                        const std::optional<std::string>& user_id, std::string reason) {
    AuditRecord record;
    record.entity_id = truck_id;
    record.field = std::move(field);
    record.old_value = std::move(old_value);
    record.new_value = std::move(new_value);
    record.cause = cause;
    record.user_id = user_id;
    record.reason = std::move(reason);
    return record;
}

template<typename T>
void track_field(StoreTransaction& tx, const TruckId& truck_id, const char* field,
                 const std::optional<T>& before, const std::optional<T>& after,
                 const std::optional<std::string>& user_id) {
    if (before == after) {
        return;
    }
    tx.record(make_record(truck_id, field, to_value(before), to_value(after),
                          ChangeCause::UserAction, user_id,
                          std::string("field '") + field + "' updated"));
}

template<typename T>
void apply(std::optional<T>& field, const Nullable<T>& patch) {
    if (patch) {
        field = *patch;
    }
}

// Clear every truck outside @p keep that sits on one of @p targets.
void evict_occupants(StoreTransaction& tx, std::span<const std::string> targets,
                     const std::unordered_set<TruckId>& keep,
                     const std::optional<std::string>& user_id,
                     std::vector<TruckId>& evicted) {
    if (targets.empty()) {
        return;
    }

    std::vector<core::SpotUpdate> clears;
    for (const auto& occupant : tx.find_trucks_in_spots(targets)) {
        if (keep.contains(occupant.id)) {
            continue;
        }
        clears.push_back({occupant.id, std::nullopt});
        evicted.push_back(occupant.id);
        tx.record(make_record(occupant.id, "spot", to_value(occupant.spot), std::monostate{},
                              ChangeCause::SystemGenerated, user_id,
                              "spot " + core::spot_label(occupant.spot) +
                                  " reassigned to another truck"));
    }
    tx.update_spots(clears);
}

} // anonymous namespace

SpotAssignmentService::SpotAssignmentService(core::EntityStore& store,
                                             const core::GarageConfig& config)
    : store_(store)
    , config_(config) {}

core::Truck SpotAssignmentService::update_truck(const core::TruckId& truck_id,
                                                const TruckPatch& patch,
                                                const std::optional<std::string>& user_id) {
    if (patch.spot && *patch.spot && !config_.is_valid_token(**patch.spot)) {
        throw core::InvalidSpotError("spot '" + **patch.spot + "' is not a configured spot");
    }

    return core::unit_of_work(store_, [&](StoreTransaction& tx) {
        auto existing = tx.find_truck(truck_id);
        if (!existing) {
            throw core::NotFoundError("truck '" + truck_id + "' not found");
        }

        Truck updated = *existing;
        apply(updated.spot, patch.spot);
        apply(updated.plate, patch.plate);
        apply(updated.chassis_number, patch.chassis_number);
        apply(updated.category, patch.category);
        apply(updated.implement_type, patch.implement_type);
        apply(updated.x_position, patch.x_position);
        apply(updated.y_position, patch.y_position);

        if (updated.spot && updated.spot != existing->spot) {
            std::vector<TruckId> evicted;
            const std::string targets[] = {*updated.spot};
            evict_occupants(tx, targets, {truck_id}, user_id, evicted);
        }

        tx.save_truck(updated);

        track_field(tx, truck_id, "spot", existing->spot, updated.spot, user_id);
        track_field(tx, truck_id, "plate", existing->plate, updated.plate, user_id);
        track_field(tx, truck_id, "chassis_number", existing->chassis_number,
                    updated.chassis_number, user_id);
        track_field(tx, truck_id, "category", existing->category, updated.category, user_id);
        track_field(tx, truck_id, "implement_type", existing->implement_type,
                    updated.implement_type, user_id);
        track_field(tx, truck_id, "x_position", existing->x_position, updated.x_position,
                    user_id);
        track_field(tx, truck_id, "y_position", existing->y_position, updated.y_position,
                    user_id);

        auto from_garage = core::spot_garage(existing->spot);
        auto to_garage = core::spot_garage(updated.spot);
        if (from_garage != to_garage) {
            tx.record(make_record(truck_id, "vehicle_movement",
                                  AuditObject{{"from", core::to_audit_scalar(from_garage)}},
                                  AuditObject{{"to", core::to_audit_scalar(to_garage)}},
                                  ChangeCause::VehicleMovement, user_id,
                                  "vehicle moved from garage " + from_garage.value_or("none") +
                                      " to garage " + to_garage.value_or("none")));
        }

        if ((patch.x_position || patch.y_position) &&
            (existing->x_position != updated.x_position ||
             existing->y_position != updated.y_position)) {
            tx.record(make_record(truck_id, "parking_position",
                                  AuditObject{{"x", core::to_audit_scalar(existing->x_position)},
                                              {"y", core::to_audit_scalar(existing->y_position)}},
                                  AuditObject{{"x", core::to_audit_scalar(updated.x_position)},
                                              {"y", core::to_audit_scalar(updated.y_position)}},
                                  ChangeCause::ParkingAssignment, user_id,
                                  "parking position updated"));
        }

        return updated;
    });
}

BatchUpdateResult SpotAssignmentService::batch_update(std::span<const SpotRequest> requests,
                                                      const std::optional<std::string>& user_id) {
    // Last item per truck wins. Walking backwards keeps the first occurrence
    // seen. Unknown tokens never reach the store.
    std::vector<const SpotRequest*> effective;
    std::vector<TruckId> skipped;
    std::unordered_set<TruckId> seen_trucks;

    for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
        if (!seen_trucks.insert(it->truck_id).second ||
            (it->spot && !config_.is_valid_token(*it->spot))) {
            skipped.push_back(it->truck_id);
            continue;
        }
        effective.push_back(&*it);
    }
    std::reverse(effective.begin(), effective.end());
    std::reverse(skipped.begin(), skipped.end());

    return core::unit_of_work(store_, [&](StoreTransaction& tx) {
        BatchUpdateResult result;
        result.skipped = skipped;

        // Every requested target is cleared, including those of missing trucks
        std::vector<std::string> targets;
        for (const SpotRequest* request : effective) {
            if (request->spot) {
                targets.push_back(*request->spot);
            }
        }

        std::vector<std::pair<const SpotRequest*, Truck>> found;
        for (const SpotRequest* request : effective) {
            auto existing = tx.find_truck(request->truck_id);
            if (!existing) {
                result.skipped.push_back(request->truck_id);
                continue;
            }
            found.emplace_back(request, std::move(*existing));
        }

        // Last found item per spot wins
        std::vector<std::pair<const SpotRequest*, Truck>> applied;
        std::unordered_set<std::string> seen_spots;
        for (auto it = found.rbegin(); it != found.rend(); ++it) {
            if (it->first->spot && !seen_spots.insert(*it->first->spot).second) {
                result.skipped.push_back(it->first->truck_id);
                continue;
            }
            applied.push_back(std::move(*it));
        }
        std::reverse(applied.begin(), applied.end());

        // Trucks left out of the batch lose a target spot like any other occupant
        std::unordered_set<TruckId> batch_ids;
        for (const auto& [request, truck] : applied) {
            batch_ids.insert(request->truck_id);
        }

        // Pre-clearing is complete before the first assignment is applied
        evict_occupants(tx, targets, batch_ids, user_id, result.evicted);

        std::vector<core::SpotUpdate> updates;
        updates.reserve(applied.size());
        for (const auto& [request, truck] : applied) {
            updates.push_back({request->truck_id, request->spot});
            track_field(tx, request->truck_id, "spot", truck.spot, request->spot, user_id);
        }
        tx.update_spots(updates);

        result.updated_count = updates.size();
        return result;
    });
}

} // namespace spotalloc::algo
