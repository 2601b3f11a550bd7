#include <spotalloc/algo/garage_availability.hpp>

#include <spotalloc/core/truck_length.hpp>

#include <exception>
#include <system_error>
#include <thread>

namespace spotalloc::algo {

namespace {

void join_all(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // anonymous namespace

AvailabilityService::AvailabilityService(const core::EntityStore& store,
                                         const core::GarageConfig& config)
    : store_(store)
    , config_(config) {}

GarageAvailability AvailabilityService::garage_availability(
    std::string_view garage_id, double candidate_length,
    const std::optional<core::TruckId>& exclude_truck) const {
    GarageAvailability result;
    result.garage_id = std::string(garage_id);

    const core::GarageSpec* garage = config_.find_garage(garage_id);
    if (!garage) {
        return result;
    }
    result.name = garage->name;
    result.total_spots = config_.spot_count(garage_id);

    auto tokens = config_.garage_spot_tokens(garage_id);
    auto parked = store_.find_trucks_in_spots(tokens);

    for (const auto& lane : garage->lanes) {
        auto lane_result = compute_lane_availability(garage->id, lane, garage->lane_length, parked,
                                                     candidate_length, exclude_truck, config_);
        result.occupied_spots += lane_result.truck_count;
        result.can_fit = result.can_fit || lane_result.can_fit;
        result.lanes.push_back(std::move(lane_result));
    }
    return result;
}

std::vector<GarageAvailability> AvailabilityService::all_garages(
    double candidate_length, const std::optional<core::TruckId>& exclude_truck) const {
    auto garages = config_.garages();
    std::vector<GarageAvailability> results(garages.size());
    std::vector<std::exception_ptr> errors(garages.size());

    std::vector<std::thread> threads;
    threads.reserve(garages.size());
    try {
        for (std::size_t idx = 0; idx < garages.size(); ++idx) {
            threads.emplace_back([this, idx, &garages, &results, &errors, candidate_length,
                                  &exclude_truck]() {
                try {
                    results[idx] =
                        garage_availability(garages[idx].id, candidate_length, exclude_truck);
                } catch (...) {
                    errors[idx] = std::current_exception();
                }
            });
        }
    } catch (const std::system_error&) {
        // Workers already started still reference results and errors
        join_all(threads);
        throw;
    }
    join_all(threads);

    // A failing store read surfaces on the calling thread
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return results;
}

double AvailabilityService::candidate_length_of(const core::TruckId& truck_id) const {
    auto truck = store_.find_truck(truck_id);
    if (!truck) {
        return config_.length_rules().min_truck_length;
    }
    return core::truck_length(*truck, config_.length_rules());
}

} // namespace spotalloc::algo
