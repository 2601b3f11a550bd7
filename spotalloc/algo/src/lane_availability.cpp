#include <spotalloc/algo/lane_availability.hpp>

#include <spotalloc/core/truck_length.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace spotalloc::algo {

namespace {

// Absorbs the rounding error of summed decimal lengths so that an exact
// fit is not rejected.
constexpr double FIT_TOLERANCE = 1e-9;

struct Occupant {
    core::SpotNumber spot;
    const core::Truck* truck;
    double length;
};

} // anonymous namespace

double required_gaps(std::size_t truck_count, const core::SpacingRules& rules) noexcept {
    if (truck_count >= core::SPOTS_PER_LANE) {
        return 2.0 * rules.min_spacing;
    }
    return 0.0;
}

double end_margins(const core::SpacingRules& rules) noexcept {
    return 2.0 * rules.end_margin;
}

double round_length(double value) noexcept {
    return std::round(value * 100.0) / 100.0;
}

LaneAvailability compute_lane_availability(
    const std::string& garage_id,
    const core::LaneSpec& lane,
    double lane_length,
    std::span<const core::Truck> trucks,
    double candidate_length,
    const std::optional<core::TruckId>& exclude_truck,
    const core::GarageConfig& config) {
    const auto& spacing = config.spacing_rules();

    std::vector<Occupant> occupants;
    for (const auto& truck : trucks) {
        if (!truck.spot || (exclude_truck && truck.id == *exclude_truck)) {
            continue;
        }
        auto address = core::parse_spot(*truck.spot);
        if (!address || address->garage != garage_id || address->lane != lane.id) {
            continue;
        }
        occupants.push_back({address->number, &truck,
                             core::truck_length(truck, config.length_rules())});
    }
    std::stable_sort(occupants.begin(), occupants.end(),
                     [](const Occupant& lhs, const Occupant& rhs) { return lhs.spot < rhs.spot; });

    double occupants_length = 0.0;
    for (const auto& occupant : occupants) {
        occupants_length += occupant.length;
    }

    const std::size_t count = occupants.size();
    const double margins = end_margins(spacing);
    const double occupied = occupants_length + margins + required_gaps(count, spacing);
    const double hypothetical =
        occupants_length + candidate_length + margins + required_gaps(count + 1, spacing);
    const bool fits = hypothetical <= lane_length + FIT_TOLERANCE;

    LaneAvailability result;
    result.garage_id = garage_id;
    result.lane_id = lane.id;
    result.lane_length = lane_length;
    result.available_space = round_length(std::max(0.0, lane_length - occupied));
    result.truck_count = count;

    for (const auto& occupant : occupants) {
        result.occupied_spots.push_back(occupant.spot);
        result.trucks.push_back({occupant.spot, occupant.truck->id, occupant.truck->job_name,
                                 round_length(occupant.length)});
    }
    result.occupied_spots.erase(
        std::unique(result.occupied_spots.begin(), result.occupied_spots.end()),
        result.occupied_spots.end());

    auto is_occupied = [&](core::SpotNumber n) {
        return std::binary_search(result.occupied_spots.begin(), result.occupied_spots.end(), n);
    };
    const auto normal_taken = std::count_if(result.occupied_spots.begin(),
                                            result.occupied_spots.end(), core::is_normal_spot);
    const bool normal_full = normal_taken >= static_cast<std::ptrdiff_t>(core::LAST_NORMAL_SPOT);

    result.can_fit_in_normal = !normal_full && fits;
    result.can_fit_in_overflow = normal_full && !is_occupied(core::OVERFLOW_SPOT) && fits;
    result.can_fit = result.can_fit_in_normal || result.can_fit_in_overflow;

    if (result.can_fit_in_normal) {
        for (core::SpotNumber n = 1; n <= core::LAST_NORMAL_SPOT; ++n) {
            if (!is_occupied(n)) {
                result.next_spot_number = n;
                break;
            }
        }
    } else if (result.can_fit_in_overflow) {
        result.next_spot_number = core::OVERFLOW_SPOT;
    }

    return result;
}

} // namespace spotalloc::algo
