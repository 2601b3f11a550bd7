#include <spotalloc/algo/lane_layout.hpp>

#include <spotalloc/core/spot.hpp>
#include <spotalloc/core/truck_length.hpp>

#include <algorithm>
#include <cmath>

namespace spotalloc::algo {

namespace {

core::SpotNumber spot_number_of(const core::Truck& truck) {
    if (!truck.spot) {
        return 0;
    }
    auto address = core::parse_spot(*truck.spot);
    return address ? address->number : 0;
}

PositionedTruck position(const core::Truck& truck, double length) {
    PositionedTruck positioned;
    positioned.truck_id = truck.id;
    positioned.job_name = truck.job_name;
    positioned.spot = truck.spot;
    positioned.length = length;
    return positioned;
}

} // anonymous namespace

LaneLayout layout_lane(const core::LaneSpec& lane, double lane_length,
                       std::span<const core::Truck> trucks, const core::GarageConfig& config) {
    LaneLayout layout;
    layout.lane_id = lane.id;
    layout.remaining_length = lane_length;

    if (trucks.empty()) {
        return layout;
    }

    std::vector<const core::Truck*> sorted;
    sorted.reserve(trucks.size());
    for (const auto& truck : trucks) {
        sorted.push_back(&truck);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const core::Truck* lhs, const core::Truck* rhs) {
                         return spot_number_of(*lhs) < spot_number_of(*rhs);
                     });

    const auto& rules = config.length_rules();
    const double min_spacing = config.spacing_rules().min_spacing;

    std::vector<double> lengths;
    double total_length = 0.0;
    for (const auto* truck : sorted) {
        lengths.push_back(core::truck_length(*truck, rules));
        total_length += lengths.back();
    }

    const std::size_t count = sorted.size();
    const double occupied = total_length + static_cast<double>(count - 1) * min_spacing;
    const double remaining = lane_length - occupied;
    const bool room_for_another = remaining >= rules.min_truck_length + min_spacing;

    double spacing = min_spacing;
    if (!room_for_another && count > 1) {
        spacing = (lane_length - total_length) / static_cast<double>(count - 1);
    }

    double y = 0.0;
    for (std::size_t idx = 0; idx < count; ++idx) {
        PositionedTruck positioned = position(*sorted[idx], lengths[idx]);
        positioned.x_position = lane.x_position;
        positioned.y_position = y;
        layout.trucks.push_back(std::move(positioned));
        y += lengths[idx] + spacing;
    }

    layout.occupied_length = occupied;
    layout.remaining_length = std::max(0.0, remaining);
    return layout;
}

GarageLayout layout_garage(std::string_view garage_id, std::span<const core::Truck> trucks,
                           const core::GarageConfig& config) {
    GarageLayout layout;
    layout.garage_id = std::string(garage_id);

    const core::GarageSpec* garage = config.find_garage(garage_id);
    if (!garage) {
        return layout;
    }

    for (const auto& lane : garage->lanes) {
        std::vector<core::Truck> in_lane;
        for (const auto& truck : trucks) {
            if (!truck.spot) {
                continue;
            }
            auto address = core::parse_spot(*truck.spot);
            if (address && address->garage == garage->id && address->lane == lane.id) {
                in_lane.push_back(truck);
            }
        }
        layout.lanes.push_back(layout_lane(lane, garage->lane_length, in_lane, config));
    }
    return layout;
}

YardLayout layout_yard(std::span<const core::Truck> trucks, const core::GarageConfig& config) {
    YardLayout layout;

    std::vector<const core::Truck*> unparked;
    for (const auto& truck : trucks) {
        if (!truck.spot) {
            unparked.push_back(&truck);
        }
    }
    if (unparked.empty()) {
        return layout;
    }

    const auto& rules = config.length_rules();
    const double spacing = config.spacing_rules().min_spacing;
    const double truck_width = config.layout_rules().truck_width;

    std::vector<double> lengths;
    double total_length = 0.0;
    for (const auto* truck : unparked) {
        lengths.push_back(core::truck_length(*truck, rules));
        total_length += lengths.back();
    }
    const double mean_length = total_length / static_cast<double>(unparked.size());

    const double column_pitch = truck_width + spacing;
    const double row_pitch = mean_length + spacing;
    layout.columns = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::floor(config.layout_rules().yard_width / column_pitch)));
    layout.rows = (unparked.size() + layout.columns - 1) / layout.columns;

    for (std::size_t idx = 0; idx < unparked.size(); ++idx) {
        const auto col = idx % layout.columns;
        const auto row = idx / layout.columns;
        PositionedTruck positioned = position(*unparked[idx], lengths[idx]);
        positioned.x_position = static_cast<double>(col) * column_pitch + spacing;
        positioned.y_position = static_cast<double>(row) * row_pitch + spacing;
        layout.trucks.push_back(std::move(positioned));
    }

    layout.width = static_cast<double>(layout.columns) * column_pitch + spacing;
    layout.height = static_cast<double>(layout.rows) * row_pitch + spacing;
    return layout;
}

} // namespace spotalloc::algo
