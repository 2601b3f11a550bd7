#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/error.hpp>

#include <algorithm>
#include <set>
#include <utility>

namespace spotalloc::core {

namespace {

bool has_separator(std::string_view id) {
    return id.find(TOKEN_SEPARATOR) != std::string_view::npos;
}

} // anonymous namespace

GarageSpec make_garage(std::string id, std::string name, const GarageDimensions& dims,
                       const std::vector<std::string>& lane_ids) {
    GarageSpec garage;
    garage.id = std::move(id);
    garage.name = std::move(name);
    garage.width = dims.width;
    garage.length = dims.length;
    garage.lane_length = dims.length - dims.padding_top - dims.padding_bottom;
    garage.lane_width = dims.lane_width;

    for (std::size_t idx = 0; idx < lane_ids.size(); ++idx) {
        LaneSpec lane;
        lane.id = lane_ids[idx];
        lane.label = "Lane " + std::to_string(idx + 1);
        lane.x_position = dims.lane_padding_x +
                          static_cast<double>(idx) * (dims.lane_width + dims.lane_spacing);
        garage.lanes.push_back(std::move(lane));
    }
    return garage;
}

GarageConfig::GarageConfig(std::vector<GarageSpec> garages, LengthRules length,
                           SpacingRules spacing, LayoutRules layout)
    : garages_(std::move(garages))
    , length_(length)
    , spacing_(spacing)
    , layout_(layout) {
    validate();
}

GarageConfig GarageConfig::reference() {
    const std::vector<std::string> lanes{"F1", "F2", "F3"};

    GarageDimensions b1;
    b1.padding_bottom = 7.4;  // lane length 24.6

    GarageDimensions b2;
    b2.padding_bottom = 7.5;  // lane length 24.5

    GarageDimensions b3;
    b3.padding_bottom = 2.0;  // lane length 30.0

    return GarageConfig({
        make_garage("B1", "Garage 1", b1, lanes),
        make_garage("B2", "Garage 2", b2, lanes),
        make_garage("B3", "Garage 3", b3, lanes),
    });
}

void GarageConfig::validate() const {
    if (garages_.empty()) {
        throw ConfigError("configuration must declare at least one garage");
    }
    if (length_.min_truck_length <= 0.0 || length_.cabin_threshold <= 0.0 ||
        length_.cabin_length < 0.0) {
        throw ConfigError("length rules must be positive");
    }
    if (spacing_.min_spacing < 0.0 || spacing_.end_margin < 0.0) {
        throw ConfigError("spacing rules must not be negative");
    }
    if (layout_.truck_width <= 0.0 || layout_.yard_width <= 0.0) {
        throw ConfigError("layout rules must be positive");
    }

    std::set<std::string_view> garage_ids;
    for (const auto& garage : garages_) {
        if (garage.id.empty() || has_separator(garage.id)) {
            throw ConfigError("invalid garage id '" + garage.id + "'");
        }
        if (!garage_ids.insert(garage.id).second) {
            throw ConfigError("duplicate garage id '" + garage.id + "'");
        }
        if (garage.lane_length <= 0.0) {
            throw ConfigError("garage '" + garage.id + "' lane length must be positive");
        }

        std::set<std::string_view> lane_ids;
        for (const auto& lane : garage.lanes) {
            if (lane.id.empty() || has_separator(lane.id)) {
                throw ConfigError("invalid lane id '" + lane.id + "' in garage '" +
                                  garage.id + "'");
            }
            if (!lane_ids.insert(lane.id).second) {
                throw ConfigError("duplicate lane id '" + lane.id + "' in garage '" +
                                  garage.id + "'");
            }
        }
    }
}

const GarageSpec* GarageConfig::find_garage(std::string_view garage_id) const noexcept {
    auto it = std::find_if(garages_.begin(), garages_.end(),
                           [&](const GarageSpec& g) { return g.id == garage_id; });
    return it == garages_.end() ? nullptr : &*it;
}

const LaneSpec* GarageConfig::find_lane(std::string_view garage_id,
                                        std::string_view lane_id) const noexcept {
    const GarageSpec* garage = find_garage(garage_id);
    if (!garage) {
        return nullptr;
    }
    auto it = std::find_if(garage->lanes.begin(), garage->lanes.end(),
                           [&](const LaneSpec& l) { return l.id == lane_id; });
    return it == garage->lanes.end() ? nullptr : &*it;
}

bool GarageConfig::is_valid_spot(const SpotAddress& address) const noexcept {
    return address.number >= 1 && address.number <= SPOTS_PER_LANE &&
           find_lane(address.garage, address.lane) != nullptr;
}

bool GarageConfig::is_valid_token(std::string_view token) const {
    auto address = parse_spot(token);
    return address && is_valid_spot(*address);
}

std::vector<std::string> GarageConfig::garage_spot_tokens(std::string_view garage_id) const {
    std::vector<std::string> tokens;
    const GarageSpec* garage = find_garage(garage_id);
    if (!garage) {
        return tokens;
    }
    tokens.reserve(garage->lanes.size() * SPOTS_PER_LANE);
    for (const auto& lane : garage->lanes) {
        for (SpotNumber n = 1; n <= SPOTS_PER_LANE; ++n) {
            tokens.push_back(format_spot({garage->id, lane.id, n}));
        }
    }
    return tokens;
}

std::vector<std::string> GarageConfig::lane_spot_tokens(std::string_view garage_id,
                                                        std::string_view lane_id) const {
    std::vector<std::string> tokens;
    if (!find_lane(garage_id, lane_id)) {
        return tokens;
    }
    for (SpotNumber n = 1; n <= SPOTS_PER_LANE; ++n) {
        tokens.push_back(format_spot({std::string(garage_id), std::string(lane_id), n}));
    }
    return tokens;
}

std::size_t GarageConfig::spot_count(std::string_view garage_id) const noexcept {
    const GarageSpec* garage = find_garage(garage_id);
    return garage ? garage->lanes.size() * SPOTS_PER_LANE : 0;
}

} // namespace spotalloc::core
