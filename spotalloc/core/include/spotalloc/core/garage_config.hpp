#pragma once

/// @file garage_config.hpp
/// @brief Immutable garage topology and allocation constants.
/// @ingroup core_config

#include <spotalloc/core/spot.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spotalloc::core {

/// @brief Constants of the two-tier truck length rule.
///
/// @see truck_length
/// @ingroup core_config
struct LengthRules {
    double min_truck_length{5.0};  ///< Floor for any computed length (m).
    double cabin_threshold{10.0};  ///< Bodies shorter than this get a cabin added (m).
    double cabin_length{1.8};      ///< Cabin allowance for short bodies (m).
};

/// @brief Constants of the lane packing rule.
///
/// @see compute_lane_availability
/// @ingroup core_config
struct SpacingRules {
    double min_spacing{1.0};  ///< One gap unit between trucks (m).
    double end_margin{0.2};   ///< Margin at each end of a lane (m).
};

/// @brief Constants used only to draw trucks (lane and yard layout).
/// @ingroup core_config
struct LayoutRules {
    double truck_width{2.8};   ///< Truck width seen from above (m).
    double yard_width{25.0};   ///< Target width of the yard grid (m).
};

/// @brief A lane inside a garage.
/// @ingroup core_config
struct LaneSpec {
    std::string id;        ///< Lane id, unique within the garage (e.g. "F1").
    std::string label;     ///< Display label.
    double x_position{};   ///< Distance from the garage's left edge (m).
};

/// @brief A garage and its fixed set of lanes.
/// @ingroup core_config
struct GarageSpec {
    std::string id;             ///< Garage code (e.g. "B1").
    std::string name;           ///< Display name.
    double width{};             ///< Across the lanes (m).
    double length{};            ///< Along the lanes (m).
    double lane_length{};       ///< Usable length of every lane (m).
    double lane_width{3.0};     ///< Width of every lane (m).
    std::vector<LaneSpec> lanes;
};

/// @brief Garage dimensions used to derive lane positions.
/// @see make_garage
/// @ingroup core_config
struct GarageDimensions {
    double width{20.0};
    double length{35.0};
    double padding_top{3.0};
    double padding_bottom{7.4};
    double lane_width{3.0};
    double lane_spacing{2.75};
    double lane_padding_x{2.75};
};

/// @brief Build a GarageSpec whose lanes are laid out from the left edge.
///
/// Lane length is `length - padding_top - padding_bottom`; the x position of
/// lane @c i is `lane_padding_x + i * (lane_width + lane_spacing)`.
///
/// @param id        Garage code.
/// @param name      Display name.
/// @param dims      Physical dimensions.
/// @param lane_ids  Lane ids in left-to-right order.
/// @return The garage specification.
[[nodiscard]] GarageSpec make_garage(std::string id, std::string name,
                                     const GarageDimensions& dims,
                                     const std::vector<std::string>& lane_ids);

/// @brief Process-wide, read-only configuration of the allocation engine.
///
/// Holds the garage/lane enumeration and every rule constant. Construct it
/// once at startup and pass it by reference; nothing in the engine reads
/// ambient globals. The only hard-coded structure is the three-spot lane
/// (spots 1-2 normal, spot 3 overflow); garage and lane counts come from
/// the specs.
///
/// @see GarageConfig::reference, io::load_config
/// @ingroup core_config
class GarageConfig {
public:
    /// @brief Construct and validate a configuration.
    /// @param garages  Garage specifications (at least one).
    /// @param length   Truck length rule constants.
    /// @param spacing  Lane packing constants.
    /// @param layout   Drawing constants.
    /// @throws ConfigError if ids are duplicated or contain the token
    ///         separator, or if a length or constant is not positive.
    GarageConfig(std::vector<GarageSpec> garages, LengthRules length = {},
                 SpacingRules spacing = {}, LayoutRules layout = {});

    /// @brief The reference deployment: garages B1, B2 and B3 with lanes F1-F3.
    [[nodiscard]] static GarageConfig reference();

    [[nodiscard]] std::span<const GarageSpec> garages() const noexcept { return garages_; }
    [[nodiscard]] const LengthRules& length_rules() const noexcept { return length_; }
    [[nodiscard]] const SpacingRules& spacing_rules() const noexcept { return spacing_; }
    [[nodiscard]] const LayoutRules& layout_rules() const noexcept { return layout_; }

    /// @brief Look up a garage by id.
    /// @return Pointer to the garage, or nullptr if unknown.
    [[nodiscard]] const GarageSpec* find_garage(std::string_view garage_id) const noexcept;

    /// @brief Look up a lane by garage and lane id.
    /// @return Pointer to the lane, or nullptr if unknown.
    [[nodiscard]] const LaneSpec* find_lane(std::string_view garage_id,
                                            std::string_view lane_id) const noexcept;

    /// @brief Returns true if @p address names a configured spot.
    [[nodiscard]] bool is_valid_spot(const SpotAddress& address) const noexcept;

    /// @brief Returns true if @p token parses and names a configured spot.
    [[nodiscard]] bool is_valid_token(std::string_view token) const;

    /// @brief All spot tokens of a garage, in lane then spot order.
    /// @return Empty if the garage is unknown.
    [[nodiscard]] std::vector<std::string> garage_spot_tokens(std::string_view garage_id) const;

    /// @brief The three spot tokens of one lane.
    /// @return Empty if the lane is unknown.
    [[nodiscard]] std::vector<std::string> lane_spot_tokens(std::string_view garage_id,
                                                            std::string_view lane_id) const;

    /// @brief Number of spots in a garage (lanes * SPOTS_PER_LANE).
    [[nodiscard]] std::size_t spot_count(std::string_view garage_id) const noexcept;

private:
    void validate() const;

    std::vector<GarageSpec> garages_;
    LengthRules length_;
    SpacingRules spacing_;
    LayoutRules layout_;
};

} // namespace spotalloc::core
