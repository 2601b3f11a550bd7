#pragma once

/// @file spot.hpp
/// @brief Spot addressing: the (garage, lane, number) triple and its token.
/// @ingroup core_spots

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace spotalloc::core {

/// @brief Ordinal position of a spot inside its lane (1 = front).
using SpotNumber = unsigned;

/// @brief Number of spots in every lane.
inline constexpr SpotNumber SPOTS_PER_LANE = 3;

/// @brief Highest spot number used by the primary assignment workflow.
inline constexpr SpotNumber LAST_NORMAL_SPOT = 2;

/// @brief The overflow spot, usable only when both normal spots are taken.
inline constexpr SpotNumber OVERFLOW_SPOT = 3;

/// @brief Separator between the components of a spot token.
inline constexpr char TOKEN_SEPARATOR = '_';

/// @brief Returns true for spots 1 and 2.
[[nodiscard]] constexpr bool is_normal_spot(SpotNumber number) noexcept {
    return number >= 1 && number <= LAST_NORMAL_SPOT;
}

/// @brief Returns true for the overflow spot.
[[nodiscard]] constexpr bool is_overflow_spot(SpotNumber number) noexcept {
    return number == OVERFLOW_SPOT;
}

/// @brief Decoded form of a spot token.
///
/// A spot is uniquely identified by its garage, its lane within the garage
/// and its number within the lane. The token form (`B1_F1_V1`) is what the
/// truck record stores.
///
/// @see parse_spot, format_spot
/// @ingroup core_spots
struct SpotAddress {
    std::string garage;   ///< Garage id (e.g. "B1").
    std::string lane;     ///< Lane id within the garage (e.g. "F1").
    SpotNumber number{};  ///< Spot number within the lane, 1..3.

    auto operator<=>(const SpotAddress&) const = default;
};

/// @brief Decode a spot token.
///
/// Accepts `<garage>_<lane>_V<number>` with a number in 1..SPOTS_PER_LANE.
/// Does not check the address against any configuration.
///
/// @param token  Token to decode.
/// @return The decoded address, or std::nullopt if @p token is malformed.
/// @see GarageConfig::is_valid_token
[[nodiscard]] std::optional<SpotAddress> parse_spot(std::string_view token);

/// @brief Build the token for a spot address.
/// @param address  Address to encode.
/// @return Token such as `B1_F1_V1`.
[[nodiscard]] std::string format_spot(const SpotAddress& address);

/// @brief Human-readable label for a token (`B1-F1-V1`).
///
/// Unparked trucks (no token) are labelled "unassigned". Tokens that do not
/// parse are returned unchanged.
///
/// @param token  Token to label, or std::nullopt.
/// @return Display label.
[[nodiscard]] std::string spot_label(const std::optional<std::string>& token);

/// @brief Return the garage component of a token, if it parses.
[[nodiscard]] std::optional<std::string> spot_garage(const std::optional<std::string>& token);

} // namespace spotalloc::core
