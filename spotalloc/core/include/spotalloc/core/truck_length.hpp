#pragma once

/// @file truck_length.hpp
/// @brief Physical parking length of a truck.
/// @ingroup core_trucks

#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/truck.hpp>

#include <span>

namespace spotalloc::core {

/// @brief Sum of section widths.
[[nodiscard]] double sections_width(std::span<const LayoutSection> sections) noexcept;

/// @brief Parking length of a body described by its sections.
///
/// Two-tier rule: a body shorter than @c cabin_threshold gets
/// @c cabin_length added for the tractor cabin; longer bodies already
/// include it and are used as-is. Without sections the result is
/// @c min_truck_length. The result is never below @c min_truck_length.
///
/// @param sections  Layout sections (may be empty).
/// @param rules     Length constants.
/// @return Length in meters.
[[nodiscard]] double truck_length(std::span<const LayoutSection> sections,
                                  const LengthRules& rules) noexcept;

/// @brief Parking length of a truck from its active side layout.
/// @see active_sections
[[nodiscard]] double truck_length(const Truck& truck, const LengthRules& rules) noexcept;

/// @brief Historical rule: always adds the cabin, no threshold.
///
/// Kept only to compare against lengths recorded by older deployments.
[[deprecated("use truck_length(); the threshold-gated rule is canonical")]]
[[nodiscard]] double legacy_truck_length(std::span<const LayoutSection> sections,
                                         const LengthRules& rules) noexcept;

} // namespace spotalloc::core
