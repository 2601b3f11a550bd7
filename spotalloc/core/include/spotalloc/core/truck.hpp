#pragma once

/// @file truck.hpp
/// @brief Truck record and its side layouts.
/// @ingroup core_trucks

#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace spotalloc::core {

/// @brief Truck identifier as issued by the entity store.
using TruckId = std::string;

/// @brief One body-panel segment of a side layout.
/// @ingroup core_trucks
struct LayoutSection {
    double width{};  ///< Segment width along the truck body (m).

    bool operator==(const LayoutSection&) const = default;
};

/// @brief Truck without any configured layout.
struct NoLayout {
    bool operator==(const NoLayout&) const = default;
};

/// @brief Truck with only a left-side layout.
struct LeftLayout {
    std::vector<LayoutSection> sections;
    bool operator==(const LeftLayout&) const = default;
};

/// @brief Truck with only a right-side layout.
struct RightLayout {
    std::vector<LayoutSection> sections;
    bool operator==(const RightLayout&) const = default;
};

/// @brief Truck with both side layouts.
struct BothLayouts {
    std::vector<LayoutSection> left;
    std::vector<LayoutSection> right;
    bool operator==(const BothLayouts&) const = default;
};

/// @brief The side layouts present on a truck.
///
/// When both sides exist the left side is authoritative for length.
///
/// @see active_sections
/// @ingroup core_trucks
using SideLayout = std::variant<NoLayout, LeftLayout, RightLayout, BothLayouts>;

/// @brief Sections used to derive the truck's length.
///
/// Left wins over right; a truck without layout yields an empty range.
///
/// @param layout  Side layout of the truck.
/// @return View into @p layout (valid while @p layout is alive and unmodified).
[[nodiscard]] std::span<const LayoutSection> active_sections(const SideLayout& layout) noexcept;

/// @brief Build a SideLayout from optional left and right section lists.
[[nodiscard]] SideLayout make_side_layout(std::optional<std::vector<LayoutSection>> left,
                                          std::optional<std::vector<LayoutSection>> right);

/// @brief A truck as read from and written to the entity store.
///
/// The allocation engine only writes @c spot (and, through the single
/// update path, the identifying attributes and fine position); everything
/// else is owned by the surrounding CRUD flows.
///
/// @ingroup core_trucks
struct Truck {
    TruckId id;
    std::optional<std::string> spot;            ///< Spot token, or nullopt when unparked.
    std::optional<std::string> plate;
    std::optional<std::string> chassis_number;
    std::optional<std::string> category;
    std::optional<std::string> implement_type;
    std::optional<double> x_position;           ///< Fine placement, used by some callers.
    std::optional<double> y_position;
    std::string job_name;                       ///< Display name of the job on this truck.
    SideLayout layout{NoLayout{}};

    bool operator==(const Truck&) const = default;
};

} // namespace spotalloc::core
