#include <spotalloc/core/truck_length.hpp>

#include <algorithm>
#include <numeric>

namespace spotalloc::core {

double sections_width(std::span<const LayoutSection> sections) noexcept {
    return std::accumulate(sections.begin(), sections.end(), 0.0,
                           [](double sum, const LayoutSection& s) { return sum + s.width; });
}

double truck_length(std::span<const LayoutSection> sections, const LengthRules& rules) noexcept {
    if (sections.empty()) {
        return rules.min_truck_length;
    }

    double sum = sections_width(sections);
    double length = sum < rules.cabin_threshold ? sum + rules.cabin_length : sum;
    return std::max(length, rules.min_truck_length);
}

double truck_length(const Truck& truck, const LengthRules& rules) noexcept {
    return truck_length(active_sections(truck.layout), rules);
}

double legacy_truck_length(std::span<const LayoutSection> sections,
                           const LengthRules& rules) noexcept {
    return sections_width(sections) + rules.cabin_length;
}

} // namespace spotalloc::core
