#include <spotalloc/core/truck.hpp>

#include <utility>

namespace spotalloc::core {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // anonymous namespace

std::span<const LayoutSection> active_sections(const SideLayout& layout) noexcept {
    return std::visit(
        overloaded{
            [](const NoLayout&) { return std::span<const LayoutSection>{}; },
            [](const LeftLayout& l) { return std::span<const LayoutSection>{l.sections}; },
            [](const RightLayout& r) { return std::span<const LayoutSection>{r.sections}; },
            [](const BothLayouts& b) { return std::span<const LayoutSection>{b.left}; },
        },
        layout);
}

SideLayout make_side_layout(std::optional<std::vector<LayoutSection>> left,
                            std::optional<std::vector<LayoutSection>> right) {
    if (left && right) {
        return BothLayouts{std::move(*left), std::move(*right)};
    }
    if (left) {
        return LeftLayout{std::move(*left)};
    }
    if (right) {
        return RightLayout{std::move(*right)};
    }
    return NoLayout{};
}

} // namespace spotalloc::core
