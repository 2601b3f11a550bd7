#include <spotalloc/core/spot.hpp>

#include <charconv>

namespace spotalloc::core {

std::optional<SpotAddress> parse_spot(std::string_view token) {
    // Garage and lane ids never contain the separator, so the last two
    // separators delimit the three components.
    auto last = token.rfind(TOKEN_SEPARATOR);
    if (last == std::string_view::npos || last == 0) {
        return std::nullopt;
    }
    auto middle = token.rfind(TOKEN_SEPARATOR, last - 1);
    if (middle == std::string_view::npos || middle == 0 || middle + 1 == last) {
        return std::nullopt;
    }

    std::string_view garage = token.substr(0, middle);
    std::string_view lane = token.substr(middle + 1, last - middle - 1);
    std::string_view spot = token.substr(last + 1);

    if (garage.find(TOKEN_SEPARATOR) != std::string_view::npos) {
        return std::nullopt;
    }
    if (spot.size() < 2 || spot.front() != 'V') {
        return std::nullopt;
    }

    SpotNumber number = 0;
    auto digits = spot.substr(1);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    if (number < 1 || number > SPOTS_PER_LANE) {
        return std::nullopt;
    }

    return SpotAddress{std::string(garage), std::string(lane), number};
}

std::string format_spot(const SpotAddress& address) {
    std::string token = address.garage;
    token += TOKEN_SEPARATOR;
    token += address.lane;
    token += TOKEN_SEPARATOR;
    token += 'V';
    token += std::to_string(address.number);
    return token;
}

std::string spot_label(const std::optional<std::string>& token) {
    if (!token) {
        return "unassigned";
    }
    auto address = parse_spot(*token);
    if (!address) {
        return *token;
    }
    return address->garage + "-" + address->lane + "-V" + std::to_string(address->number);
}

std::optional<std::string> spot_garage(const std::optional<std::string>& token) {
    if (!token) {
        return std::nullopt;
    }
    auto address = parse_spot(*token);
    if (!address) {
        return std::nullopt;
    }
    return address->garage;
}

} // namespace spotalloc::core
