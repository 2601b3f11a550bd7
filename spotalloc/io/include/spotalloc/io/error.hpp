#pragma once

/// @file error.hpp
/// @brief Error raised while reading or writing garage configurations and fleets.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace spotalloc::io {

/// @brief A configuration or fleet document could not be used.
///
/// Covers unreadable files and malformed JSON, missing or mistyped fields,
/// and fleets that contradict the configuration: a spot token that names no
/// configured spot, two trucks on one spot, a repeated truck id. A
/// configuration rejected by core::GarageConfig is rethrown as a LoaderError
/// with the `config` context. Writing a fleet to a path that cannot be
/// opened raises it as well.
///
/// Messages read `"<context>: <message>"`, where the context locates the
/// offending element, e.g. `garages[1].lanes[0]: missing required field 'id'`
/// or `trucks[3]: spot 'B1_F2_V1' is held by another truck`.
///
/// @ingroup io
/// @see load_config, load_fleet, write_fleet
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @param message  What is wrong.
    /// @param context  Where: a file path, `config`, or an element path such as `trucks[3]`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace spotalloc::io
