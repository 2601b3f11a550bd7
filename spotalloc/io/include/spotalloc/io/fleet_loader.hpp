#pragma once

/// @file fleet_loader.hpp
/// @brief Load and write fleet snapshots (trucks with layouts and spots).
/// @ingroup io_loaders

#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/memory_store.hpp>

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string_view>

namespace spotalloc::io {

/// @brief Seed @p store with the trucks of a JSON fleet file.
///
/// Each entry of `trucks` needs an `id`; `spot`, `plate`,
/// `chassis_number`, `category`, `implement_type`, `job_name`,
/// `x_position`, `y_position` are optional (null or absent means unset).
/// `left_sections` and `right_sections` are optional arrays of section
/// widths.
///
/// @param store   Store receiving the trucks.
/// @param path    Filesystem path to the JSON fleet file.
/// @param config  Configuration used to validate spot tokens.
/// @return Number of trucks loaded.
///
/// @throws LoaderError  If the file cannot be read, the JSON is invalid, an
///                      id repeats, a width is negative, a spot token is not
///                      a configured spot, or two trucks hold the same spot.
std::size_t load_fleet(core::InMemoryEntityStore& store, const std::filesystem::path& path,
                       const core::GarageConfig& config);

/// @brief Seed @p store from a JSON string.
/// @see load_fleet
std::size_t load_fleet_from_string(core::InMemoryEntityStore& store, std::string_view json,
                                   const core::GarageConfig& config);

/// @brief Serialise every truck of @p store as a fleet JSON document.
/// @param store  Store to serialise.
/// @param out    Output stream.
void write_fleet_to_stream(const core::InMemoryEntityStore& store, std::ostream& out);

/// @brief Serialise one truck as a JSON object, in the fleet file format.
void write_truck_to_stream(const core::Truck& truck, std::ostream& out);

/// @brief Write the fleet JSON document to a file.
/// @throws LoaderError  If the file cannot be opened for writing.
void write_fleet(const core::InMemoryEntityStore& store, const std::filesystem::path& path);

} // namespace spotalloc::io
