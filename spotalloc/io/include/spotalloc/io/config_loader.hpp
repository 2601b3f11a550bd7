#pragma once

/// @file config_loader.hpp
/// @brief Load a GarageConfig from JSON.
/// @ingroup io_loaders

#include <spotalloc/core/garage_config.hpp>

#include <filesystem>
#include <string_view>

namespace spotalloc::io {

/// @brief Load the engine configuration from a JSON file.
///
/// Rule groups (`length_rules`, `spacing_rules`, `layout_rules`) and each
/// of their fields are optional and default to the reference constants.
/// `garages` is optional and defaults to the reference deployment. A
/// garage lists its lanes either as objects (`id`, `label`, `x_position`)
/// or as plain ids, in which case positions are derived from the garage
/// dimensions.
///
/// @param path  Filesystem path to the JSON configuration.
/// @return The validated configuration.
///
/// @throws LoaderError  If the file cannot be read, the JSON is invalid,
///                      or the resulting configuration is inconsistent.
///
/// @see load_config_from_string, core::GarageConfig
core::GarageConfig load_config(const std::filesystem::path& path);

/// @brief Load the engine configuration from a JSON string.
/// @param json  JSON content.
/// @return The validated configuration.
/// @throws LoaderError  On malformed or inconsistent input.
core::GarageConfig load_config_from_string(std::string_view json);

} // namespace spotalloc::io
