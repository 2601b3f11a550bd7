#pragma once

// Helpers shared by the JSON loaders.

#include <spotalloc/io/error.hpp>

#include <rapidjson/document.h>

#include <optional>
#include <string>
#include <string_view>

namespace spotalloc::io::detail {

/// @brief Parse @p json into @p doc, throwing LoaderError on malformed input.
void parse_document(rapidjson::Document& doc, std::string_view json, const char* what);

/// @brief Read a whole file, throwing LoaderError if it cannot be opened.
std::string read_file(const std::string& path);

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const char* context);
double get_double(const rapidjson::Value& val, const char* name, const char* context);
std::string get_string(const rapidjson::Value& val, const char* name, const char* context);
const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name,
                                  const char* context);

double get_double_or(const rapidjson::Value& val, const char* name, double default_val);
std::string get_string_or(const rapidjson::Value& val, const char* name,
                          const std::string& default_val);

/// @brief Optional string member; absent or null yields std::nullopt.
std::optional<std::string> get_optional_string(const rapidjson::Value& val, const char* name,
                                               const char* context);

/// @brief Optional number member; absent or null yields std::nullopt.
std::optional<double> get_optional_double(const rapidjson::Value& val, const char* name,
                                          const char* context);

} // namespace spotalloc::io::detail
