#include "json_helpers.hpp"

#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>

namespace spotalloc::io::detail {

void parse_document(rapidjson::Document& doc, std::string_view json, const char* what) {
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", what);
    }
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path);
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const char* context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::string get_string(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return member.GetString();
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name,
                                  const char* context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional getters
double get_double_or(const rapidjson::Value& val, const char* name, double default_val) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsNumber()) {
        return default_val;
    }
    return member.GetDouble();
}

std::string get_string_or(const rapidjson::Value& val, const char* name,
                          const std::string& default_val) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsString()) {
        return default_val;
    }
    return member.GetString();
}

std::optional<std::string> get_optional_string(const rapidjson::Value& val, const char* name,
                                               const char* context) {
    if (!val.HasMember(name) || val[name].IsNull()) {
        return std::nullopt;
    }
    return get_string(val, name, context);
}

std::optional<double> get_optional_double(const rapidjson::Value& val, const char* name,
                                          const char* context) {
    if (!val.HasMember(name) || val[name].IsNull()) {
        return std::nullopt;
    }
    return get_double(val, name, context);
}

} // namespace spotalloc::io::detail
