#include <spotalloc/io/fleet_loader.hpp>
#include <spotalloc/io/error.hpp>

#include "json_helpers.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace spotalloc::io {

namespace {

using namespace spotalloc::core;
using namespace spotalloc::io::detail;

std::optional<std::vector<LayoutSection>> parse_sections(const rapidjson::Value& obj,
                                                         const char* name,
                                                         const std::string& ctx) {
    if (!obj.HasMember(name) || obj[name].IsNull()) {
        return std::nullopt;
    }
    const auto& arr = get_array(obj, name, ctx.c_str());

    std::vector<LayoutSection> sections;
    sections.reserve(arr.Size());
    for (rapidjson::SizeType sidx = 0; sidx < arr.Size(); ++sidx) {
        std::string sctx = ctx + "." + name + "[" + std::to_string(sidx) + "]";
        if (!arr[sidx].IsNumber()) {
            throw LoaderError("section width must be a number", sctx);
        }
        double width = arr[sidx].GetDouble();
        if (width < 0.0) {
            throw LoaderError("section width must not be negative", sctx);
        }
        sections.push_back(LayoutSection{width});
    }
    return sections;
}

Truck parse_truck(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("truck must be an object", ctx);
    }

    Truck truck;
    truck.id = get_string(obj, "id", ctx.c_str());
    truck.spot = get_optional_string(obj, "spot", ctx.c_str());
    truck.plate = get_optional_string(obj, "plate", ctx.c_str());
    truck.chassis_number = get_optional_string(obj, "chassis_number", ctx.c_str());
    truck.category = get_optional_string(obj, "category", ctx.c_str());
    truck.implement_type = get_optional_string(obj, "implement_type", ctx.c_str());
    truck.x_position = get_optional_double(obj, "x_position", ctx.c_str());
    truck.y_position = get_optional_double(obj, "y_position", ctx.c_str());
    truck.job_name = get_string_or(obj, "job_name", "");
    truck.layout = make_side_layout(parse_sections(obj, "left_sections", ctx),
                                    parse_sections(obj, "right_sections", ctx));
    return truck;
}

void write_optional(rapidjson::Writer<rapidjson::StringBuffer>& writer, const char* key,
                    const std::optional<std::string>& value) {
    writer.Key(key);
    if (value) {
        writer.String(value->c_str(), static_cast<rapidjson::SizeType>(value->size()));
    } else {
        writer.Null();
    }
}

void write_optional(rapidjson::Writer<rapidjson::StringBuffer>& writer, const char* key,
                    const std::optional<double>& value) {
    writer.Key(key);
    if (value) {
        writer.Double(*value);
    } else {
        writer.Null();
    }
}

void write_sections(rapidjson::Writer<rapidjson::StringBuffer>& writer, const char* key,
                    const std::vector<LayoutSection>& sections) {
    writer.Key(key);
    writer.StartArray();
    for (const auto& section : sections) {
        writer.Double(section.width);
    }
    writer.EndArray();
}

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

void write_truck(rapidjson::Writer<rapidjson::StringBuffer>& writer, const Truck& truck) {
    writer.StartObject();

    writer.Key("id");
    writer.String(truck.id.c_str(), static_cast<rapidjson::SizeType>(truck.id.size()));
    write_optional(writer, "spot", truck.spot);
    write_optional(writer, "plate", truck.plate);
    write_optional(writer, "chassis_number", truck.chassis_number);
    write_optional(writer, "category", truck.category);
    write_optional(writer, "implement_type", truck.implement_type);
    write_optional(writer, "x_position", truck.x_position);
    write_optional(writer, "y_position", truck.y_position);

    writer.Key("job_name");
    writer.String(truck.job_name.c_str(),
                  static_cast<rapidjson::SizeType>(truck.job_name.size()));

    std::visit(overloaded{
                   [](const NoLayout&) {},
                   [&](const LeftLayout& l) { write_sections(writer, "left_sections", l.sections); },
                   [&](const RightLayout& r) { write_sections(writer, "right_sections", r.sections); },
                   [&](const BothLayouts& b) {
                       write_sections(writer, "left_sections", b.left);
                       write_sections(writer, "right_sections", b.right);
                   },
               },
               truck.layout);

    writer.EndObject();
}

} // anonymous namespace

std::size_t load_fleet(InMemoryEntityStore& store, const std::filesystem::path& path,
                       const GarageConfig& config) {
    return load_fleet_from_string(store, read_file(path.string()), config);
}

std::size_t load_fleet_from_string(InMemoryEntityStore& store, std::string_view json,
                                   const GarageConfig& config) {
    rapidjson::Document doc;
    parse_document(doc, json, "fleet");

    if (!doc.HasMember("trucks")) {
        // Empty fleet is valid
        return 0;
    }
    const auto& arr = get_array(doc, "trucks", "fleet");

    // Validate everything before touching the store
    std::vector<Truck> trucks;
    std::set<std::string> ids;
    std::set<std::string> spots;
    for (rapidjson::SizeType tidx = 0; tidx < arr.Size(); ++tidx) {
        std::string ctx = "trucks[" + std::to_string(tidx) + "]";
        Truck truck = parse_truck(arr[tidx], ctx);

        if (!ids.insert(truck.id).second) {
            throw LoaderError("duplicate truck id '" + truck.id + "'", ctx);
        }
        if (truck.spot) {
            if (!config.is_valid_token(*truck.spot)) {
                throw LoaderError("spot '" + *truck.spot + "' is not a configured spot", ctx);
            }
            if (!spots.insert(*truck.spot).second) {
                throw LoaderError("spot '" + *truck.spot + "' is held by another truck", ctx);
            }
        }
        trucks.push_back(std::move(truck));
    }

    for (auto& truck : trucks) {
        store.put_truck(std::move(truck));
    }
    return trucks.size();
}

void write_fleet_to_stream(const InMemoryEntityStore& store, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("trucks");
    writer.StartArray();

    for (const auto& truck : store.trucks()) {
        write_truck(writer, truck);
    }

    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

void write_truck_to_stream(const Truck& truck, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    write_truck(writer, truck);
    out << buffer.GetString();
}

void write_fleet(const InMemoryEntityStore& store, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_fleet_to_stream(store, file);
}

} // namespace spotalloc::io
