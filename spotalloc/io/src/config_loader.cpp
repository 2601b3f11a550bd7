#include <spotalloc/io/config_loader.hpp>
#include <spotalloc/io/error.hpp>

#include <spotalloc/core/error.hpp>

#include "json_helpers.hpp"

#include <rapidjson/document.h>

#include <string>
#include <vector>

namespace spotalloc::io {

namespace {

using namespace spotalloc::core;
using namespace spotalloc::io::detail;

LengthRules parse_length_rules(const rapidjson::Value& doc) {
    LengthRules rules;
    if (!doc.HasMember("length_rules")) {
        return rules;
    }
    const auto& obj = doc["length_rules"];
    if (!obj.IsObject()) {
        throw LoaderError("field 'length_rules' must be an object", "config");
    }
    rules.min_truck_length = get_double_or(obj, "min_truck_length", rules.min_truck_length);
    rules.cabin_threshold = get_double_or(obj, "cabin_threshold", rules.cabin_threshold);
    rules.cabin_length = get_double_or(obj, "cabin_length", rules.cabin_length);
    return rules;
}

SpacingRules parse_spacing_rules(const rapidjson::Value& doc) {
    SpacingRules rules;
    if (!doc.HasMember("spacing_rules")) {
        return rules;
    }
    const auto& obj = doc["spacing_rules"];
    if (!obj.IsObject()) {
        throw LoaderError("field 'spacing_rules' must be an object", "config");
    }
    rules.min_spacing = get_double_or(obj, "min_spacing", rules.min_spacing);
    rules.end_margin = get_double_or(obj, "end_margin", rules.end_margin);
    return rules;
}

LayoutRules parse_layout_rules(const rapidjson::Value& doc) {
    LayoutRules rules;
    if (!doc.HasMember("layout_rules")) {
        return rules;
    }
    const auto& obj = doc["layout_rules"];
    if (!obj.IsObject()) {
        throw LoaderError("field 'layout_rules' must be an object", "config");
    }
    rules.truck_width = get_double_or(obj, "truck_width", rules.truck_width);
    rules.yard_width = get_double_or(obj, "yard_width", rules.yard_width);
    return rules;
}

GarageSpec parse_garage(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("garage must be an object", ctx);
    }

    GarageDimensions dims;
    dims.width = get_double_or(obj, "width", dims.width);
    dims.length = get_double_or(obj, "length", dims.length);
    dims.padding_top = get_double_or(obj, "padding_top", dims.padding_top);
    dims.padding_bottom = get_double_or(obj, "padding_bottom", dims.padding_bottom);
    dims.lane_width = get_double_or(obj, "lane_width", dims.lane_width);
    dims.lane_spacing = get_double_or(obj, "lane_spacing", dims.lane_spacing);
    dims.lane_padding_x = get_double_or(obj, "lane_padding_x", dims.lane_padding_x);

    std::string id = get_string(obj, "id", ctx.c_str());
    std::string name = get_string_or(obj, "name", id);

    const auto& lanes = get_array(obj, "lanes", ctx.c_str());
    if (lanes.Empty()) {
        throw LoaderError("lanes array cannot be empty", ctx);
    }

    GarageSpec garage;
    if (lanes[0].IsString()) {
        // Plain ids: derive positions from the dimensions
        std::vector<std::string> lane_ids;
        for (rapidjson::SizeType lidx = 0; lidx < lanes.Size(); ++lidx) {
            if (!lanes[lidx].IsString()) {
                throw LoaderError("lane ids must all be strings",
                                  ctx + ".lanes[" + std::to_string(lidx) + "]");
            }
            lane_ids.emplace_back(lanes[lidx].GetString());
        }
        garage = make_garage(std::move(id), std::move(name), dims, lane_ids);
    } else {
        garage.id = std::move(id);
        garage.name = std::move(name);
        garage.width = dims.width;
        garage.length = dims.length;
        garage.lane_length = dims.length - dims.padding_top - dims.padding_bottom;
        garage.lane_width = dims.lane_width;
        for (rapidjson::SizeType lidx = 0; lidx < lanes.Size(); ++lidx) {
            const auto& lane_obj = lanes[lidx];
            std::string lctx = ctx + ".lanes[" + std::to_string(lidx) + "]";
            if (!lane_obj.IsObject()) {
                throw LoaderError("lane must be an object or an id", lctx);
            }
            LaneSpec lane;
            lane.id = get_string(lane_obj, "id", lctx.c_str());
            lane.label = get_string_or(lane_obj, "label", lane.id);
            lane.x_position = get_double_or(lane_obj, "x_position", 0.0);
            garage.lanes.push_back(std::move(lane));
        }
    }

    // An explicit lane length wins over the derived one
    garage.lane_length = get_double_or(obj, "lane_length", garage.lane_length);
    return garage;
}

GarageConfig parse_config_impl(const rapidjson::Document& doc) {
    auto length = parse_length_rules(doc);
    auto spacing = parse_spacing_rules(doc);
    auto layout = parse_layout_rules(doc);

    std::vector<GarageSpec> garages;
    if (doc.HasMember("garages")) {
        const auto& arr = get_array(doc, "garages", "config");
        for (rapidjson::SizeType gidx = 0; gidx < arr.Size(); ++gidx) {
            garages.push_back(parse_garage(arr[gidx], "garages[" + std::to_string(gidx) + "]"));
        }
    } else {
        auto reference = GarageConfig::reference();
        garages.assign(reference.garages().begin(), reference.garages().end());
    }

    try {
        return GarageConfig(std::move(garages), length, spacing, layout);
    } catch (const ConfigError& e) {
        throw LoaderError(e.what(), "config");
    }
}

} // anonymous namespace

GarageConfig load_config(const std::filesystem::path& path) {
    return load_config_from_string(read_file(path.string()));
}

GarageConfig load_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    parse_document(doc, json, "config");
    return parse_config_impl(doc);
}

} // namespace spotalloc::io
