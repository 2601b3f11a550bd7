#include <spotalloc/io/report_writers.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <vector>

namespace spotalloc::io {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_id_list(JsonWriter& writer, const char* key, const std::vector<core::TruckId>& ids) {
    writer.Key(key);
    writer.StartArray();
    for (const auto& id : ids) {
        write_string(writer, id);
    }
    writer.EndArray();
}

void write_lane(JsonWriter& writer, const algo::LaneAvailability& lane) {
    writer.StartObject();

    writer.Key("laneId");
    write_string(writer, lane.lane_id);
    writer.Key("laneLength");
    writer.Double(lane.lane_length);
    writer.Key("availableSpace");
    writer.Double(lane.available_space);
    writer.Key("truckCount");
    writer.Uint64(lane.truck_count);
    writer.Key("canFit");
    writer.Bool(lane.can_fit);
    writer.Key("canFitInNormal");
    writer.Bool(lane.can_fit_in_normal);
    writer.Key("canFitInOverflow");
    writer.Bool(lane.can_fit_in_overflow);

    writer.Key("nextSpotNumber");
    if (lane.next_spot_number) {
        writer.Uint(*lane.next_spot_number);
    } else {
        writer.Null();
    }

    writer.Key("occupiedSpots");
    writer.StartArray();
    for (auto spot : lane.occupied_spots) {
        writer.Uint(spot);
    }
    writer.EndArray();

    writer.Key("trucks");
    writer.StartArray();
    for (const auto& occupant : lane.trucks) {
        writer.StartObject();
        writer.Key("spotNumber");
        writer.Uint(occupant.spot_number);
        writer.Key("truckId");
        write_string(writer, occupant.truck_id);
        writer.Key("jobName");
        write_string(writer, occupant.job_name);
        writer.Key("length");
        writer.Double(occupant.length);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();
}

void write_garage(JsonWriter& writer, const algo::GarageAvailability& garage) {
    writer.StartObject();

    writer.Key("garageId");
    write_string(writer, garage.garage_id);
    writer.Key("name");
    write_string(writer, garage.name);
    writer.Key("totalSpots");
    writer.Uint64(garage.total_spots);
    writer.Key("occupiedCount");
    writer.Uint64(garage.occupied_spots);
    writer.Key("canFit");
    writer.Bool(garage.can_fit);

    writer.Key("lanes");
    writer.StartArray();
    for (const auto& lane : garage.lanes) {
        write_lane(writer, lane);
    }
    writer.EndArray();

    writer.EndObject();
}

void write_positioned(JsonWriter& writer, const algo::PositionedTruck& truck) {
    writer.StartObject();
    writer.Key("truckId");
    write_string(writer, truck.truck_id);
    writer.Key("jobName");
    write_string(writer, truck.job_name);
    writer.Key("spot");
    if (truck.spot) {
        write_string(writer, *truck.spot);
    } else {
        writer.Null();
    }
    writer.Key("length");
    writer.Double(truck.length);
    writer.Key("x");
    writer.Double(truck.x_position);
    writer.Key("y");
    writer.Double(truck.y_position);
    writer.EndObject();
}

} // anonymous namespace

void write_garage_availability(const algo::GarageAvailability& garage, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    write_garage(writer, garage);
    out << buffer.GetString();
}

void write_availability(std::span<const algo::GarageAvailability> garages, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("garages");
    writer.StartArray();
    for (const auto& garage : garages) {
        write_garage(writer, garage);
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

void write_garage_layout(const algo::GarageLayout& layout, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("garageId");
    write_string(writer, layout.garage_id);
    writer.Key("lanes");
    writer.StartArray();
    for (const auto& lane : layout.lanes) {
        writer.StartObject();
        writer.Key("laneId");
        write_string(writer, lane.lane_id);
        writer.Key("occupiedLength");
        writer.Double(lane.occupied_length);
        writer.Key("remainingLength");
        writer.Double(lane.remaining_length);
        writer.Key("trucks");
        writer.StartArray();
        for (const auto& truck : lane.trucks) {
            write_positioned(writer, truck);
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

void write_yard_layout(const algo::YardLayout& layout, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("width");
    writer.Double(layout.width);
    writer.Key("height");
    writer.Double(layout.height);
    writer.Key("columns");
    writer.Uint64(layout.columns);
    writer.Key("rows");
    writer.Uint64(layout.rows);
    writer.Key("trucks");
    writer.StartArray();
    for (const auto& truck : layout.trucks) {
        write_positioned(writer, truck);
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

void write_batch_result(const algo::BatchUpdateResult& result, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    writer.Key("updatedCount");
    writer.Uint64(result.updated_count);
    write_id_list(writer, "skipped", result.skipped);
    write_id_list(writer, "evicted", result.evicted);
    writer.EndObject();

    out << buffer.GetString();
}

} // namespace spotalloc::io
