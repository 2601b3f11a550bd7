#pragma once

/// @file report_writers.hpp
/// @brief JSON reports of availability, layout and batch results.
///
/// Keys are camelCase, as consumed by the spot selection screens.
///
/// @ingroup io_writers

#include <spotalloc/algo/garage_availability.hpp>
#include <spotalloc/algo/lane_layout.hpp>
#include <spotalloc/algo/spot_assignment.hpp>

#include <ostream>
#include <span>

namespace spotalloc::io {

/// @brief Write the availability of one garage as a JSON object.
///
/// Shape: `{"garageId", "name", "totalSpots", "occupiedCount", "canFit",
/// "lanes": [{"laneId", "laneLength", "availableSpace", "truckCount",
/// "canFit", "canFitInNormal", "canFitInOverflow", "nextSpotNumber",
/// "occupiedSpots", "trucks": [{"spotNumber", "truckId", "jobName",
/// "length"}]}]}`. `nextSpotNumber` is null when the lane cannot take the
/// truck.
///
/// @param garage  Availability to render.
/// @param out     Output stream.
void write_garage_availability(const algo::GarageAvailability& garage, std::ostream& out);

/// @brief Write several garages as a JSON document `{"garages": [...]}`.
/// @see write_garage_availability
void write_availability(std::span<const algo::GarageAvailability> garages, std::ostream& out);

/// @brief Write the lane layout of a garage as JSON.
void write_garage_layout(const algo::GarageLayout& layout, std::ostream& out);

/// @brief Write the yard grid as JSON.
void write_yard_layout(const algo::YardLayout& layout, std::ostream& out);

/// @brief Write a batch update outcome as JSON
/// (`{"updatedCount", "skipped", "evicted"}`).
void write_batch_result(const algo::BatchUpdateResult& result, std::ostream& out);

} // namespace spotalloc::io
