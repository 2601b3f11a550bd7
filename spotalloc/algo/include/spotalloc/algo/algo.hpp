#pragma once

/// @defgroup algo Algorithms Library
/// @brief Lane availability, spot assignment and lane layout.
///
/// Builds on core: computes which lanes can take a truck, assigns spots
/// inside units of work of the entity store, and positions trucks for
/// drawing.

/// @defgroup algo_availability Availability
/// @ingroup algo
/// @brief Fit computation per lane and per garage.

/// @defgroup algo_assignment Assignment
/// @ingroup algo
/// @brief Single and batch spot updates with conflict eviction.

/// @defgroup algo_layout Layout
/// @ingroup algo
/// @brief Drawing positions of trucks in lanes and in the yard.

// Convenience header for Library 2
#include <spotalloc/algo/lane_availability.hpp>
#include <spotalloc/algo/garage_availability.hpp>
#include <spotalloc/algo/spot_assignment.hpp>
#include <spotalloc/algo/lane_layout.hpp>
