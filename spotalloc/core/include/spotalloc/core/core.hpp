#pragma once

/// @defgroup core Core Library
/// @brief Spot addressing, garage configuration, trucks, audit and storage.
///
/// The core library holds the domain model of the allocation engine: the
/// configured garages and lanes, spot tokens, trucks and their layouts,
/// the truck length rule, audit records, and the entity store interface
/// with its in-memory implementation. It has no dependency on the
/// availability or assignment algorithms, nor on any I/O format.

/// @defgroup core_spots Spots
/// @ingroup core
/// @brief Spot tokens and their parsing.

/// @defgroup core_config Configuration
/// @ingroup core
/// @brief Garages, lanes and rule constants.

/// @defgroup core_trucks Trucks
/// @ingroup core
/// @brief Truck records, side layouts and the length rule.

/// @defgroup core_audit Audit
/// @ingroup core
/// @brief Audit records and the recorder interface.

/// @defgroup core_store Store
/// @ingroup core
/// @brief Entity store, transactions and the in-memory store.

// Convenience header for Library 1
#include <spotalloc/core/error.hpp>
#include <spotalloc/core/spot.hpp>
#include <spotalloc/core/garage_config.hpp>
#include <spotalloc/core/truck.hpp>
#include <spotalloc/core/truck_length.hpp>
#include <spotalloc/core/audit.hpp>
#include <spotalloc/core/entity_store.hpp>
#include <spotalloc/core/memory_store.hpp>
