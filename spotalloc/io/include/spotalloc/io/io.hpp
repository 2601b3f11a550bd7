#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading, audit output and report writers.
///
/// The I/O library handles all external data formats: loading the
/// configuration and fleet JSON files, writing audit trails (JSON,
/// textual, in-memory), and rendering availability and layout reports.
/// Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Configuration and fleet JSON loaders.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Audit writers and report writers.

// Convenience header for Library 3 (I/O)

#include <spotalloc/io/error.hpp>
#include <spotalloc/io/audit_writers.hpp>
#include <spotalloc/io/config_loader.hpp>
#include <spotalloc/io/fleet_loader.hpp>
#include <spotalloc/io/report_writers.hpp>
