#pragma once

#include <stdexcept>
#include <string>

namespace spotalloc::core {

/// @brief Base exception for all allocation engine errors.
///
/// All exceptions thrown by the core and algo libraries derive from this
/// class, allowing callers to catch engine-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see NotFoundError, InvalidSpotError, ConfigError
/// @ingroup core
class AllocationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a referenced truck does not exist.
///
/// Raised by the single-update path only. The batch path skips missing
/// trucks and reports them in its result instead.
///
/// @see SpotAssignmentService::update_truck, AllocationError
/// @ingroup core
class NotFoundError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

/// @brief Thrown when a spot token does not resolve to a configured spot.
///
/// A stored spot token must always name one of the fixed
/// (garage, lane, number) triples of the configuration.
///
/// @see GarageConfig::is_valid_token, AllocationError
/// @ingroup core
class InvalidSpotError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

/// @brief Thrown when a GarageConfig is inconsistent.
///
/// For example duplicate garage ids, a lane with a non-positive length,
/// or an identifier containing the token separator.
///
/// @see GarageConfig, AllocationError
/// @ingroup core
class ConfigError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

} // namespace spotalloc::core
