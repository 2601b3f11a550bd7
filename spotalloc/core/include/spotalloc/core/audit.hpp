#pragma once

/// @file audit.hpp
/// @brief Audit records and the recorder interface.
/// @ingroup core_audit

#include <spotalloc/core/truck.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace spotalloc::core {

/// @brief Kind of entity an audit record refers to.
enum class EntityType {
    Truck
};

/// @brief Kind of mutation recorded.
enum class AuditAction {
    Update
};

/// @brief Why a change happened.
///
/// @c SystemGenerated marks changes the engine made on its own (eviction
/// of a conflicting occupant) as opposed to what the caller asked for.
enum class ChangeCause {
    UserAction,         ///< Field change requested by the caller.
    SystemGenerated,    ///< Engine-initiated change (conflict eviction).
    VehicleMovement,    ///< Truck moved from one garage to another.
    ParkingAssignment   ///< Fine x/y placement changed.
};

/// @brief A scalar audit value; std::monostate stands for null.
using AuditScalar = std::variant<std::monostate, std::string, double>;

/// @brief Small ordered object of named scalars (e.g. {"from": "B1"}).
using AuditObject = std::vector<std::pair<std::string, AuditScalar>>;

/// @brief Value before or after a change.
using AuditValue = std::variant<std::monostate, std::string, double, AuditObject>;

/// @brief One before/after record of a logical change.
/// @ingroup core_audit
struct AuditRecord {
    EntityType entity_type{EntityType::Truck};
    TruckId entity_id;
    AuditAction action{AuditAction::Update};
    std::string field;                  ///< Changed field, or a record kind such as "vehicle_movement".
    AuditValue old_value;
    AuditValue new_value;
    ChangeCause cause{ChangeCause::UserAction};
    std::optional<std::string> user_id;  ///< Acting user, if any.
    std::string reason;                  ///< Short human-readable explanation.
};

/// @brief Stable lowercase name of an entity type ("truck").
[[nodiscard]] std::string_view to_string(EntityType type) noexcept;

/// @brief Stable lowercase name of an action ("update").
[[nodiscard]] std::string_view to_string(AuditAction action) noexcept;

/// @brief Stable snake_case name of a cause ("system_generated", ...).
[[nodiscard]] std::string_view to_string(ChangeCause cause) noexcept;

/// @brief Convert an optional string to an audit value (nullopt -> null).
[[nodiscard]] AuditValue to_audit_value(const std::optional<std::string>& value);

/// @brief Convert an optional number to an audit scalar (nullopt -> null).
[[nodiscard]] AuditScalar to_audit_scalar(const std::optional<double>& value);

/// @brief Convert an optional string to an audit scalar (nullopt -> null).
[[nodiscard]] AuditScalar to_audit_scalar(const std::optional<std::string>& value);

/// @brief Abstract sink for audit records.
/// @ingroup core_audit
///
/// Implementations persist or display records (JSON stream, memory
/// buffer, text). The entity store delivers the records of a unit of work
/// right before it commits; a recorder that throws aborts that unit of
/// work.
///
/// @see EntityStore::run_in_transaction, io::JsonAuditWriter
class AuditRecorder {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~AuditRecorder() = default;

    /// @brief Persist one record.
    /// @param record The change to record.
    virtual void record(const AuditRecord& record) = 0;

protected:
    AuditRecorder() = default;
    AuditRecorder(const AuditRecorder&) = default;
    AuditRecorder& operator=(const AuditRecorder&) = default;
    AuditRecorder(AuditRecorder&&) = default;
    AuditRecorder& operator=(AuditRecorder&&) = default;
};

} // namespace spotalloc::core
