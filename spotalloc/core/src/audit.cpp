#include <spotalloc/core/audit.hpp>

namespace spotalloc::core {

std::string_view to_string(EntityType type) noexcept {
    switch (type) {
        case EntityType::Truck: return "truck";
    }
    return "unknown";
}

std::string_view to_string(AuditAction action) noexcept {
    switch (action) {
        case AuditAction::Update: return "update";
    }
    return "unknown";
}

std::string_view to_string(ChangeCause cause) noexcept {
    switch (cause) {
        case ChangeCause::UserAction: return "user_action";
        case ChangeCause::SystemGenerated: return "system_generated";
        case ChangeCause::VehicleMovement: return "vehicle_movement";
        case ChangeCause::ParkingAssignment: return "parking_assignment";
    }
    return "unknown";
}

AuditValue to_audit_value(const std::optional<std::string>& value) {
    if (!value) {
        return std::monostate{};
    }
    return *value;
}

AuditScalar to_audit_scalar(const std::optional<double>& value) {
    if (!value) {
        return std::monostate{};
    }
    return *value;
}

AuditScalar to_audit_scalar(const std::optional<std::string>& value) {
    if (!value) {
        return std::monostate{};
    }
    return *value;
}

} // namespace spotalloc::core
