#include <spotalloc/io/audit_writers.hpp>

#include <iomanip>
#include <sstream>

namespace spotalloc::io {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

std::string format_scalar(const core::AuditScalar& value) {
    return std::visit(overloaded{
                          [](const std::monostate&) { return std::string("null"); },
                          [](const std::string& s) { return "\"" + s + "\""; },
                          [](double d) { return format_number(d); },
                      },
                      value);
}

const char* cause_color(core::ChangeCause cause) {
    switch (cause) {
        case core::ChangeCause::SystemGenerated: return "\033[33m";   // yellow
        case core::ChangeCause::VehicleMovement: return "\033[36m";   // cyan
        case core::ChangeCause::ParkingAssignment: return "\033[35m"; // magenta
        case core::ChangeCause::UserAction: break;
    }
    return "\033[32m";  // green
}

constexpr const char* COLOR_RESET = "\033[0m";

} // anonymous namespace

std::string format_audit_value(const core::AuditValue& value) {
    return std::visit(overloaded{
                          [](const std::monostate&) { return std::string("null"); },
                          [](const std::string& s) { return "\"" + s + "\""; },
                          [](double d) { return format_number(d); },
                          [](const core::AuditObject& obj) {
                              std::string out = "{";
                              for (std::size_t i = 0; i < obj.size(); ++i) {
                                  if (i > 0) {
                                      out += ", ";
                                  }
                                  out += obj[i].first + ": " + format_scalar(obj[i].second);
                              }
                              return out + "}";
                          },
                      },
                      value);
}

// =============================================================================
// NullAuditWriter
// =============================================================================

void NullAuditWriter::record(const core::AuditRecord& /*record*/) {}

// =============================================================================
// JsonAuditWriter
// =============================================================================

JsonAuditWriter::JsonAuditWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonAuditWriter::~JsonAuditWriter() {
    if (!finalized_) {
        finalize();
    }
}

std::string JsonAuditWriter::escape_json_string(std::string_view str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0')
                        << std::setw(4) << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonAuditWriter::write_scalar(const core::AuditScalar& value) {
    std::visit(overloaded{
                   [&](const std::monostate&) { output_ << "null"; },
                   [&](const std::string& s) { output_ << "\"" << escape_json_string(s) << "\""; },
                   [&](double d) { output_ << std::setprecision(15) << d; },
               },
               value);
}

void JsonAuditWriter::write_value(const core::AuditValue& value) {
    std::visit(overloaded{
                   [&](const std::monostate&) { output_ << "null"; },
                   [&](const std::string& s) { output_ << "\"" << escape_json_string(s) << "\""; },
                   [&](double d) { output_ << std::setprecision(15) << d; },
                   [&](const core::AuditObject& obj) {
                       output_ << "{";
                       for (std::size_t i = 0; i < obj.size(); ++i) {
                           if (i > 0) {
                               output_ << ", ";
                           }
                           output_ << "\"" << escape_json_string(obj[i].first) << "\": ";
                           write_scalar(obj[i].second);
                       }
                       output_ << "}";
                   },
               },
               value);
}

void JsonAuditWriter::record(const core::AuditRecord& record) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;

    output_ << "  {\"entity_type\": \"" << core::to_string(record.entity_type) << "\""
            << ", \"entity_id\": \"" << escape_json_string(record.entity_id) << "\""
            << ", \"action\": \"" << core::to_string(record.action) << "\""
            << ", \"field\": \"" << escape_json_string(record.field) << "\""
            << ", \"old_value\": ";
    write_value(record.old_value);
    output_ << ", \"new_value\": ";
    write_value(record.new_value);
    output_ << ", \"cause\": \"" << core::to_string(record.cause) << "\""
            << ", \"user_id\": ";
    if (record.user_id) {
        output_ << "\"" << escape_json_string(*record.user_id) << "\"";
    } else {
        output_ << "null";
    }
    output_ << ", \"reason\": \"" << escape_json_string(record.reason) << "\"}";
}

void JsonAuditWriter::finalize() {
    if (!finalized_) {
        if (!first_record_) {
            // Records were written, add newline before closing bracket
            output_ << "\n";
        }
        output_ << "]\n";
        output_.flush();
        finalized_ = true;
    }
}

// =============================================================================
// MemoryAuditWriter
// =============================================================================

void MemoryAuditWriter::record(const core::AuditRecord& record) {
    records_.push_back(record);
}

// =============================================================================
// TextualAuditWriter
// =============================================================================

TextualAuditWriter::TextualAuditWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualAuditWriter::record(const core::AuditRecord& record) {
    // Format: [cause] truck t1              spot: null -> "B1_F1_V1" (reason)
    std::ostringstream cause;
    cause << "[" << core::to_string(record.cause) << "]";

    if (color_enabled_) {
        output_ << cause_color(record.cause);
    }
    output_ << std::setw(20) << std::left << cause.str();
    if (color_enabled_) {
        output_ << COLOR_RESET;
    }

    output_ << " " << core::to_string(record.entity_type) << " " << std::setw(12) << std::left
            << record.entity_id << " " << std::setw(18) << std::right << record.field << ": "
            << format_audit_value(record.old_value) << " -> "
            << format_audit_value(record.new_value);

    if (!record.reason.empty()) {
        output_ << " (" << record.reason << ")";
    }
    if (record.user_id) {
        output_ << " by " << *record.user_id;
    }
    output_ << "\n";
}

} // namespace spotalloc::io
