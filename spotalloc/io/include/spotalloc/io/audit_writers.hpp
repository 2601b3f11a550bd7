#pragma once

/// @file audit_writers.hpp
/// @brief Concrete AuditRecorder implementations.
///
/// Provides a no-op writer, a JSON streaming writer, an in-memory buffer
/// for inspection and tests, and a human-readable textual writer with
/// optional ANSI colour output.
///
/// @ingroup io_writers

#include <spotalloc/core/audit.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace spotalloc::io {

/// @brief Audit writer that silently discards all records.
///
/// @ingroup io_writers
/// @see core::AuditRecorder
class NullAuditWriter : public core::AuditRecorder {
public:
    /// @brief Discard @p record.
    void record(const core::AuditRecord& record) override;
};

/// @brief Audit writer that streams JSON array elements to an output stream.
///
/// Writes one JSON object per record directly to the provided stream.
/// Call @ref finalize to emit the closing bracket once all units of work
/// are done.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::AuditRecorder, MemoryAuditWriter, TextualAuditWriter
class JsonAuditWriter : public core::AuditRecorder {
public:
    /// @brief Construct a JSON writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonAuditWriter(std::ostream& output);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonAuditWriter() override;

    JsonAuditWriter(const JsonAuditWriter&) = delete;
    JsonAuditWriter& operator=(const JsonAuditWriter&) = delete;
    JsonAuditWriter(JsonAuditWriter&&) = delete;
    JsonAuditWriter& operator=(JsonAuditWriter&&) = delete;

    /// @brief Write @p record as one JSON object.
    void record(const core::AuditRecord& record) override;

    /// @brief Write the closing bracket of the JSON array.
    ///
    /// Must be called exactly once after all records have been written.
    /// The destructor calls this automatically if it has not been invoked.
    void finalize();

private:
    void write_value(const core::AuditValue& value);
    void write_scalar(const core::AuditScalar& value);
    static std::string escape_json_string(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief Audit writer that keeps every record in memory.
///
/// Ideal for unit tests and for callers that want to inspect the trail
/// after a unit of work.
///
/// @ingroup io_writers
class MemoryAuditWriter : public core::AuditRecorder {
public:
    /// @brief Append @p record to the buffer.
    void record(const core::AuditRecord& record) override;

    /// @brief Access the accumulated records.
    [[nodiscard]] const std::vector<core::AuditRecord>& records() const { return records_; }

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<core::AuditRecord> records_;
};

/// @brief Human-readable audit writer with optional ANSI colour.
///
/// Formats each record as a single line with aligned columns. Colour can
/// be disabled for piping to files or non-terminal sinks.
///
/// @ingroup io_writers
class TextualAuditWriter : public core::AuditRecorder {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, emit ANSI escape codes for colour.
    explicit TextualAuditWriter(std::ostream& output, bool color_enabled = true);

    TextualAuditWriter(const TextualAuditWriter&) = delete;
    TextualAuditWriter& operator=(const TextualAuditWriter&) = delete;
    TextualAuditWriter(TextualAuditWriter&&) = delete;
    TextualAuditWriter& operator=(TextualAuditWriter&&) = delete;

    /// @brief Write @p record as one line.
    void record(const core::AuditRecord& record) override;

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
};

/// @brief Render an audit value as compact text (`null`, `"B1_F1_V1"`, `{x: 1.5}`).
[[nodiscard]] std::string format_audit_value(const core::AuditValue& value);

} // namespace spotalloc::io
