/**
 * @file Diagnostic.hpp
 * @brief Findings reported by replay and validation, attributed to a log line.
 */

#pragma once

#include <cstddef>
#include <string>

namespace spool::domain {

enum class DiagnosticCategory {
    ParseError,       ///< Line is not valid JSON or not an object.
    MissingField,     ///< A required envelope or payload field is absent.
    InvalidField,     ///< A field is present but has the wrong type or value.
    DuplicateEventId, ///< Same event_id appears more than once.
    SeqViolation,     ///< Repeated or non-increasing seq within one lineage.
    Orphan,           ///< Event for a task that has no create before it.
    AsymmetricLink,   ///< blocks / blocked_by recorded on one side only.
    DanglingLink,     ///< Link to a task that does not exist.
    UnknownOperation, ///< Operation tag from a newer writer.
    SchemaVersion,    ///< Envelope version other than the one this build writes.
    Conflict          ///< Divergent concurrent edits resolved by tie-break.
};

/**
 * @enum Severity
 * @brief Errors fail validation, warnings only in strict mode, conflicts never.
 */
enum class Severity {
    Error,
    Warning,
    Conflict
};

inline std::string CategoryToString(DiagnosticCategory category) {
    switch (category) {
        case DiagnosticCategory::ParseError: return "parse_error";
        case DiagnosticCategory::MissingField: return "missing_field";
        case DiagnosticCategory::InvalidField: return "invalid_field";
        case DiagnosticCategory::DuplicateEventId: return "duplicate_event_id";
        case DiagnosticCategory::SeqViolation: return "seq_violation";
        case DiagnosticCategory::Orphan: return "orphan";
        case DiagnosticCategory::AsymmetricLink: return "asymmetric_link";
        case DiagnosticCategory::DanglingLink: return "dangling_link";
        case DiagnosticCategory::UnknownOperation: return "unknown_operation";
        case DiagnosticCategory::SchemaVersion: return "schema_version";
        case DiagnosticCategory::Conflict: return "conflict";
        default: return "unknown";
    }
}

inline DiagnosticCategory CategoryFromString(const std::string& str) {
    if (str == "missing_field") return DiagnosticCategory::MissingField;
    if (str == "invalid_field") return DiagnosticCategory::InvalidField;
    if (str == "duplicate_event_id") return DiagnosticCategory::DuplicateEventId;
    if (str == "seq_violation") return DiagnosticCategory::SeqViolation;
    if (str == "orphan") return DiagnosticCategory::Orphan;
    if (str == "asymmetric_link") return DiagnosticCategory::AsymmetricLink;
    if (str == "dangling_link") return DiagnosticCategory::DanglingLink;
    if (str == "unknown_operation") return DiagnosticCategory::UnknownOperation;
    if (str == "schema_version") return DiagnosticCategory::SchemaVersion;
    if (str == "conflict") return DiagnosticCategory::Conflict;
    return DiagnosticCategory::ParseError;
}

inline Severity SeverityOf(DiagnosticCategory category) {
    switch (category) {
        case DiagnosticCategory::DanglingLink:
        case DiagnosticCategory::UnknownOperation:
        case DiagnosticCategory::SchemaVersion:
            return Severity::Warning;
        case DiagnosticCategory::Conflict:
            return Severity::Conflict;
        default:
            return Severity::Error;
    }
}

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Conflict: return "conflict";
        default: return "error";
    }
}

struct Diagnostic {
    DiagnosticCategory category = DiagnosticCategory::ParseError;
    std::string file;      ///< Path relative to the spool root, empty if not line-bound.
    std::size_t line = 0;  ///< 1-based physical line, 0 if not line-bound.
    std::string taskId;
    std::string message;

    Severity severity() const { return SeverityOf(category); }

    /** @brief "events/2026-01-02.jsonl:14: message" style rendering. */
    std::string toString() const {
        std::string out;
        if (!file.empty()) {
            out += file;
            if (line > 0) out += ":" + std::to_string(line);
            out += ": ";
        }
        out += "[" + CategoryToString(category) + "] " + message;
        return out;
    }
};

} // namespace spool::domain
