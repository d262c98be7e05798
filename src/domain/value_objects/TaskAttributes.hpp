/**
 * @file TaskAttributes.hpp
 * @brief Value Objects for the enumerated attributes of a task.
 */

#pragma once

#include <optional>
#include <string>

namespace spool::domain {

/**
 * @enum TaskStatus
 * @brief Lifecycle status. Only complete/reopen events move between the two.
 */
enum class TaskStatus {
    Open,
    Complete
};

inline std::string StatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Open: return "open";
        case TaskStatus::Complete: return "complete";
        default: return "unknown";
    }
}

inline std::optional<TaskStatus> StatusFromString(const std::string& str) {
    if (str == "open") return TaskStatus::Open;
    if (str == "complete") return TaskStatus::Complete;
    return std::nullopt;
}

/**
 * @enum Priority
 * @brief p0 is the most urgent; new tasks default to p2.
 */
enum class Priority {
    P0,
    P1,
    P2,
    P3
};

inline std::string PriorityToString(Priority priority) {
    switch (priority) {
        case Priority::P0: return "p0";
        case Priority::P1: return "p1";
        case Priority::P2: return "p2";
        case Priority::P3: return "p3";
        default: return "p2";
    }
}

inline std::optional<Priority> PriorityFromString(const std::string& str) {
    if (str == "p0") return Priority::P0;
    if (str == "p1") return Priority::P1;
    if (str == "p2") return Priority::P2;
    if (str == "p3") return Priority::P3;
    return std::nullopt;
}

/**
 * @enum Resolution
 * @brief Why a task was completed. Only meaningful while the task is complete.
 */
enum class Resolution {
    Done,
    WontFix,
    Duplicate,
    Obsolete
};

inline std::string ResolutionToString(Resolution resolution) {
    switch (resolution) {
        case Resolution::Done: return "done";
        case Resolution::WontFix: return "wontfix";
        case Resolution::Duplicate: return "duplicate";
        case Resolution::Obsolete: return "obsolete";
        default: return "done";
    }
}

inline std::optional<Resolution> ResolutionFromString(const std::string& str) {
    if (str == "done") return Resolution::Done;
    if (str == "wontfix") return Resolution::WontFix;
    if (str == "duplicate") return Resolution::Duplicate;
    if (str == "obsolete") return Resolution::Obsolete;
    return std::nullopt;
}

/**
 * @enum LinkRelation
 * @brief Relation recorded on the task that owns the link.
 *
 * Blocks and BlockedBy are mirror images of each other; Parent has no mirror.
 */
enum class LinkRelation {
    Blocks,
    BlockedBy,
    Parent
};

inline std::string RelationToString(LinkRelation rel) {
    switch (rel) {
        case LinkRelation::Blocks: return "blocks";
        case LinkRelation::BlockedBy: return "blocked_by";
        case LinkRelation::Parent: return "parent";
        default: return "unknown";
    }
}

inline std::optional<LinkRelation> RelationFromString(const std::string& str) {
    if (str == "blocks") return LinkRelation::Blocks;
    if (str == "blocked_by") return LinkRelation::BlockedBy;
    if (str == "parent") return LinkRelation::Parent;
    return std::nullopt;
}

/**
 * @brief Returns the relation the target task must record for a symmetric link.
 */
inline std::optional<LinkRelation> MirrorRelation(LinkRelation rel) {
    switch (rel) {
        case LinkRelation::Blocks: return LinkRelation::BlockedBy;
        case LinkRelation::BlockedBy: return LinkRelation::Blocks;
        default: return std::nullopt;
    }
}

/**
 * @enum TaskField
 * @brief Scalar fields an update_field operation may touch.
 */
enum class TaskField {
    Title,
    Description,
    Priority,
    Tags
};

inline std::string FieldToString(TaskField field) {
    switch (field) {
        case TaskField::Title: return "title";
        case TaskField::Description: return "description";
        case TaskField::Priority: return "priority";
        case TaskField::Tags: return "tags";
        default: return "unknown";
    }
}

inline std::optional<TaskField> FieldFromString(const std::string& str) {
    if (str == "title") return TaskField::Title;
    if (str == "description") return TaskField::Description;
    if (str == "priority") return TaskField::Priority;
    if (str == "tags") return TaskField::Tags;
    return std::nullopt;
}

} // namespace spool::domain
