/**
 * @file TaskEvents.hpp
 * @brief Event schema: the operations a task log may carry and the envelope around them.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

#include "../value_objects/TaskAttributes.hpp"

namespace spool::domain {

struct TaskCreated {
    static constexpr const char* Type = "create";
    std::string title;
    std::string description;
    Priority priority = Priority::P2;
    std::vector<std::string> tags;
    std::optional<std::string> assignee;
    std::optional<std::string> stream;
    std::optional<std::string> parent;
};

struct FieldUpdated {
    static constexpr const char* Type = "update_field";
    TaskField field = TaskField::Title;
    std::string value;             // title, description, priority
    std::vector<std::string> tags; // tags replace the whole set
};

struct TaskAssigned {
    static constexpr const char* Type = "assign";
    std::string assignee;
};

struct TaskUnassigned {
    static constexpr const char* Type = "unassign";
};

struct CommentAdded {
    static constexpr const char* Type = "comment";
    std::string body;
    std::optional<std::string> ref;
};

struct LinkAdded {
    static constexpr const char* Type = "link";
    LinkRelation rel = LinkRelation::Blocks;
    std::string target;
};

struct LinkRemoved {
    static constexpr const char* Type = "unlink";
    LinkRelation rel = LinkRelation::Blocks;
    std::string target;
};

struct StreamSet {
    static constexpr const char* Type = "set_stream";
    std::optional<std::string> stream; // nullopt clears the stream
};

struct TaskCompleted {
    static constexpr const char* Type = "complete";
    Resolution resolution = Resolution::Done;
};

struct TaskReopened {
    static constexpr const char* Type = "reopen";
};

/**
 * @struct UnknownOperation
 * @brief An operation tag this build does not know. Kept verbatim so newer
 * writers' events survive replay and archival untouched.
 */
struct UnknownOperation {
    std::string type;
    std::string payloadJson; // the full "operation" object as written
};

using TaskOperation = std::variant<
    TaskCreated,
    FieldUpdated,
    TaskAssigned,
    TaskUnassigned,
    CommentAdded,
    LinkAdded,
    LinkRemoved,
    StreamSet,
    TaskCompleted,
    TaskReopened,
    UnknownOperation
>;

inline std::string OperationType(const TaskOperation& op) {
    return std::visit([](auto&& o) -> std::string {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, UnknownOperation>) {
            return o.type;
        } else {
            return T::Type;
        }
    }, op);
}

inline constexpr int kSchemaVersion = 1;

/**
 * @struct Event
 * @brief One immutable line of the task log.
 */
struct Event {
    int schemaVersion = kSchemaVersion;
    std::string eventId;
    std::string taskId;   ///< Equals eventId of the task's create event.
    std::uint64_t seq = 0; ///< Per-task counter, primary ordering key.
    std::chrono::system_clock::time_point timestamp;
    std::string author;
    std::string branch;
    TaskOperation operation;

    bool isCreate() const { return std::holds_alternative<TaskCreated>(operation); }
};

/**
 * @brief Canonical per-task order: (seq, timestamp, event_id).
 *
 * Clocks on different branches cannot be trusted, so seq dominates and the
 * event id settles whatever is left.
 */
inline bool CanonicalLess(const Event& a, const Event& b) {
    return std::tie(a.seq, a.timestamp, a.eventId) < std::tie(b.seq, b.timestamp, b.eventId);
}

} // namespace spool::domain
