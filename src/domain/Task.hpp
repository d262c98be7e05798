/**
 * @file Task.hpp
 * @brief Materialized task, rebuilt by folding its events in canonical order.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "value_objects/TaskAttributes.hpp"
#include "events/TaskEvents.hpp"

namespace spool::domain {

struct Comment {
    std::chrono::system_clock::time_point timestamp;
    std::string author;
    std::string body;
    std::optional<std::string> ref;
};

/**
 * @class Task
 * @brief Derived state of one task. Never persisted as a source of truth.
 *
 * The apply() overloads form the state-transition function of replay: each
 * touches only the fields its operation names, and none of them looks at
 * where the event came from on disk.
 */
class Task {
public:
    std::string id;
    std::string title;
    std::string description;
    Priority priority = Priority::P2;
    TaskStatus status = TaskStatus::Open;
    std::optional<Resolution> resolution;
    std::optional<std::string> assignee;
    std::set<std::string> tags;
    std::optional<std::string> stream;
    std::set<std::string> blocks;
    std::set<std::string> blockedBy;
    std::optional<std::string> parent;
    std::vector<Comment> comments;
    std::chrono::system_clock::time_point createdAt;
    std::string createdBy;
    std::string createdBranch;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    std::uint64_t lastSeq = 0;

    bool isComplete() const { return status == TaskStatus::Complete; }

    // --- Rehydration ---

    /**
     * @brief Seeds a task from its create event.
     * @throws std::invalid_argument if the event is not a create.
     */
    static Task FromCreate(const Event& event) {
        const auto* created = std::get_if<TaskCreated>(&event.operation);
        if (!created) {
            throw std::invalid_argument("Task can only be seeded by a create event: " + event.eventId);
        }
        Task task;
        task.id = event.taskId;
        task.title = created->title;
        task.description = created->description;
        task.priority = created->priority;
        task.tags.insert(created->tags.begin(), created->tags.end());
        task.assignee = created->assignee;
        task.stream = created->stream;
        task.parent = created->parent;
        task.createdAt = event.timestamp;
        task.createdBy = event.author;
        task.createdBranch = event.branch;
        task.updatedAt = event.timestamp;
        task.lastSeq = event.seq;
        return task;
    }

    // Helper to apply any event variant
    void applyEvent(const Event& event) {
        std::visit([this, &event](auto&& op) {
            this->apply(op, event);
        }, event.operation);
        // Opaque operations still consume their seq so new writes never reuse it.
        if (event.seq > lastSeq) lastSeq = event.seq;
    }

    void apply(const TaskCreated&, const Event&) {
        // A second create for the same id cannot exist without a duplicate
        // event id, which replay filters out before folding.
    }

    void apply(const FieldUpdated& e, const Event& env) {
        switch (e.field) {
            case TaskField::Title: title = e.value; break;
            case TaskField::Description: description = e.value; break;
            case TaskField::Priority:
                if (auto p = PriorityFromString(e.value)) priority = *p;
                break;
            case TaskField::Tags:
                tags.clear();
                tags.insert(e.tags.begin(), e.tags.end());
                break;
        }
        updatedAt = env.timestamp;
    }

    void apply(const TaskAssigned& e, const Event& env) {
        assignee = e.assignee;
        updatedAt = env.timestamp;
    }

    void apply(const TaskUnassigned&, const Event& env) {
        assignee.reset();
        updatedAt = env.timestamp;
    }

    void apply(const CommentAdded& e, const Event& env) {
        comments.push_back(Comment{env.timestamp, env.author, e.body, e.ref});
        updatedAt = env.timestamp;
    }

    void apply(const LinkAdded& e, const Event& env) {
        switch (e.rel) {
            case LinkRelation::Blocks: blocks.insert(e.target); break;
            case LinkRelation::BlockedBy: blockedBy.insert(e.target); break;
            case LinkRelation::Parent: parent = e.target; break;
        }
        updatedAt = env.timestamp;
    }

    void apply(const LinkRemoved& e, const Event& env) {
        switch (e.rel) {
            case LinkRelation::Blocks: blocks.erase(e.target); break;
            case LinkRelation::BlockedBy: blockedBy.erase(e.target); break;
            case LinkRelation::Parent:
                if (parent && *parent == e.target) parent.reset();
                break;
        }
        updatedAt = env.timestamp;
    }

    void apply(const StreamSet& e, const Event& env) {
        stream = e.stream;
        updatedAt = env.timestamp;
    }

    void apply(const TaskCompleted& e, const Event& env) {
        // Completing an already complete task keeps the later resolution;
        // the validator reports it as a conflict.
        status = TaskStatus::Complete;
        resolution = e.resolution;
        completedAt = env.timestamp;
        updatedAt = env.timestamp;
    }

    void apply(const TaskReopened&, const Event& env) {
        status = TaskStatus::Open;
        resolution.reset();
        completedAt.reset();
        updatedAt = env.timestamp;
    }

    void apply(const UnknownOperation&, const Event&) {}
};

} // namespace spool::domain
