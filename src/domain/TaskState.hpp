/**
 * @file TaskState.hpp
 * @brief Derived artifacts of replay: the full state snapshot and the listing index.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Task.hpp"
#include "Diagnostic.hpp"

namespace spool::domain {

/**
 * @struct TaskSummary
 * @brief Lightweight row of the index, enough for listing and filtering.
 */
struct TaskSummary {
    std::string id;
    std::string title;
    TaskStatus status = TaskStatus::Open;
    Priority priority = Priority::P2;
    std::optional<std::string> assignee;
    std::optional<std::string> stream;
    std::set<std::string> tags;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    std::set<std::string> files; ///< Log files holding this task's events.
};

using TaskIndex = std::map<std::string, TaskSummary>;

/**
 * @struct TaskState
 * @brief State snapshot: every materialized task plus what replay had to skip.
 */
struct TaskState {
    std::map<std::string, Task> tasks;
    std::vector<Diagnostic> diagnostics;
};

inline TaskSummary Summarize(const Task& task, std::set<std::string> files = {}) {
    TaskSummary s;
    s.id = task.id;
    s.title = task.title;
    s.status = task.status;
    s.priority = task.priority;
    s.assignee = task.assignee;
    s.stream = task.stream;
    s.tags = task.tags;
    s.createdAt = task.createdAt;
    s.updatedAt = task.updatedAt;
    s.completedAt = task.completedAt;
    s.files = std::move(files);
    return s;
}

} // namespace spool::domain
