/**
 * @file TaskService.hpp
 * @brief Application Service: the query and mutation interface over the task log.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/Archiver.hpp"
#include "application/LogValidator.hpp"
#include "application/ReplayEngine.hpp"
#include "domain/TaskState.hpp"
#include "domain/events/TaskEvents.hpp"
#include "domain/repositories/IEventLog.hpp"
#include "infrastructure/StateCache.hpp"

namespace spool::application {

using namespace spool::domain;

/**
 * @struct Actor
 * @brief Provenance stamped on every event this service writes.
 */
struct Actor {
    std::string author;
    std::string branch;
};

/**
 * @struct TaskFilter
 * @brief Every set field must match. status nullopt lists all tasks.
 */
struct TaskFilter {
    std::optional<TaskStatus> status = TaskStatus::Open;
    std::optional<std::string> assignee;
    std::optional<std::string> tag;
    std::optional<Priority> priority;
    std::optional<std::string> stream;

    bool matches(const TaskSummary& summary) const;
};

class TaskService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param clock Source of event timestamps; defaults to the system clock
     *              truncated to milliseconds.
     */
    TaskService(std::shared_ptr<IEventLog> log,
                std::shared_ptr<infrastructure::StateCache> cache,
                Actor actor,
                Clock clock = {});

    // --- Queries ---

    /** @brief Matching tasks ordered by priority, then created_at, then id. */
    std::vector<TaskSummary> list(const TaskFilter& filter) const;

    std::optional<Task> get(const std::string& taskId) const;

    /** @brief Every event of the task in canonical order, archived ones included. */
    TaskTimeline history(const std::string& taskId) const;

    /** @brief Replay diagnostics of the current state. */
    std::vector<Diagnostic> diagnostics() const;

    // --- Mutations ---

    /**
     * @brief Appends a create event; the new task id is the event id.
     * @throws std::invalid_argument on an empty title or unknown parent.
     */
    Event create(const TaskCreated& created);

    /**
     * @brief Appends one operation to an existing task.
     *
     * link/unlink of blocks or blocked_by also appends the mirror event on the
     * target so both sides stay symmetric.
     * @throws std::runtime_error if the task does not exist.
     * @throws std::invalid_argument if the operation is not allowed in the
     *         task's current state. Nothing is appended in either case.
     */
    Event apply(const std::string& taskId, const TaskOperation& operation);

    // --- Maintenance ---

    /** @brief Replays from scratch and rewrites both caches. */
    TaskState rebuild();

    ArchivePlan planArchive(std::chrono::system_clock::time_point cutoff) const;
    std::size_t archive(std::chrono::system_clock::time_point cutoff);

    ValidationReport validate() const;

private:
    std::shared_ptr<IEventLog> m_log;
    std::shared_ptr<infrastructure::StateCache> m_cache;
    Actor m_actor;
    Clock m_clock;

    TaskState currentState() const;
    TaskIndex currentIndex() const;
    TaskState replayAndStore(const LogSnapshot& snapshot, const std::string& fingerprint, TaskIndex* index) const;

    void checkOperation(const TaskState& state, const Task& task, const TaskOperation& operation) const;
    Event makeEvent(const std::string& taskId, std::uint64_t seq, TaskOperation operation) const;
};

} // namespace spool::application
