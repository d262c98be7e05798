/**
 * @file TaskService.cpp
 * @brief Implementation of TaskService.
 */

#include "application/TaskService.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <variant>

#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace spool::application {

using infrastructure::IdGenerator;
using infrastructure::StateCache;
using infrastructure::TimeUtils;

namespace {

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

bool TaskFilter::matches(const TaskSummary& summary) const {
    if (status && summary.status != *status) return false;
    if (assignee && summary.assignee != assignee) return false;
    if (tag && !summary.tags.count(*tag)) return false;
    if (priority && summary.priority != *priority) return false;
    if (stream && summary.stream != stream) return false;
    return true;
}

TaskService::TaskService(std::shared_ptr<IEventLog> log,
                         std::shared_ptr<StateCache> cache,
                         Actor actor,
                         Clock clock)
    : m_log(std::move(log)), m_cache(std::move(cache)), m_actor(std::move(actor)), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return TimeUtils::NowMillis(); };
    }
}

// --- Materialization ---

TaskState TaskService::replayAndStore(const LogSnapshot& snapshot, const std::string& fingerprint,
                                      TaskIndex* index) const {
    ReplayEngine engine;
    ReplayResult result = engine.replay(snapshot);
    TaskIndex built = ReplayEngine::BuildIndex(result);
    m_cache->store(fingerprint, result.state, built);
    if (index) *index = std::move(built);
    return std::move(result.state);
}

TaskState TaskService::currentState() const {
    const LogSnapshot snapshot = m_log->read(LogScope::All);
    const std::string fingerprint = StateCache::Fingerprint(snapshot);
    if (auto cached = m_cache->loadState(fingerprint)) {
        return std::move(*cached);
    }
    return replayAndStore(snapshot, fingerprint, nullptr);
}

TaskIndex TaskService::currentIndex() const {
    const LogSnapshot snapshot = m_log->read(LogScope::All);
    const std::string fingerprint = StateCache::Fingerprint(snapshot);
    if (auto cached = m_cache->loadIndex(fingerprint)) {
        return std::move(*cached);
    }
    TaskIndex index;
    replayAndStore(snapshot, fingerprint, &index);
    return index;
}

// --- Queries ---

std::vector<TaskSummary> TaskService::list(const TaskFilter& filter) const {
    std::vector<TaskSummary> out;
    for (const auto& [id, summary] : currentIndex()) {
        if (filter.matches(summary)) out.push_back(summary);
    }
    std::sort(out.begin(), out.end(), [](const TaskSummary& a, const TaskSummary& b) {
        return std::tie(a.priority, a.createdAt, a.id) < std::tie(b.priority, b.createdAt, b.id);
    });
    return out;
}

std::optional<Task> TaskService::get(const std::string& taskId) const {
    TaskState state = currentState();
    auto it = state.tasks.find(taskId);
    if (it == state.tasks.end()) return std::nullopt;
    return std::move(it->second);
}

TaskTimeline TaskService::history(const std::string& taskId) const {
    std::vector<Diagnostic> ignored;
    DecodedLog decoded = ReplayEngine::Decode(m_log->read(LogScope::All));
    auto timelines = ReplayEngine::GroupAndOrder(std::move(decoded.events), ignored);
    auto it = timelines.find(taskId);
    if (it == timelines.end()) return {};
    return std::move(it->second);
}

std::vector<Diagnostic> TaskService::diagnostics() const {
    return currentState().diagnostics;
}

// --- Mutations ---

Event TaskService::makeEvent(const std::string& taskId, std::uint64_t seq, TaskOperation operation) const {
    Event event;
    event.timestamp = m_clock();
    event.eventId = IdGenerator::NewEventId(event.timestamp);
    event.taskId = taskId.empty() ? event.eventId : taskId;
    event.seq = seq;
    event.author = m_actor.author;
    event.branch = m_actor.branch;
    event.operation = std::move(operation);
    return event;
}

Event TaskService::create(const TaskCreated& created) {
    if (IsBlank(created.title)) {
        throw std::invalid_argument("Task title must not be empty");
    }
    if (created.parent) {
        const TaskState state = currentState();
        if (!state.tasks.count(*created.parent)) {
            throw std::invalid_argument("Unknown parent task: " + *created.parent);
        }
    }
    Event event = makeEvent("", 1, created);
    m_log->append(event);
    return event;
}

void TaskService::checkOperation(const TaskState& state, const Task& task, const TaskOperation& operation) const {
    std::visit([&](auto&& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, TaskCreated>) {
            throw std::invalid_argument("Task " + task.id + " already exists");
        } else if constexpr (std::is_same_v<T, FieldUpdated>) {
            if (op.field == TaskField::Title && IsBlank(op.value)) {
                throw std::invalid_argument("Task title must not be empty");
            }
            if (op.field == TaskField::Priority && !PriorityFromString(op.value)) {
                throw std::invalid_argument("Unknown priority: " + op.value);
            }
        } else if constexpr (std::is_same_v<T, TaskAssigned>) {
            if (IsBlank(op.assignee)) throw std::invalid_argument("Assignee must not be empty");
        } else if constexpr (std::is_same_v<T, CommentAdded>) {
            if (IsBlank(op.body)) throw std::invalid_argument("Comment must not be empty");
        } else if constexpr (std::is_same_v<T, LinkAdded>) {
            if (op.target == task.id) throw std::invalid_argument("A task cannot link to itself");
            if (!state.tasks.count(op.target)) throw std::invalid_argument("Unknown link target: " + op.target);
        } else if constexpr (std::is_same_v<T, LinkRemoved>) {
            const bool linked = (op.rel == LinkRelation::Blocks && task.blocks.count(op.target)) ||
                                (op.rel == LinkRelation::BlockedBy && task.blockedBy.count(op.target)) ||
                                (op.rel == LinkRelation::Parent && task.parent == op.target);
            if (!linked) {
                throw std::invalid_argument(task.id + " has no " + RelationToString(op.rel) + " link to " + op.target);
            }
        } else if constexpr (std::is_same_v<T, TaskCompleted>) {
            if (task.isComplete()) throw std::invalid_argument("Task " + task.id + " is already complete");
        } else if constexpr (std::is_same_v<T, TaskReopened>) {
            if (!task.isComplete()) throw std::invalid_argument("Task " + task.id + " is not complete");
        } else if constexpr (std::is_same_v<T, UnknownOperation>) {
            throw std::invalid_argument("Cannot write unknown operation '" + op.type + "'");
        }
    }, operation);
}

Event TaskService::apply(const std::string& taskId, const TaskOperation& operation) {
    const TaskState state = currentState();
    auto it = state.tasks.find(taskId);
    if (it == state.tasks.end()) {
        throw std::runtime_error("Task not found: " + taskId);
    }
    const Task& task = it->second;
    checkOperation(state, task, operation);

    Event event = makeEvent(taskId, task.lastSeq + 1, operation);
    m_log->append(event);

    // Keep blocks / blocked_by symmetric by writing the other side too.
    const LinkRelation* rel = nullptr;
    std::string target;
    bool adding = false;
    if (const auto* link = std::get_if<LinkAdded>(&operation)) {
        rel = &link->rel;
        target = link->target;
        adding = true;
    } else if (const auto* unlink = std::get_if<LinkRemoved>(&operation)) {
        rel = &unlink->rel;
        target = unlink->target;
    }
    if (rel) {
        auto mirror = MirrorRelation(*rel);
        auto other = state.tasks.find(target);
        if (mirror && other != state.tasks.end()) {
            const auto& mirrored = (*mirror == LinkRelation::Blocks) ? other->second.blocks : other->second.blockedBy;
            const bool present = mirrored.count(taskId) > 0;
            if (adding && !present) {
                m_log->append(makeEvent(target, other->second.lastSeq + 1, LinkAdded{*mirror, taskId}));
            } else if (!adding && present) {
                m_log->append(makeEvent(target, other->second.lastSeq + 1, LinkRemoved{*mirror, taskId}));
            }
        }
    }
    return event;
}

// --- Maintenance ---

TaskState TaskService::rebuild() {
    const LogSnapshot snapshot = m_log->read(LogScope::All);
    TaskState state = replayAndStore(snapshot, StateCache::Fingerprint(snapshot), nullptr);
    std::cerr << "[TaskService] Rebuilt " << state.tasks.size() << " task(s) from the log" << std::endl;
    return state;
}

ArchivePlan TaskService::planArchive(std::chrono::system_clock::time_point cutoff) const {
    return Archiver(m_log).plan(cutoff);
}

std::size_t TaskService::archive(std::chrono::system_clock::time_point cutoff) {
    return Archiver(m_log).archive(cutoff);
}

ValidationReport TaskService::validate() const {
    return LogValidator(m_log).Validate();
}

} // namespace spool::application
