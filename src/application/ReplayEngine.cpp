/**
 * @file ReplayEngine.cpp
 * @brief Implementation of ReplayEngine.
 */

#include "application/ReplayEngine.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <set>
#include <tuple>
#include <unordered_map>

#include "infrastructure/EventCodec.hpp"

namespace spool::application {

using namespace spool::domain;
using infrastructure::EventCodec;
using infrastructure::EventDecodeError;

namespace {

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r") == std::string::npos;
}

std::string Where(const LogPosition& pos) {
    return pos.file + ":" + std::to_string(pos.line);
}

bool PositionLess(const Diagnostic& a, const Diagnostic& b) {
    return std::tie(a.file, a.line, a.message) < std::tie(b.file, b.line, b.message);
}

} // namespace

DecodedLog ReplayEngine::Decode(const LogSnapshot& snapshot) {
    DecodedLog decoded;
    for (const auto& file : snapshot.files) {
        for (const auto& raw : file.lines) {
            if (IsBlank(raw.text)) continue;
            try {
                decoded.events.push_back(LoggedEvent{EventCodec::Decode(raw.text), raw.position});
            } catch (const EventDecodeError& e) {
                Diagnostic d;
                d.category = e.category();
                d.file = raw.position.file;
                d.line = raw.position.line;
                d.message = e.what();
                decoded.diagnostics.push_back(std::move(d));
            }
        }
    }
    return decoded;
}

std::map<std::string, TaskTimeline> ReplayEngine::GroupAndOrder(std::vector<LoggedEvent> events,
                                                                std::vector<Diagnostic>& diagnostics) {
    // One global keyed sort puts every task's events in canonical order at once.
    std::stable_sort(events.begin(), events.end(), [](const LoggedEvent& a, const LoggedEvent& b) {
        if (CanonicalLess(a.event, b.event)) return true;
        if (CanonicalLess(b.event, a.event)) return false;
        return std::tie(a.position.file, a.position.line) < std::tie(b.position.file, b.position.line);
    });

    std::map<std::string, TaskTimeline> timelines;
    std::unordered_map<std::string, LogPosition> seen;
    for (auto& logged : events) {
        auto [it, inserted] = seen.emplace(logged.event.eventId, logged.position);
        if (!inserted) {
            Diagnostic d;
            d.category = DiagnosticCategory::DuplicateEventId;
            d.file = logged.position.file;
            d.line = logged.position.line;
            d.taskId = logged.event.taskId;
            d.message = "event " + logged.event.eventId + " already read at " + Where(it->second) + "; copy ignored";
            diagnostics.push_back(std::move(d));
            continue;
        }
        timelines[logged.event.taskId].push_back(std::move(logged));
    }
    return timelines;
}

std::map<std::string, Task> ReplayEngine::Fold(const std::map<std::string, TaskTimeline>& timelines,
                                               std::vector<Diagnostic>& diagnostics) {
    std::map<std::string, Task> tasks;
    for (const auto& [taskId, timeline] : timelines) {
        std::optional<Task> task;
        for (const auto& logged : timeline) {
            const Event& event = logged.event;
            if (!task && event.isCreate()) {
                task = Task::FromCreate(event);
                continue;
            }
            if (!task) {
                Diagnostic d;
                d.category = DiagnosticCategory::Orphan;
                d.file = logged.position.file;
                d.line = logged.position.line;
                d.taskId = taskId;
                d.message = OperationType(event.operation) + " event " + event.eventId +
                            " has no prior create for task " + taskId;
                diagnostics.push_back(std::move(d));
                continue;
            }
            task->applyEvent(event);
        }
        if (task) {
            tasks.emplace(taskId, std::move(*task));
        }
    }
    return tasks;
}

ReplayResult ReplayEngine::replay(const LogSnapshot& snapshot) const {
    DecodedLog decoded = Decode(snapshot);
    const size_t eventCount = decoded.events.size();

    ReplayResult result;
    result.state.diagnostics = std::move(decoded.diagnostics);
    result.timelines = GroupAndOrder(std::move(decoded.events), result.state.diagnostics);
    result.state.tasks = Fold(result.timelines, result.state.diagnostics);

    std::sort(result.state.diagnostics.begin(), result.state.diagnostics.end(), PositionLess);

    if (!result.state.diagnostics.empty()) {
        std::cerr << "[Replay] " << result.state.tasks.size() << " tasks from " << eventCount
                  << " events, " << result.state.diagnostics.size() << " record(s) skipped" << std::endl;
    }
    return result;
}

TaskIndex ReplayEngine::BuildIndex(const ReplayResult& result) {
    TaskIndex index;
    for (const auto& [taskId, task] : result.state.tasks) {
        std::set<std::string> files;
        auto it = result.timelines.find(taskId);
        if (it != result.timelines.end()) {
            for (const auto& logged : it->second) files.insert(logged.position.file);
        }
        index.emplace(taskId, Summarize(task, std::move(files)));
    }
    return index;
}

} // namespace spool::application
