/**
 * @file LogValidator.cpp
 * @brief Implementation of LogValidator.
 */

#include "application/LogValidator.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <variant>

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

/** @brief Position of the latest link event in canonical order naming rel and target. */
std::optional<LogPosition> LinkOrigin(const TaskTimeline& timeline, LinkRelation rel, const std::string& target) {
    std::optional<LogPosition> origin;
    for (const auto& logged : timeline) {
        if (const auto* link = std::get_if<LinkAdded>(&logged.event.operation)) {
            if (link->rel == rel && link->target == target) origin = logged.position;
        }
        if (logged.event.isCreate()) {
            const auto& created = std::get<TaskCreated>(logged.event.operation);
            if (rel == LinkRelation::Parent && created.parent && *created.parent == target && !origin) {
                origin = logged.position;
            }
        }
    }
    return origin;
}

} // namespace

LogValidator::LogValidator(std::shared_ptr<IEventLog> log) : m_log(std::move(log)) {}

void LogValidator::AddDiagnostic(ValidationReport& report, DiagnosticCategory category,
                                 const LogPosition& position, const std::string& taskId,
                                 const std::string& message) const {
    Diagnostic d;
    d.category = category;
    d.file = position.file;
    d.line = position.line;
    d.taskId = taskId;
    d.message = message;
    report.diagnostics.push_back(std::move(d));
}

ValidationReport LogValidator::Validate() const {
    return Validate(m_log->read(LogScope::All));
}

ValidationReport LogValidator::Validate(const LogSnapshot& snapshot) const {
    ValidationReport report;

    // A) Record-level checks, one line at a time.
    std::vector<LoggedEvent> events;
    for (const auto& file : snapshot.files) {
        for (const auto& raw : file.lines) {
            if (IsBlank(raw.text)) continue;
            Event event;
            try {
                event = EventCodec::Decode(raw.text);
            } catch (const EventDecodeError& e) {
                AddDiagnostic(report, e.category(), raw.position, "", e.what());
                continue;
            }
            if (event.schemaVersion != kSchemaVersion) {
                AddDiagnostic(report, DiagnosticCategory::SchemaVersion, raw.position, event.taskId,
                              "schema version " + std::to_string(event.schemaVersion) + ", this build writes " +
                              std::to_string(kSchemaVersion));
            }
            if (std::holds_alternative<UnknownOperation>(event.operation)) {
                AddDiagnostic(report, DiagnosticCategory::UnknownOperation, raw.position, event.taskId,
                              "unknown operation '" + OperationType(event.operation) + "' kept as is");
            }
            events.push_back(LoggedEvent{std::move(event), raw.position});
        }
    }

    // B) Ordering checks.
    CheckPhysicalSeqOrder(report, events);

    std::vector<Diagnostic> replayDiagnostics;
    const auto timelines = ReplayEngine::GroupAndOrder(std::move(events), replayDiagnostics);

    // C) Referential checks on the folded state.
    const auto tasks = ReplayEngine::Fold(timelines, replayDiagnostics);
    report.diagnostics.insert(report.diagnostics.end(), replayDiagnostics.begin(), replayDiagnostics.end());
    CheckLinks(report, tasks, timelines);

    // D) Advisory conflicts.
    CheckConflicts(report, timelines);

    std::stable_sort(report.diagnostics.begin(), report.diagnostics.end(),
                     [](const Diagnostic& a, const Diagnostic& b) {
                         return std::tie(a.file, a.line) < std::tie(b.file, b.line);
                     });
    for (const auto& d : report.diagnostics) {
        switch (d.severity()) {
            case Severity::Error: ++report.errorCount; break;
            case Severity::Warning: ++report.warningCount; break;
            case Severity::Conflict: ++report.conflictCount; break;
        }
    }

    std::cerr << "[Validator] " << snapshot.files.size() << " file(s): " << report.errorCount << " error(s), "
              << report.warningCount << " warning(s), " << report.conflictCount << " conflict(s)" << std::endl;
    return report;
}

// A seq repeated under distinct event_ids is two writers diverging from the
// same base, resolved by the canonical order; only a decrease is a violation.
void LogValidator::CheckPhysicalSeqOrder(ValidationReport& report, const std::vector<LoggedEvent>& events) const {
    // (file, task, branch) -> last seq seen going down the file
    std::map<std::tuple<std::string, std::string, std::string>, std::uint64_t> lastSeq;
    for (const auto& logged : events) {
        const auto key = std::make_tuple(logged.position.file, logged.event.taskId, logged.event.branch);
        auto it = lastSeq.find(key);
        if (it != lastSeq.end() && logged.event.seq < it->second) {
            AddDiagnostic(report, DiagnosticCategory::SeqViolation, logged.position, logged.event.taskId,
                          "seq " + std::to_string(logged.event.seq) + " follows seq " + std::to_string(it->second) +
                          " for the same task and branch in this file");
        }
        if (it == lastSeq.end() || logged.event.seq > it->second) {
            lastSeq[key] = logged.event.seq;
        }
    }
}

void LogValidator::CheckLinks(ValidationReport& report, const std::map<std::string, Task>& tasks,
                              const std::map<std::string, TaskTimeline>& timelines) const {
    struct Side {
        LinkRelation rel;
        const std::set<std::string> Task::*own;
        const std::set<std::string> Task::*mirror;
    };
    const Side sides[] = {
        {LinkRelation::Blocks, &Task::blocks, &Task::blockedBy},
        {LinkRelation::BlockedBy, &Task::blockedBy, &Task::blocks},
    };

    for (const auto& [taskId, task] : tasks) {
        const TaskTimeline& timeline = timelines.at(taskId);
        for (const auto& side : sides) {
            for (const auto& target : task.*(side.own)) {
                const LogPosition where = LinkOrigin(timeline, side.rel, target).value_or(timeline.front().position);
                auto other = tasks.find(target);
                if (other == tasks.end()) {
                    AddDiagnostic(report, DiagnosticCategory::DanglingLink, where, taskId,
                                  taskId + " " + RelationToString(side.rel) + " unknown task " + target);
                } else if (!(other->second.*(side.mirror)).count(taskId)) {
                    AddDiagnostic(report, DiagnosticCategory::AsymmetricLink, where, taskId,
                                  taskId + " " + RelationToString(side.rel) + " " + target + " but " + target +
                                  " has no " + RelationToString(*MirrorRelation(side.rel)) + " " + taskId);
                }
            }
        }
        if (task.parent && !tasks.count(*task.parent)) {
            const LogPosition where =
                LinkOrigin(timeline, LinkRelation::Parent, *task.parent).value_or(timeline.front().position);
            AddDiagnostic(report, DiagnosticCategory::DanglingLink, where, taskId,
                          taskId + " parent is unknown task " + *task.parent);
        }
    }
}

void LogValidator::CheckConflicts(ValidationReport& report,
                                  const std::map<std::string, TaskTimeline>& timelines) const {
    for (const auto& [taskId, timeline] : timelines) {
        bool created = false;
        std::optional<Resolution> resolution; // set while complete
        LogPosition completedAt;
        for (const auto& logged : timeline) {
            const Event& event = logged.event;
            if (!created) {
                created = event.isCreate();
                continue;
            }
            if (const auto* done = std::get_if<TaskCompleted>(&event.operation)) {
                if (resolution && *resolution != done->resolution) {
                    AddDiagnostic(report, DiagnosticCategory::Conflict, logged.position, taskId,
                                  "completed as " + ResolutionToString(done->resolution) + " after " +
                                  ResolutionToString(*resolution) + " at " + Where(completedAt) +
                                  "; keeping " + ResolutionToString(done->resolution));
                }
                resolution = done->resolution;
                completedAt = logged.position;
            } else if (std::holds_alternative<TaskReopened>(event.operation)) {
                resolution.reset();
            }
        }
    }
}

} // namespace spool::application
