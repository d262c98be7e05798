/**
 * @file Archiver.cpp
 * @brief Implementation of Archiver.
 */

#include "application/Archiver.hpp"

#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "application/ReplayEngine.hpp"
#include "infrastructure/EventLogFs.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace spool::application {

using namespace spool::domain;
using infrastructure::EventLogFs;
using infrastructure::TimeUtils;

namespace {

using LineKey = std::pair<std::string, std::size_t>;

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r") == std::string::npos;
}

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace

Archiver::Archiver(std::shared_ptr<IEventLog> log) : m_log(std::move(log)) {}

std::chrono::system_clock::time_point Archiver::CutoffFor(std::chrono::system_clock::time_point now,
                                                          std::optional<int> days) {
    if (!days) return TimeUtils::StartOfMonth(now);
    if (*days < 0 || *days > kMaxAgeDays) {
        throw std::invalid_argument("archive age must be between 0 and " + std::to_string(kMaxAgeDays) +
                                    " days, got " + std::to_string(*days));
    }
    return now - std::chrono::hours(24) * static_cast<long long>(*days);
}

ArchivePlan Archiver::plan(std::chrono::system_clock::time_point cutoff) const {
    const LogSnapshot snapshot = m_log->read(LogScope::All);

    std::map<std::string, const LogFile*> filesByPath;
    std::map<LineKey, const std::string*> rawText;
    for (const auto& file : snapshot.files) {
        filesByPath.emplace(file.path, &file);
        for (const auto& raw : file.lines) {
            rawText.emplace(LineKey{raw.position.file, raw.position.line}, &raw.text);
        }
    }
    auto isArchived = [&filesByPath](const std::string& path) {
        auto it = filesByPath.find(path);
        return it != filesByPath.end() && it->second->archived;
    };

    DecodedLog decoded = ReplayEngine::Decode(snapshot);
    std::set<std::string> archivedIds;
    for (const auto& logged : decoded.events) {
        if (isArchived(logged.position.file)) archivedIds.insert(logged.event.eventId);
    }
    // Every active copy, duplicates included, so nothing of a moved task stays behind.
    std::map<std::string, std::vector<LineKey>> activeLinesByTask;
    for (const auto& logged : decoded.events) {
        if (!isArchived(logged.position.file)) {
            activeLinesByTask[logged.event.taskId].push_back({logged.position.file, logged.position.line});
        }
    }

    std::vector<Diagnostic> diagnostics;
    const auto timelines = ReplayEngine::GroupAndOrder(std::move(decoded.events), diagnostics);
    const auto tasks = ReplayEngine::Fold(timelines, diagnostics);

    ArchivePlan plan;
    std::set<LineKey> removed;
    std::map<std::string, std::vector<std::string>> appended; // archive file -> new lines

    for (const auto& [taskId, task] : tasks) {
        if (!task.isComplete() || !task.completedAt || !(*task.completedAt < cutoff)) continue;
        auto active = activeLinesByTask.find(taskId);
        if (active == activeLinesByTask.end()) continue;

        ArchiveCandidate candidate;
        candidate.taskId = taskId;
        candidate.title = task.title;
        candidate.completedAt = *task.completedAt;
        candidate.archiveFile = EventLogFs::ArchiveFileFor(TimeUtils::FormatMonth(*task.completedAt));
        candidate.eventCount = active->second.size();

        removed.insert(active->second.begin(), active->second.end());
        for (const auto& logged : timelines.at(taskId)) {
            if (archivedIds.count(logged.event.eventId)) continue;
            const LineKey key{logged.position.file, logged.position.line};
            appended[candidate.archiveFile].push_back(*rawText.at(key));
        }
        plan.candidates.push_back(std::move(candidate));
    }
    if (plan.candidates.empty()) return plan;

    // Active files: drop moved lines, keep the rest as they were.
    std::set<std::string> touched;
    for (const auto& key : removed) touched.insert(key.first);
    for (const auto& path : touched) {
        const LogFile& file = *filesByPath.at(path);
        std::vector<std::string> kept;
        bool hasRecord = false;
        for (const auto& raw : file.lines) {
            if (removed.count(LineKey{path, raw.position.line})) continue;
            if (!IsBlank(raw.text)) hasRecord = true;
            kept.push_back(raw.text);
        }
        if (hasRecord) {
            plan.changes[path] = JoinLines(kept);
        } else {
            plan.changes[path] = std::nullopt;
        }
    }

    // Archive files: existing lines first, then the new ones.
    for (const auto& [path, lines] : appended) {
        std::vector<std::string> all;
        auto existing = filesByPath.find(path);
        if (existing != filesByPath.end()) {
            for (const auto& raw : existing->second->lines) all.push_back(raw.text);
        }
        all.insert(all.end(), lines.begin(), lines.end());
        plan.changes[path] = JoinLines(all);
    }

    for (const auto& entry : plan.changes) {
        auto file = filesByPath.find(entry.first);
        plan.expected[entry.first] = file == filesByPath.end() ? std::string() : file->second->contentHash;
    }
    return plan;
}

std::size_t Archiver::archive(std::chrono::system_clock::time_point cutoff) {
    ArchivePlan pending = plan(cutoff);
    if (pending.empty()) {
        std::cerr << "[Archiver] Nothing to archive before " << TimeUtils::FormatIso8601(cutoff) << std::endl;
        return 0;
    }
    m_log->rewrite(pending.changes, pending.expected);
    std::cerr << "[Archiver] Archived " << pending.candidates.size() << " task(s)" << std::endl;
    return pending.candidates.size();
}

} // namespace spool::application
