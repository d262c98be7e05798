/**
 * @file Archiver.hpp
 * @brief Moves the full history of long-closed tasks into monthly archive files.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/repositories/IEventLog.hpp"

namespace spool::application {

struct ArchiveCandidate {
    std::string taskId;
    std::string title;
    std::chrono::system_clock::time_point completedAt;
    std::string archiveFile;  ///< e.g. "archive/2026-01.jsonl"
    std::size_t eventCount = 0; ///< Lines leaving the active files.
};

/**
 * @struct ArchivePlan
 * @brief What an archive run would do. Computing it writes nothing.
 */
struct ArchivePlan {
    std::vector<ArchiveCandidate> candidates;
    domain::LogRewrite changes;
    domain::LogExpectation expected; ///< Hash of every touched file as planned.

    bool empty() const { return candidates.empty(); }
};

/**
 * @class Archiver
 * @brief Selects complete tasks with completed_at before a cutoff and moves
 * every raw line they own from events/ to archive/<YYYY-MM>.jsonl.
 *
 * Remaining active lines keep their bytes and relative order; an active file
 * left without records is removed. Archive lines are appended per task in
 * canonical order. Lines whose event_id is already archived are dropped
 * rather than copied twice, so a rerun after an interrupted commit converges.
 */
class Archiver {
public:
    static constexpr int kMaxAgeDays = 36500;

    explicit Archiver(std::shared_ptr<domain::IEventLog> log);

    /**
     * @brief Cutoff for tasks closed more than `days` ago, or the start of the
     * current UTC month when no age is given.
     * @throws std::invalid_argument if days is negative or above kMaxAgeDays.
     */
    static std::chrono::system_clock::time_point CutoffFor(std::chrono::system_clock::time_point now,
                                                           std::optional<int> days);

    ArchivePlan plan(std::chrono::system_clock::time_point cutoff) const;

    /**
     * @brief Plans and commits in one all-or-nothing rewrite.
     * @return Number of tasks migrated.
     * @throws std::runtime_error if the rewrite fails or a touched file was
     * appended to after planning; the log is then unchanged.
     */
    std::size_t archive(std::chrono::system_clock::time_point cutoff);

private:
    std::shared_ptr<domain::IEventLog> m_log;
};

} // namespace spool::application
