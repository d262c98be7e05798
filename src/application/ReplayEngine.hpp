/**
 * @file ReplayEngine.hpp
 * @brief Folds the event log into task state, independent of physical line order.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/Diagnostic.hpp"
#include "domain/TaskState.hpp"
#include "domain/events/TaskEvents.hpp"
#include "domain/repositories/IEventLog.hpp"

namespace spool::application {

/**
 * @struct LoggedEvent
 * @brief A decoded event together with where it was read from.
 */
struct LoggedEvent {
    domain::Event event;
    domain::LogPosition position;
};

using TaskTimeline = std::vector<LoggedEvent>;

struct DecodedLog {
    std::vector<LoggedEvent> events;
    std::vector<domain::Diagnostic> diagnostics;
};

struct ReplayResult {
    domain::TaskState state;
    /// Every distinct event per task in canonical order, orphans included.
    std::map<std::string, TaskTimeline> timelines;
};

/**
 * @class ReplayEngine
 * @brief Parse, group by task, sort by (seq, timestamp, event_id), fold.
 *
 * Merges done by version control may interleave or reorder lines from
 * different branches, so nothing here depends on file or line position.
 * One bad record never aborts a replay; it becomes a diagnostic.
 */
class ReplayEngine {
public:
    /**
     * @brief Decodes every non-blank line independently.
     * Undecodable lines become diagnostics and are left out.
     */
    static DecodedLog Decode(const domain::LogSnapshot& snapshot);

    /**
     * @brief Groups events by task in canonical order.
     *
     * When an event_id occurs more than once only the copy that sorts first is
     * kept; each repeat adds a DuplicateEventId diagnostic.
     */
    static std::map<std::string, TaskTimeline> GroupAndOrder(std::vector<LoggedEvent> events,
                                                            std::vector<domain::Diagnostic>& diagnostics);

    /** @brief Full replay of a snapshot. */
    ReplayResult replay(const domain::LogSnapshot& snapshot) const;

    /** @brief Fold of already grouped timelines; orphans go to diagnostics. */
    static std::map<std::string, domain::Task> Fold(const std::map<std::string, TaskTimeline>& timelines,
                                                    std::vector<domain::Diagnostic>& diagnostics);

    /** @brief Listing index derived from a replay, with the files each task spans. */
    static domain::TaskIndex BuildIndex(const ReplayResult& result);
};

} // namespace spool::application
