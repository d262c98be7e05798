/**
 * @file LogValidator.hpp
 * @brief Integrity audit of the raw task log.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "application/ReplayEngine.hpp"
#include "domain/Diagnostic.hpp"
#include "domain/repositories/IEventLog.hpp"

namespace spool::application {

/**
 * @struct ValidationReport
 * @brief Every finding with its file/line, plus counts per severity.
 */
struct ValidationReport {
    std::vector<domain::Diagnostic> diagnostics;
    std::size_t errorCount = 0;
    std::size_t warningCount = 0;
    std::size_t conflictCount = 0;

    /** @brief Errors always fail, warnings only when strict, conflicts never. */
    bool passed(bool strict = false) const {
        return errorCount == 0 && (!strict || warningCount == 0);
    }
};

/**
 * @class LogValidator
 * @brief Reads active and archived files directly; the caches are never consulted.
 */
class LogValidator {
public:
    explicit LogValidator(std::shared_ptr<domain::IEventLog> log);

    /** @brief Validates everything the log currently holds. Throws on I/O failure. */
    ValidationReport Validate() const;

    ValidationReport Validate(const domain::LogSnapshot& snapshot) const;

private:
    std::shared_ptr<domain::IEventLog> m_log;

    void AddDiagnostic(ValidationReport& report, domain::DiagnosticCategory category,
                       const domain::LogPosition& position, const std::string& taskId,
                       const std::string& message) const;

    void CheckPhysicalSeqOrder(ValidationReport& report, const std::vector<LoggedEvent>& events) const;
    void CheckLinks(ValidationReport& report, const std::map<std::string, domain::Task>& tasks,
                    const std::map<std::string, TaskTimeline>& timelines) const;
    void CheckConflicts(ValidationReport& report,
                        const std::map<std::string, TaskTimeline>& timelines) const;
};

} // namespace spool::application
