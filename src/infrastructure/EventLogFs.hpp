/**
 * @file EventLogFs.hpp
 * @brief File-system based event log: date-partitioned active files plus monthly archives.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "domain/repositories/IEventLog.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace spool::infrastructure {

using namespace spool::domain;

class EventLogFs : public IEventLog {
public:
    EventLogFs(std::filesystem::path root, std::shared_ptr<PersistenceService> persistence);

    void append(const Event& event) override;
    LogSnapshot read(LogScope scope) const override;
    void rewrite(const LogRewrite& changes, const LogExpectation& expected) override;

    const std::filesystem::path& root() const { return m_root; }

    // Structure: <root>/events/<YYYY-MM-DD>.jsonl, <root>/archive/<YYYY-MM>.jsonl
    static std::string ActiveFileFor(const Event& event);
    static std::string ArchiveFileFor(const std::string& month);

private:
    std::filesystem::path m_root;
    std::shared_ptr<PersistenceService> m_persistence;

    std::vector<std::string> listFiles(const std::string& subdir) const;
    LogFile readFile(const std::string& relativePath, bool archived) const;
    void checkUnchanged(const LogExpectation& expected) const;
};

} // namespace spool::infrastructure
