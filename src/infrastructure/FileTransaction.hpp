/**
 * @file FileTransaction.hpp
 * @brief All-or-nothing replacement of a group of files.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/PersistenceService.hpp"

namespace spool::infrastructure {

/**
 * @class FileTransaction
 * @brief Stages new contents as temp files, then swaps them in together.
 *
 * commit() links every original to a .bak sibling, then renames the staged
 * file over it, so each target path exists at every instant of the commit.
 * Entries are applied in staging order. Any failure restores the .bak files
 * and removes whatever was already swapped in, so the directory ends up
 * exactly as it was. Backups are deleted only once every file is in place.
 */
class FileTransaction {
public:
    explicit FileTransaction(std::shared_ptr<PersistenceService> persistence);
    ~FileTransaction();

    FileTransaction(const FileTransaction&) = delete;
    FileTransaction& operator=(const FileTransaction&) = delete;

    /** @brief Writes content to a temp file now; the target changes on commit. */
    void stageWrite(const std::filesystem::path& target, const std::string& content);

    /** @brief Marks target for removal on commit. */
    void stageRemoval(const std::filesystem::path& target);

    /** @throws std::runtime_error after rolling back. */
    void commit();

    size_t size() const { return m_entries.size(); }

private:
    struct Entry {
        std::filesystem::path target;
        std::optional<std::filesystem::path> staged; // nullopt: removal
        std::optional<std::filesystem::path> backup;
        bool applied = false;
    };

    static std::filesystem::path makeBackup(const std::filesystem::path& target);
    void rollback();
    void discardStaged();

    std::shared_ptr<PersistenceService> m_persistence;
    std::vector<Entry> m_entries;
    bool m_committed = false;
};

} // namespace spool::infrastructure
