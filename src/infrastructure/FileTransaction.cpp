/**
 * @file FileTransaction.cpp
 * @brief Implementation of FileTransaction.
 */

#include "infrastructure/FileTransaction.hpp"

#include <iostream>
#include <stdexcept>

namespace spool::infrastructure {

namespace fs = std::filesystem;

FileTransaction::FileTransaction(std::shared_ptr<PersistenceService> persistence)
    : m_persistence(std::move(persistence)) {}

FileTransaction::~FileTransaction() {
    if (!m_committed) {
        discardStaged();
    }
}

void FileTransaction::stageWrite(const fs::path& target, const std::string& content) {
    fs::path staged = PersistenceService::TempPathFor(target);
    // Entry goes in first so the destructor cleans up even if the write throws.
    m_entries.push_back(Entry{target, staged, std::nullopt, false});
    m_persistence->saveTextAtomic(staged, content);
}

void FileTransaction::stageRemoval(const fs::path& target) {
    m_entries.push_back(Entry{target, std::nullopt, std::nullopt, false});
}

void FileTransaction::commit() {
    if (m_committed) {
        throw std::logic_error("FileTransaction already committed");
    }

    try {
        for (auto& entry : m_entries) {
            if (fs::exists(entry.target)) {
                entry.backup = makeBackup(entry.target);
            }
            if (entry.staged) {
                fs::rename(*entry.staged, entry.target);
            } else if (entry.backup) {
                fs::remove(entry.target);
            }
            entry.applied = true;
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[FileTransaction] Commit failed, rolling back: " << e.what() << std::endl;
        rollback();
        discardStaged();
        throw std::runtime_error(std::string("[FileTransaction] Commit failed: ") + e.what());
    }

    m_committed = true;
    for (const auto& entry : m_entries) {
        if (entry.backup) {
            std::error_code ec;
            fs::remove(*entry.backup, ec);
            if (ec) {
                std::cerr << "[FileTransaction] Could not remove backup " << entry.backup->string()
                          << ": " << ec.message() << std::endl;
            }
        }
    }
}

fs::path FileTransaction::makeBackup(const fs::path& target) {
    fs::path backup = target;
    backup += ".bak";
    // Left over from an interrupted commit; target still holds valid content.
    fs::remove(backup);

    std::error_code ec;
    fs::create_hard_link(target, backup, ec);
    if (ec) {
        fs::copy_file(target, backup);
    }
    return backup;
}

void FileTransaction::rollback() {
    for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
        std::error_code ec;
        if (it->backup) {
            if (it->applied) {
                fs::rename(*it->backup, it->target, ec);
            } else {
                // Target was never touched.
                fs::remove(*it->backup, ec);
            }
            if (ec) {
                std::cerr << "[FileTransaction] Restore failed for " << it->target.string()
                          << ", original kept at " << it->backup->string() << std::endl;
            }
        } else if (it->applied && it->staged) {
            fs::remove(it->target, ec);
        }
        it->applied = false;
        it->backup.reset();
    }
}

void FileTransaction::discardStaged() {
    for (const auto& entry : m_entries) {
        if (entry.staged) {
            std::error_code ec;
            fs::remove(*entry.staged, ec);
        }
    }
}

} // namespace spool::infrastructure
