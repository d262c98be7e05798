/**
 * @file StateCache.hpp
 * @brief Disposable on-disk caches of replay output, keyed by a log fingerprint.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/TaskState.hpp"
#include "domain/repositories/IEventLog.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace spool::infrastructure {

/**
 * @class StateCache
 * @brief Owns <root>/.state.json and <root>/.index.json.
 *
 * Each file records the fingerprint of the log it was built from. A load
 * whose fingerprint differs, or whose file is missing or unreadable, returns
 * nullopt and the caller replays. Deleting either file loses nothing.
 */
class StateCache {
public:
    static constexpr int kCacheVersion = 1;
    static constexpr const char* kStateFile = ".state.json";
    static constexpr const char* kIndexFile = ".index.json";

    StateCache(std::filesystem::path root, std::shared_ptr<PersistenceService> persistence);

    /** @brief Hash over relative path, size and content hash of every file. */
    static std::string Fingerprint(const domain::LogSnapshot& snapshot);

    std::optional<domain::TaskState> loadState(const std::string& fingerprint) const;
    std::optional<domain::TaskIndex> loadIndex(const std::string& fingerprint) const;

    /** @brief Writes both caches via temp file and rename. Throws on I/O failure. */
    void store(const std::string& fingerprint, const domain::TaskState& state, const domain::TaskIndex& index);

    /** @brief Removes both cache files if present. */
    void invalidate();

private:
    std::filesystem::path m_root;
    std::shared_ptr<PersistenceService> m_persistence;

    std::optional<nlohmann::json> loadDocument(const char* name, const std::string& fingerprint) const;
};

} // namespace spool::infrastructure
