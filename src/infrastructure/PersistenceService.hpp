/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic and durable file I/O.
 */

#pragma once

#include <filesystem>
#include <string>

namespace spool::infrastructure {

/**
 * @class PersistenceService
 * @brief Every write the tracker makes goes through here.
 *
 * Two primitives cover the log and the caches: a whole-file replace
 * (temp file, then rename) so readers never see a half-written file, and a
 * single-line append that is flushed to disk before returning.
 * All failures throw std::runtime_error; nothing is retried.
 */
class PersistenceService {
public:
    /**
     * @brief Replaces the file content atomically (temp -> rename).
     * @param filename Target path; parent directories are created.
     * @param content The full new content.
     */
    void saveTextAtomic(const std::filesystem::path& filename, const std::string& content) const;

    /**
     * @brief Appends one line (newline added) and syncs it to disk.
     *
     * If the file ends in a truncated line from an earlier crash, a newline is
     * written first so the new record never fuses with the broken one.
     */
    void appendLineDurable(const std::filesystem::path& filename, const std::string& line) const;

    /** @brief Reads the whole file. Throws if it cannot be opened. */
    std::string loadText(const std::filesystem::path& filename) const;

    /** @brief Unique sibling path used for staging: filename.<stamp>.tmp */
    static std::filesystem::path TempPathFor(const std::filesystem::path& filename);

private:
    void ensureParentDirectory(const std::filesystem::path& filename) const;
};

} // namespace spool::infrastructure
