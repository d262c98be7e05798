/**
 * @file IEventLog.hpp
 * @brief Interface over the append-only task log.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../events/TaskEvents.hpp"

namespace spool::domain {

/**
 * @enum LogScope
 * @brief Which partitions of the log a read covers.
 */
enum class LogScope {
    Active,  ///< events/<YYYY-MM-DD>.jsonl
    Archive, ///< archive/<YYYY-MM>.jsonl
    All
};

struct LogPosition {
    std::string file;     ///< Relative to the log root, e.g. "events/2026-01-02.jsonl".
    std::size_t line = 0; ///< 1-based physical line number.
};

struct RawLogLine {
    LogPosition position;
    std::string text;
};

/**
 * @struct LogFile
 * @brief One log file as read, with the signature the cache fingerprints.
 */
struct LogFile {
    std::string path;            ///< Relative to the log root.
    bool archived = false;
    std::uintmax_t size = 0;
    std::string contentHash;
    std::vector<RawLogLine> lines; ///< Every physical line, blank ones included.
};

/**
 * @struct LogSnapshot
 * @brief All files in scope, sorted by relative path. Line order inside the
 * snapshot carries no meaning for replay.
 */
struct LogSnapshot {
    std::vector<LogFile> files;
};

/**
 * @brief Replacement content per file for a multi-file rewrite.
 * nullopt removes the file.
 */
using LogRewrite = std::map<std::string, std::optional<std::string>>;

/**
 * @brief Content hash (LogFile::contentHash) each file must still have when a
 * rewrite commits. An empty hash means the file must not exist.
 */
using LogExpectation = std::map<std::string, std::string>;

class IEventLog {
public:
    virtual ~IEventLog() = default;

    /**
     * @brief Appends one event as a single line to the active file of its date.
     * @throws std::runtime_error on I/O failure.
     */
    virtual void append(const Event& event) = 0;

    /** @brief Reads every log file in scope. Throws on I/O failure. */
    virtual LogSnapshot read(LogScope scope) const = 0;

    /**
     * @brief Replaces several files at once. Either every file is replaced or
     * none is; on failure the originals are restored and the error rethrown.
     * @throws std::runtime_error before writing anything if a file in
     * `expected` no longer matches its hash.
     */
    virtual void rewrite(const LogRewrite& changes, const LogExpectation& expected) = 0;
};

} // namespace spool::domain
