/**
 * @file TestSupport.hpp
 * @brief Shared helpers for the test executables: scratch directories and event builders.
 */

#pragma once

// Checks must run in every build type.
#undef NDEBUG
#include <cassert>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "domain/events/TaskEvents.hpp"
#include "domain/repositories/IEventLog.hpp"
#include "infrastructure/EventCodec.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace spool::test {

namespace fs = std::filesystem;
using TimePoint = std::chrono::system_clock::time_point;

/**
 * @class ScratchDir
 * @brief Fresh directory under the system temp dir, removed on destruction.
 */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() /
                 ("spool_" + name + "_" + std::to_string(stamp) + "_" + std::to_string(++counter));
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

inline TimePoint At(const std::string& iso) {
    auto tp = infrastructure::TimeUtils::ParseIso8601(iso);
    assert(tp && "test timestamp must parse");
    return *tp;
}

inline domain::Event MakeEvent(const std::string& eventId, const std::string& taskId, std::uint64_t seq,
                               const std::string& timestamp, domain::TaskOperation op,
                               const std::string& branch = "main", const std::string& author = "alice") {
    domain::Event e;
    e.eventId = eventId;
    e.taskId = taskId;
    e.seq = seq;
    e.timestamp = At(timestamp);
    e.author = author;
    e.branch = branch;
    e.operation = std::move(op);
    return e;
}

inline domain::Event MakeCreate(const std::string& taskId, const std::string& title,
                                const std::string& timestamp = "2026-01-05T10:00:00.000Z",
                                const std::string& branch = "main") {
    domain::TaskCreated created;
    created.title = title;
    return MakeEvent(taskId, taskId, 1, timestamp, created, branch);
}

inline std::string Line(const domain::Event& event) {
    return infrastructure::EventCodec::Encode(event);
}

/** @brief In-memory snapshot; each entry is a file path and its physical lines. */
inline domain::LogSnapshot SnapshotOf(const std::vector<std::pair<std::string, std::vector<std::string>>>& files) {
    domain::LogSnapshot snapshot;
    for (const auto& [path, lines] : files) {
        domain::LogFile file;
        file.path = path;
        file.archived = path.rfind("archive/", 0) == 0;
        std::size_t lineNo = 0;
        for (const auto& text : lines) {
            file.lines.push_back(domain::RawLogLine{domain::LogPosition{path, ++lineNo}, text});
            file.size += text.size() + 1;
        }
        snapshot.files.push_back(std::move(file));
    }
    return snapshot;
}

inline std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::size_t CountLines(const std::string& content) {
    std::size_t n = 0;
    for (char c : content) {
        if (c == '\n') ++n;
    }
    return n;
}

} // namespace spool::test
