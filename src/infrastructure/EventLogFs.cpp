/**
 * @file EventLogFs.cpp
 * @brief Implementation of EventLogFs.
 */

#include "infrastructure/EventLogFs.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <stdexcept>

#include "infrastructure/EventCodec.hpp"
#include "infrastructure/FileTransaction.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace spool::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* kEventsDir = "events";
const char* kArchiveDir = "archive";

std::string ContentHash(const std::string& content) {
    return std::to_string(std::hash<std::string>{}(content));
}

} // namespace

EventLogFs::EventLogFs(fs::path root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {}

std::string EventLogFs::ActiveFileFor(const Event& event) {
    return std::string(kEventsDir) + "/" + TimeUtils::FormatDate(event.timestamp) + ".jsonl";
}

std::string EventLogFs::ArchiveFileFor(const std::string& month) {
    return std::string(kArchiveDir) + "/" + month + ".jsonl";
}

void EventLogFs::append(const Event& event) {
    const fs::path path = m_root / ActiveFileFor(event);
    m_persistence->appendLineDurable(path, EventCodec::Encode(event));
}

std::vector<std::string> EventLogFs::listFiles(const std::string& subdir) const {
    std::vector<std::string> files;
    const fs::path dir = m_root / subdir;
    if (!fs::is_directory(dir)) return files;

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".jsonl") {
            files.push_back(subdir + "/" + entry.path().filename().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

LogFile EventLogFs::readFile(const std::string& relativePath, bool archived) const {
    const std::string content = m_persistence->loadText(m_root / relativePath);

    LogFile file;
    file.path = relativePath;
    file.archived = archived;
    file.size = content.size();
    file.contentHash = ContentHash(content);

    size_t start = 0;
    size_t lineNo = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) end = content.size();
        std::string text = content.substr(start, end - start);
        if (!text.empty() && text.back() == '\r') text.pop_back();
        file.lines.push_back(RawLogLine{LogPosition{relativePath, ++lineNo}, std::move(text)});
        start = end + 1;
    }
    return file;
}

LogSnapshot EventLogFs::read(LogScope scope) const {
    LogSnapshot snapshot;
    if (scope == LogScope::Archive || scope == LogScope::All) {
        for (const auto& path : listFiles(kArchiveDir)) {
            snapshot.files.push_back(readFile(path, true));
        }
    }
    if (scope == LogScope::Active || scope == LogScope::All) {
        for (const auto& path : listFiles(kEventsDir)) {
            snapshot.files.push_back(readFile(path, false));
        }
    }
    return snapshot;
}

void EventLogFs::checkUnchanged(const LogExpectation& expected) const {
    for (const auto& [relativePath, hash] : expected) {
        const fs::path path = m_root / relativePath;
        const bool exists = fs::exists(path);
        if (hash.empty() ? !exists : (exists && ContentHash(m_persistence->loadText(path)) == hash)) {
            continue;
        }
        throw std::runtime_error("[EventLog] " + relativePath + " changed since it was read; nothing rewritten");
    }
}

void EventLogFs::rewrite(const LogRewrite& changes, const LogExpectation& expected) {
    if (changes.empty()) return;

    checkUnchanged(expected);
    FileTransaction tx(m_persistence);
    for (const auto& [relativePath, content] : changes) {
        const fs::path target = m_root / relativePath;
        if (content) {
            tx.stageWrite(target, *content);
        } else {
            tx.stageRemoval(target);
        }
    }
    tx.commit();
    std::cerr << "[EventLog] Rewrote " << changes.size() << " log file(s)" << std::endl;
}

} // namespace spool::infrastructure
