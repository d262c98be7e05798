/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#if !defined(_WIN32)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace spool::infrastructure {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void ThrowIo(const std::string& what, const fs::path& path) {
    throw std::runtime_error("[PersistenceService] " + what + " " + path.string() + ": " + std::strerror(errno));
}

#if !defined(_WIN32)
void WriteAll(int fd, const std::string& data, const fs::path& path) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            errno = saved;
            ThrowIo("Write failed for", path);
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
}

void SyncAndClose(int fd, const fs::path& path) {
    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        errno = saved;
        ThrowIo("fsync failed for", path);
    }
    if (::close(fd) != 0) {
        ThrowIo("Close failed for", path);
    }
}
#endif

} // namespace

fs::path PersistenceService::TempPathFor(const fs::path& filename) {
    static unsigned long counter = 0;
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = filename;
    tempPath += "." + std::to_string(timestamp) + "-" + std::to_string(++counter) + ".tmp";
    return tempPath;
}

void PersistenceService::ensureParentDirectory(const fs::path& filename) const {
    if (filename.has_parent_path() && !fs::exists(filename.parent_path())) {
        fs::create_directories(filename.parent_path());
    }
}

void PersistenceService::saveTextAtomic(const fs::path& filename, const std::string& content) const {
    ensureParentDirectory(filename);
    const fs::path tempPath = TempPathFor(filename);

    // 1. Write to temp
#if !defined(_WIN32)
    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) ThrowIo("Failed to open temp file", tempPath);
    try {
        WriteAll(fd, content, tempPath);
        SyncAndClose(fd, tempPath);
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw;
    }
#else
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) ThrowIo("Failed to open temp file", tempPath);
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::error_code ec;
            fs::remove(tempPath, ec);
            ThrowIo("Write failed during output", tempPath);
        }
    }
#endif

    // 2. Atomic rename
    try {
        fs::rename(tempPath, filename);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[PersistenceService] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw;
    }
}

void PersistenceService::appendLineDurable(const fs::path& filename, const std::string& line) const {
    ensureParentDirectory(filename);
    std::string payload = line + "\n";

#if !defined(_WIN32)
    int fd = ::open(filename.c_str(), O_RDWR | O_APPEND | O_CREAT, 0644);
    if (fd < 0) ThrowIo("Failed to open log file", filename);

    struct stat st {};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        char last = '\n';
        if (::pread(fd, &last, 1, st.st_size - 1) == 1 && last != '\n') {
            std::cerr << "[PersistenceService] Truncated trailing line in " << filename.string()
                      << ", starting a new line" << std::endl;
            payload.insert(payload.begin(), '\n');
        }
    }

    // One write call per record keeps concurrent appenders line-atomic.
    WriteAll(fd, payload, filename);
    SyncAndClose(fd, filename);
#else
    {
        std::ifstream in(filename, std::ios::binary | std::ios::ate);
        if (in && in.tellg() > 0) {
            in.seekg(-1, std::ios::end);
            char last = '\n';
            in.get(last);
            if (last != '\n') payload.insert(payload.begin(), '\n');
        }
    }
    std::ofstream ofs(filename, std::ios::binary | std::ios::app);
    if (!ofs.is_open()) ThrowIo("Failed to open log file", filename);
    ofs << payload;
    ofs.flush();
    if (ofs.fail()) ThrowIo("Append failed for", filename);
#endif
}

std::string PersistenceService::loadText(const fs::path& filename) const {
    std::ifstream inFile(filename, std::ios::binary);
    if (!inFile) ThrowIo("Failed to open", filename);
    std::stringstream buffer;
    buffer << inFile.rdbuf();
    if (inFile.bad()) ThrowIo("Read failed for", filename);
    return buffer.str();
}

} // namespace spool::infrastructure
