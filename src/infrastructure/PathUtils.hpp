// PathUtils Header
#pragma once
#include <filesystem>
#include <optional>

namespace spool::infrastructure {

class PathUtils {
public:
    static constexpr const char* kSpoolDir = ".spool";

    /** @brief Nearest <dir>/.spool walking up from start, nullopt if none. */
    static std::optional<std::filesystem::path> FindSpoolRoot(const std::filesystem::path& start);

    /**
     * @brief Creates <dir>/.spool with events/, archive/ and its .gitignore.
     * @throws std::runtime_error if <dir>/.spool already exists.
     */
    static std::filesystem::path InitSpoolRoot(const std::filesystem::path& dir);
};

} // namespace spool::infrastructure
