/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the spool configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; the rest of the code only
 * sees the resolved SpoolSettings.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace spool::infrastructure {

struct SpoolSettings {
    std::string author = "unknown";
    std::string branch = "main";
    std::optional<int> archiveAfterDays; ///< nullopt: archive before the current month.
};

class ConfigLoader {
public:
    static constexpr const char* kSettingsFile = "settings.json";

    /**
     * @brief Reads <spoolRoot>/settings.json, then applies SPOOL_AUTHOR and
     * SPOOL_BRANCH from the environment.
     *
     * A missing file yields defaults. An unreadable file or a key of the wrong
     * type is logged and the default kept for that key.
     */
    static SpoolSettings Load(const std::filesystem::path& spoolRoot);
};

} // namespace spool::infrastructure
