/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace spool::infrastructure {

namespace {

std::optional<std::string> EnvValue(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return std::string(value);
    return std::nullopt;
}

} // namespace

SpoolSettings ConfigLoader::Load(const std::filesystem::path& spoolRoot) {
    SpoolSettings settings;
    const std::filesystem::path configPath = spoolRoot / kSettingsFile;

    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;

            if (j.contains("author") && j["author"].is_string()) {
                settings.author = j["author"].get<std::string>();
            }
            if (j.contains("branch") && j["branch"].is_string()) {
                settings.branch = j["branch"].get<std::string>();
            }
            if (j.contains("archive_after_days")) {
                if (j["archive_after_days"].is_number_integer() && j["archive_after_days"].get<int>() >= 0) {
                    settings.archiveAfterDays = j["archive_after_days"].get<int>();
                } else {
                    std::cerr << "[ConfigLoader] archive_after_days must be a non-negative integer, ignored" << std::endl;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        }
    }

    if (auto author = EnvValue("SPOOL_AUTHOR")) settings.author = *author;
    if (auto branch = EnvValue("SPOOL_BRANCH")) settings.branch = *branch;
    return settings;
}

} // namespace spool::infrastructure
