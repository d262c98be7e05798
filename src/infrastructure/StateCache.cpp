/**
 * @file StateCache.cpp
 * @brief Implementation of StateCache.
 */

#include "infrastructure/StateCache.hpp"

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "infrastructure/StateJson.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace spool::infrastructure {

using namespace spool::domain;

StateCache::StateCache(fs::path root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {}

std::string StateCache::Fingerprint(const LogSnapshot& snapshot) {
    std::ostringstream signature;
    for (const auto& file : snapshot.files) {
        signature << file.path << '\t' << file.size << '\t' << file.contentHash << '\n';
    }
    std::ostringstream out;
    out << snapshot.files.size() << "-" << std::hash<std::string>{}(signature.str());
    return out.str();
}

std::optional<json> StateCache::loadDocument(const char* name, const std::string& fingerprint) const {
    const fs::path path = m_root / name;
    if (!fs::exists(path)) return std::nullopt;

    try {
        json j = json::parse(m_persistence->loadText(path));
        if (j.value("version", 0) != kCacheVersion) {
            std::cerr << "[StateCache] " << name << " has an unsupported version, rebuilding" << std::endl;
            return std::nullopt;
        }
        if (j.value("fingerprint", "") != fingerprint) {
            return std::nullopt;
        }
        return j;
    } catch (const std::exception& e) {
        std::cerr << "[StateCache] Ignoring unreadable " << name << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<TaskState> StateCache::loadState(const std::string& fingerprint) const {
    auto doc = loadDocument(kStateFile, fingerprint);
    if (!doc) return std::nullopt;

    try {
        TaskState state;
        for (const auto& tj : doc->at("tasks")) {
            Task task = StateJson::TaskFromJson(tj);
            state.tasks.emplace(task.id, std::move(task));
        }
        for (const auto& dj : doc->at("diagnostics")) {
            state.diagnostics.push_back(StateJson::DiagnosticFromJson(dj));
        }
        return state;
    } catch (const std::exception& e) {
        std::cerr << "[StateCache] Ignoring malformed " << kStateFile << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<TaskIndex> StateCache::loadIndex(const std::string& fingerprint) const {
    auto doc = loadDocument(kIndexFile, fingerprint);
    if (!doc) return std::nullopt;

    try {
        TaskIndex index;
        const json& tasks = doc->at("tasks");
        for (auto it = tasks.begin(); it != tasks.end(); ++it) {
            index.emplace(it.key(), StateJson::SummaryFromJson(it.key(), it.value()));
        }
        return index;
    } catch (const std::exception& e) {
        std::cerr << "[StateCache] Ignoring malformed " << kIndexFile << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

void StateCache::store(const std::string& fingerprint, const TaskState& state, const TaskIndex& index) {
    json tasks = json::array();
    for (const auto& [id, task] : state.tasks) {
        tasks.push_back(StateJson::ToJson(task));
    }
    json diagnostics = json::array();
    for (const auto& d : state.diagnostics) {
        diagnostics.push_back(StateJson::ToJson(d));
    }
    json stateDoc = {
        {"version", kCacheVersion},
        {"fingerprint", fingerprint},
        {"tasks", std::move(tasks)},
        {"diagnostics", std::move(diagnostics)}
    };

    json rows = json::object();
    for (const auto& [id, summary] : index) {
        rows[id] = StateJson::ToJson(summary);
    }
    json indexDoc = {
        {"version", kCacheVersion},
        {"fingerprint", fingerprint},
        {"tasks", std::move(rows)}
    };

    const auto replace = json::error_handler_t::replace;
    m_persistence->saveTextAtomic(m_root / kStateFile, stateDoc.dump(2, ' ', false, replace) + "\n");
    m_persistence->saveTextAtomic(m_root / kIndexFile, indexDoc.dump(2, ' ', false, replace) + "\n");
}

void StateCache::invalidate() {
    for (const char* name : {kStateFile, kIndexFile}) {
        std::error_code ec;
        fs::remove(m_root / name, ec);
        if (ec) {
            throw std::runtime_error(std::string("[StateCache] Cannot remove ") + name + ": " + ec.message());
        }
    }
}

} // namespace spool::infrastructure
