/**
 * @file StateJson.hpp
 * @brief JSON mapping of derived state: tasks, index rows and diagnostics.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/Diagnostic.hpp"
#include "domain/Task.hpp"
#include "domain/TaskState.hpp"

namespace spool::infrastructure {

/**
 * @class StateJson
 * @brief Deterministic mapping: sets become sorted arrays, absent optionals
 * are omitted, and no wall-clock stamp is added, so equal state always dumps
 * to equal bytes.
 *
 * The from-JSON side throws nlohmann::json exceptions on shape mismatches and
 * std::runtime_error on bad enum or timestamp values; callers treat either as
 * an unusable cache.
 */
class StateJson {
public:
    static nlohmann::json ToJson(const domain::Task& task);
    static domain::Task TaskFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::TaskSummary& summary);
    static domain::TaskSummary SummaryFromJson(const std::string& id, const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::Diagnostic& diagnostic);
    static domain::Diagnostic DiagnosticFromJson(const nlohmann::json& j);
};

} // namespace spool::infrastructure
