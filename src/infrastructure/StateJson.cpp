/**
 * @file StateJson.cpp
 * @brief Implementation of StateJson.
 */

#include "infrastructure/StateJson.hpp"

#include <stdexcept>

#include "infrastructure/TimeUtils.hpp"

namespace spool::infrastructure {

using json = nlohmann::json;
using namespace spool::domain;

namespace {

std::chrono::system_clock::time_point TimeFrom(const json& j, const char* key) {
    const std::string text = j.at(key).get<std::string>();
    auto tp = TimeUtils::ParseIso8601(text);
    if (!tp) throw std::runtime_error(std::string("bad timestamp in cache field '") + key + "'");
    return *tp;
}

std::optional<std::string> OptionalFrom(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

std::set<std::string> SetFrom(const json& j, const char* key) {
    std::set<std::string> out;
    if (j.contains(key)) {
        for (const auto& item : j[key]) out.insert(item.get<std::string>());
    }
    return out;
}

template <typename Enum, typename Parser>
Enum EnumFrom(const json& j, const char* key, Parser parse) {
    const std::string text = j.at(key).get<std::string>();
    auto value = parse(text);
    if (!value) throw std::runtime_error(std::string("bad value in cache field '") + key + "': " + text);
    return *value;
}

} // namespace

json StateJson::ToJson(const Task& task) {
    json j = {
        {"id", task.id},
        {"title", task.title},
        {"description", task.description},
        {"priority", PriorityToString(task.priority)},
        {"status", StatusToString(task.status)},
        {"tags", task.tags},
        {"blocks", task.blocks},
        {"blocked_by", task.blockedBy},
        {"created_at", TimeUtils::FormatIso8601(task.createdAt)},
        {"created_by", task.createdBy},
        {"created_branch", task.createdBranch},
        {"updated_at", TimeUtils::FormatIso8601(task.updatedAt)},
        {"last_seq", task.lastSeq}
    };
    if (task.resolution) j["resolution"] = ResolutionToString(*task.resolution);
    if (task.assignee) j["assignee"] = *task.assignee;
    if (task.stream) j["stream"] = *task.stream;
    if (task.parent) j["parent"] = *task.parent;
    if (task.completedAt) j["completed_at"] = TimeUtils::FormatIso8601(*task.completedAt);

    json comments = json::array();
    for (const auto& c : task.comments) {
        json cj = {
            {"timestamp", TimeUtils::FormatIso8601(c.timestamp)},
            {"author", c.author},
            {"body", c.body}
        };
        if (c.ref) cj["ref"] = *c.ref;
        comments.push_back(std::move(cj));
    }
    j["comments"] = std::move(comments);
    return j;
}

Task StateJson::TaskFromJson(const json& j) {
    Task task;
    task.id = j.at("id").get<std::string>();
    task.title = j.at("title").get<std::string>();
    task.description = j.value("description", "");
    task.priority = EnumFrom<Priority>(j, "priority", PriorityFromString);
    task.status = EnumFrom<TaskStatus>(j, "status", StatusFromString);
    if (j.contains("resolution")) {
        task.resolution = EnumFrom<Resolution>(j, "resolution", ResolutionFromString);
    }
    task.assignee = OptionalFrom(j, "assignee");
    task.stream = OptionalFrom(j, "stream");
    task.parent = OptionalFrom(j, "parent");
    task.tags = SetFrom(j, "tags");
    task.blocks = SetFrom(j, "blocks");
    task.blockedBy = SetFrom(j, "blocked_by");
    task.createdAt = TimeFrom(j, "created_at");
    task.createdBy = j.value("created_by", "");
    task.createdBranch = j.value("created_branch", "");
    task.updatedAt = TimeFrom(j, "updated_at");
    if (j.contains("completed_at")) task.completedAt = TimeFrom(j, "completed_at");
    task.lastSeq = j.at("last_seq").get<std::uint64_t>();

    if (j.contains("comments")) {
        for (const auto& cj : j["comments"]) {
            Comment c;
            c.timestamp = TimeFrom(cj, "timestamp");
            c.author = cj.value("author", "");
            c.body = cj.value("body", "");
            c.ref = OptionalFrom(cj, "ref");
            task.comments.push_back(std::move(c));
        }
    }
    return task;
}

json StateJson::ToJson(const TaskSummary& s) {
    json j = {
        {"title", s.title},
        {"status", StatusToString(s.status)},
        {"priority", PriorityToString(s.priority)},
        {"tags", s.tags},
        {"created_at", TimeUtils::FormatIso8601(s.createdAt)},
        {"updated_at", TimeUtils::FormatIso8601(s.updatedAt)},
        {"files", s.files}
    };
    if (s.assignee) j["assignee"] = *s.assignee;
    if (s.stream) j["stream"] = *s.stream;
    if (s.completedAt) j["completed_at"] = TimeUtils::FormatIso8601(*s.completedAt);
    return j;
}

TaskSummary StateJson::SummaryFromJson(const std::string& id, const json& j) {
    TaskSummary s;
    s.id = id;
    s.title = j.at("title").get<std::string>();
    s.status = EnumFrom<TaskStatus>(j, "status", StatusFromString);
    s.priority = EnumFrom<Priority>(j, "priority", PriorityFromString);
    s.assignee = OptionalFrom(j, "assignee");
    s.stream = OptionalFrom(j, "stream");
    s.tags = SetFrom(j, "tags");
    s.createdAt = TimeFrom(j, "created_at");
    s.updatedAt = TimeFrom(j, "updated_at");
    if (j.contains("completed_at")) s.completedAt = TimeFrom(j, "completed_at");
    s.files = SetFrom(j, "files");
    return s;
}

json StateJson::ToJson(const Diagnostic& d) {
    json j = {
        {"category", CategoryToString(d.category)},
        {"message", d.message}
    };
    if (!d.file.empty()) j["file"] = d.file;
    if (d.line > 0) j["line"] = d.line;
    if (!d.taskId.empty()) j["task_id"] = d.taskId;
    return j;
}

Diagnostic StateJson::DiagnosticFromJson(const json& j) {
    Diagnostic d;
    d.category = CategoryFromString(j.at("category").get<std::string>());
    d.message = j.value("message", "");
    d.file = j.value("file", "");
    d.line = j.value("line", static_cast<std::size_t>(0));
    d.taskId = j.value("task_id", "");
    return d;
}

} // namespace spool::infrastructure
