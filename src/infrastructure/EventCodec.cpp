/**
 * @file EventCodec.cpp
 * @brief Implementation of EventCodec.
 */

#include "infrastructure/EventCodec.hpp"

#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

#include "infrastructure/TimeUtils.hpp"

namespace spool::infrastructure {

using json = nlohmann::json;
using namespace spool::domain;

const char* const EventCodec::kRequiredFields[6] = {
    "event_id", "task_id", "seq", "timestamp", "author", "operation"
};

namespace {

[[noreturn]] void Fail(DiagnosticCategory category, const std::string& message) {
    throw EventDecodeError(category, message);
}

// Parser messages quote the raw bytes last read, which may be half of a
// multi-byte character on a torn line.
std::string Printable(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        if (static_cast<unsigned char>(c) >= 0x80) c = '?';
    }
    return out;
}

std::string RequireString(const json& j, const char* key, const std::string& context) {
    if (!j.contains(key) || j[key].is_null()) {
        Fail(DiagnosticCategory::MissingField, context + ": missing '" + key + "'");
    }
    if (!j[key].is_string()) {
        Fail(DiagnosticCategory::InvalidField, context + ": '" + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

std::string RequireNonEmpty(const json& j, const char* key, const std::string& context) {
    std::string value = RequireString(j, key, context);
    if (value.empty()) {
        Fail(DiagnosticCategory::InvalidField, context + ": '" + key + "' must not be empty");
    }
    return value;
}

std::optional<std::string> OptionalString(const json& j, const char* key, const std::string& context) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) {
        Fail(DiagnosticCategory::InvalidField, context + ": '" + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

std::vector<std::string> StringArray(const json& value, const std::string& context) {
    if (!value.is_array()) {
        Fail(DiagnosticCategory::InvalidField, context + " must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) {
            Fail(DiagnosticCategory::InvalidField, context + " must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

Priority ParsePriority(const std::string& value, const std::string& context) {
    auto p = PriorityFromString(value);
    if (!p) Fail(DiagnosticCategory::InvalidField, context + ": unknown priority '" + value + "'");
    return *p;
}

LinkRelation ParseRelation(const json& op) {
    const std::string rel = RequireString(op, "rel", "link");
    auto parsed = RelationFromString(rel);
    if (!parsed) Fail(DiagnosticCategory::InvalidField, "link: unknown relation '" + rel + "'");
    return *parsed;
}

TaskOperation DecodeOperation(const json& op) {
    if (!op.is_object()) {
        Fail(DiagnosticCategory::InvalidField, "'operation' must be an object");
    }
    const std::string type = RequireNonEmpty(op, "type", "operation");

    if (type == TaskCreated::Type) {
        TaskCreated e;
        e.title = RequireString(op, "title", type);
        e.description = OptionalString(op, "description", type).value_or("");
        if (auto p = OptionalString(op, "priority", type)) e.priority = ParsePriority(*p, type);
        if (op.contains("tags") && !op["tags"].is_null()) e.tags = StringArray(op["tags"], "create: 'tags'");
        e.assignee = OptionalString(op, "assignee", type);
        e.stream = OptionalString(op, "stream", type);
        e.parent = OptionalString(op, "parent", type);
        return e;
    }
    if (type == FieldUpdated::Type) {
        FieldUpdated e;
        const std::string field = RequireString(op, "field", type);
        auto parsed = FieldFromString(field);
        if (!parsed) Fail(DiagnosticCategory::InvalidField, "update_field: unknown field '" + field + "'");
        e.field = *parsed;
        if (!op.contains("value")) Fail(DiagnosticCategory::MissingField, "update_field: missing 'value'");
        if (e.field == TaskField::Tags) {
            e.tags = StringArray(op["value"], "update_field: tags 'value'");
        } else {
            e.value = RequireString(op, "value", type);
            if (e.field == TaskField::Priority) ParsePriority(e.value, type);
        }
        return e;
    }
    if (type == TaskAssigned::Type) {
        return TaskAssigned{RequireNonEmpty(op, "assignee", type)};
    }
    if (type == TaskUnassigned::Type) {
        return TaskUnassigned{};
    }
    if (type == CommentAdded::Type) {
        return CommentAdded{RequireString(op, "body", type), OptionalString(op, "ref", type)};
    }
    if (type == LinkAdded::Type) {
        LinkAdded e;
        e.rel = ParseRelation(op);
        e.target = RequireNonEmpty(op, "target", type);
        return e;
    }
    if (type == LinkRemoved::Type) {
        LinkRemoved e;
        e.rel = ParseRelation(op);
        e.target = RequireNonEmpty(op, "target", type);
        return e;
    }
    if (type == StreamSet::Type) {
        return StreamSet{OptionalString(op, "stream", type)};
    }
    if (type == TaskCompleted::Type) {
        TaskCompleted e;
        if (auto r = OptionalString(op, "resolution", type)) {
            auto parsed = ResolutionFromString(*r);
            if (!parsed) Fail(DiagnosticCategory::InvalidField, "complete: unknown resolution '" + *r + "'");
            e.resolution = *parsed;
        }
        return e;
    }
    if (type == TaskReopened::Type) {
        return TaskReopened{};
    }
    return UnknownOperation{type, op.dump()};
}

json EncodeOperation(const TaskOperation& operation) {
    if (const auto* unknown = std::get_if<UnknownOperation>(&operation)) {
        // Written back exactly as it was read.
        return json::parse(unknown->payloadJson);
    }

    json j = std::visit([](auto&& e) -> json {
        using T = std::decay_t<decltype(e)>;
        json out = json::object();
        // Manual mapping per operation; each carries only the fields it changes.
        if constexpr (std::is_same_v<T, TaskCreated>) {
            out = {
                {"title", e.title},
                {"priority", PriorityToString(e.priority)}
            };
            if (!e.description.empty()) out["description"] = e.description;
            if (!e.tags.empty()) out["tags"] = e.tags;
            if (e.assignee) out["assignee"] = *e.assignee;
            if (e.stream) out["stream"] = *e.stream;
            if (e.parent) out["parent"] = *e.parent;
        }
        else if constexpr (std::is_same_v<T, FieldUpdated>) {
            out["field"] = FieldToString(e.field);
            if (e.field == TaskField::Tags) out["value"] = e.tags;
            else out["value"] = e.value;
        }
        else if constexpr (std::is_same_v<T, TaskAssigned>) {
            out["assignee"] = e.assignee;
        }
        else if constexpr (std::is_same_v<T, CommentAdded>) {
            out["body"] = e.body;
            if (e.ref) out["ref"] = *e.ref;
        }
        else if constexpr (std::is_same_v<T, LinkAdded> || std::is_same_v<T, LinkRemoved>) {
            out = {
                {"rel", RelationToString(e.rel)},
                {"target", e.target}
            };
        }
        else if constexpr (std::is_same_v<T, StreamSet>) {
            out["stream"] = e.stream ? json(*e.stream) : json(nullptr);
        }
        else if constexpr (std::is_same_v<T, TaskCompleted>) {
            out["resolution"] = ResolutionToString(e.resolution);
        }
        return out;
    }, operation);

    j["type"] = OperationType(operation);
    return j;
}

} // namespace

json EventCodec::ToJson(const Event& event) {
    return json{
        {"v", event.schemaVersion},
        {"event_id", event.eventId},
        {"task_id", event.taskId},
        {"seq", event.seq},
        {"timestamp", TimeUtils::FormatIso8601(event.timestamp)},
        {"author", event.author},
        {"branch", event.branch},
        {"operation", EncodeOperation(event.operation)}
    };
}

std::string EventCodec::Encode(const Event& event) {
    return ToJson(event).dump();
}

Event EventCodec::Decode(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        Fail(DiagnosticCategory::ParseError, std::string("invalid JSON: ") + Printable(e.what()));
    }
    return FromJson(j);
}

Event EventCodec::FromJson(const json& j) {
    if (!j.is_object()) {
        Fail(DiagnosticCategory::ParseError, "event line is not a JSON object");
    }
    for (const char* field : kRequiredFields) {
        if (!j.contains(field)) {
            Fail(DiagnosticCategory::MissingField, std::string("missing required field '") + field + "'");
        }
    }

    Event event;
    if (j.contains("v")) {
        if (!j["v"].is_number_integer()) Fail(DiagnosticCategory::InvalidField, "'v' must be an integer");
        event.schemaVersion = j["v"].get<int>();
    }
    event.eventId = RequireNonEmpty(j, "event_id", "event");
    event.taskId = RequireNonEmpty(j, "task_id", "event");

    if (!j["seq"].is_number_unsigned() || j["seq"].get<std::uint64_t>() == 0) {
        Fail(DiagnosticCategory::InvalidField, "'seq' must be a positive integer");
    }
    event.seq = j["seq"].get<std::uint64_t>();

    const std::string ts = RequireString(j, "timestamp", "event");
    auto parsed = TimeUtils::ParseIso8601(ts);
    if (!parsed) Fail(DiagnosticCategory::InvalidField, "invalid timestamp '" + ts + "'");
    event.timestamp = *parsed;

    event.author = RequireString(j, "author", "event");
    event.branch = OptionalString(j, "branch", "event").value_or("");
    event.operation = DecodeOperation(j["operation"]);

    if (event.isCreate() && event.taskId != event.eventId) {
        Fail(DiagnosticCategory::InvalidField,
             "create event " + event.eventId + " targets a different task_id " + event.taskId);
    }
    return event;
}

} // namespace spool::infrastructure
