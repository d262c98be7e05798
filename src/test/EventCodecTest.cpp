#include "TestSupport.hpp"

#include <iostream>
#include <variant>

#include <nlohmann/json.hpp>

#include "infrastructure/EventCodec.hpp"
#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/TimeUtils.hpp"

using namespace spool::domain;
using namespace spool::infrastructure;
using namespace spool::test;

namespace {

DiagnosticCategory DecodeFailure(const std::string& line) {
    try {
        EventCodec::Decode(line);
    } catch (const EventDecodeError& e) {
        return e.category();
    }
    assert(false && "line should not decode");
    return DiagnosticCategory::ParseError;
}

void TestCanonicalOrder() {
    std::cout << "[Test] Canonical order..." << std::endl;
    auto early = MakeEvent("b", "t", 2, "2026-01-05T10:00:00.000Z", TaskUnassigned{});
    auto late = MakeEvent("a", "t", 2, "2026-01-05T11:00:00.000Z", TaskUnassigned{});
    auto higherSeq = MakeEvent("0", "t", 3, "2026-01-01T00:00:00.000Z", TaskUnassigned{});
    auto sameTimeLowId = MakeEvent("a", "t", 2, "2026-01-05T10:00:00.000Z", TaskUnassigned{});

    // seq dominates clocks
    assert(CanonicalLess(late, higherSeq));
    assert(!CanonicalLess(higherSeq, early));
    // then timestamp
    assert(CanonicalLess(early, late));
    // then event id, byte-wise
    assert(CanonicalLess(sameTimeLowId, early));
    assert(!CanonicalLess(early, early));

    // Microsecond stamps from another writer collapse to the same millisecond.
    auto micro1 = MakeEvent("y", "t", 2, "2026-01-05T10:00:00.123Z", TaskUnassigned{});
    auto micro2 = MakeEvent("x", "t", 2, "2026-01-05T10:00:00.123Z", TaskUnassigned{});
    micro1.timestamp = *TimeUtils::ParseIso8601("2026-01-05T10:00:00.123100Z");
    micro2.timestamp = *TimeUtils::ParseIso8601("2026-01-05T10:00:00.123900Z");
    assert(micro1.timestamp == micro2.timestamp);
    assert(CanonicalLess(micro2, micro1));
}

void TestEncodeDecode() {
    std::cout << "[Test] Encode/decode of every known operation..." << std::endl;
    TaskCreated created;
    created.title = "Write the parser";
    created.description = "Line based";
    created.priority = Priority::P1;
    created.tags = {"core", "io"};
    created.stream = "backend";

    const std::vector<TaskOperation> ops = {
        created,
        FieldUpdated{TaskField::Title, "Renamed", {}},
        FieldUpdated{TaskField::Tags, "", {"x", "y"}},
        TaskAssigned{"bob"},
        TaskUnassigned{},
        CommentAdded{"looks good", std::string("abc123")},
        LinkAdded{LinkRelation::BlockedBy, "other"},
        LinkRemoved{LinkRelation::Parent, "other"},
        StreamSet{std::nullopt},
        TaskCompleted{Resolution::WontFix},
        TaskReopened{}
    };

    std::uint64_t seq = 1;
    for (const auto& op : ops) {
        const std::string id = seq == 1 ? "task-1" : "ev-" + std::to_string(seq);
        Event original = MakeEvent(id, "task-1", seq, "2026-01-05T10:00:00.123Z", op, "feature/x", "carol");
        const std::string line = EventCodec::Encode(original);
        assert(line.find('\n') == std::string::npos);

        Event decoded = EventCodec::Decode(line);
        assert(decoded.eventId == original.eventId);
        assert(decoded.taskId == "task-1");
        assert(decoded.seq == seq);
        assert(decoded.timestamp == original.timestamp);
        assert(decoded.author == "carol");
        assert(decoded.branch == "feature/x");
        assert(decoded.schemaVersion == kSchemaVersion);
        assert(decoded.operation.index() == original.operation.index());
        assert(EventCodec::Encode(decoded) == line);
        ++seq;
    }

    Event create = EventCodec::Decode(EventCodec::Encode(MakeEvent("task-1", "task-1", 1,
                                                                   "2026-01-05T10:00:00.000Z", created)));
    const auto& c = std::get<TaskCreated>(create.operation);
    assert(c.title == "Write the parser");
    assert(c.priority == Priority::P1);
    assert(c.tags.size() == 2);
    assert(c.stream && *c.stream == "backend");
    assert(!c.assignee);

    nlohmann::json j = nlohmann::json::parse(EventCodec::Encode(MakeEvent("e", "t", 4, "2026-01-05T10:00:00.000Z",
                                                                          StreamSet{std::nullopt})));
    assert(j["operation"]["type"] == "set_stream");
    assert(j["operation"]["stream"].is_null());
    assert(j["v"] == 1);
    assert(j["timestamp"] == "2026-01-05T10:00:00.000Z");
}

void TestUnknownOperationPreserved() {
    std::cout << "[Test] Unknown operations survive a decode/encode cycle..." << std::endl;
    const std::string line =
        R"({"v":1,"event_id":"e9","task_id":"t1","seq":7,"timestamp":"2026-01-05T10:00:00.000Z",)"
        R"("author":"dave","branch":"main","operation":{"type":"estimate","points":3,"unit":"days"}})";
    Event event = EventCodec::Decode(line);
    const auto* unknown = std::get_if<UnknownOperation>(&event.operation);
    assert(unknown);
    assert(unknown->type == "estimate");
    assert(OperationType(event.operation) == "estimate");

    nlohmann::json reencoded = nlohmann::json::parse(EventCodec::Encode(event));
    assert(reencoded == nlohmann::json::parse(line));
}

void TestDecodeFailures() {
    std::cout << "[Test] Malformed lines are classified..." << std::endl;
    const std::string good = Line(MakeEvent("e1", "t1", 2, "2026-01-05T10:00:00.000Z", TaskAssigned{"bob"}));
    assert(EventCodec::Decode(good).taskId == "t1");

    assert(DecodeFailure("{not json") == DiagnosticCategory::ParseError);
    assert(DecodeFailure(good.substr(0, good.size() / 2)) == DiagnosticCategory::ParseError);
    assert(DecodeFailure("[1,2,3]") == DiagnosticCategory::ParseError);

    nlohmann::json j = nlohmann::json::parse(good);
    j.erase("seq");
    assert(DecodeFailure(j.dump()) == DiagnosticCategory::MissingField);

    j = nlohmann::json::parse(good);
    j["timestamp"] = "yesterday";
    assert(DecodeFailure(j.dump()) == DiagnosticCategory::InvalidField);

    j = nlohmann::json::parse(good);
    j["seq"] = "two";
    assert(DecodeFailure(j.dump()) == DiagnosticCategory::InvalidField);

    j = nlohmann::json::parse(good);
    j["operation"].erase("assignee");
    assert(DecodeFailure(j.dump()) == DiagnosticCategory::MissingField);

    j = nlohmann::json::parse(Line(MakeCreate("t1", "Title")));
    j["task_id"] = "something-else";
    assert(DecodeFailure(j.dump()) == DiagnosticCategory::InvalidField);

    j = nlohmann::json::parse(Line(MakeCreate("t1", "Title")));
    j["operation"]["priority"] = "urgent";
    assert(DecodeFailure(j.dump()) == DiagnosticCategory::InvalidField);

    j = nlohmann::json::parse(Line(MakeEvent("e2", "t1", 3, "2026-01-05T10:00:00.000Z", TaskCompleted{})));
    j["operation"]["resolution"] = "maybe";
    assert(DecodeFailure(j.dump()) == DiagnosticCategory::InvalidField);
}

void TestTimestampsAndIds() {
    std::cout << "[Test] Timestamps and event ids..." << std::endl;
    const auto tp = At("2026-03-31T23:59:59.987Z");
    assert(TimeUtils::FormatIso8601(tp) == "2026-03-31T23:59:59.987Z");
    assert(TimeUtils::FormatDate(tp) == "2026-03-31");
    assert(TimeUtils::FormatMonth(tp) == "2026-03");
    assert(TimeUtils::StartOfMonth(tp) == At("2026-03-01T00:00:00.000Z"));
    assert(TimeUtils::ParseIso8601("2026-01-05T10:00:00Z") == At("2026-01-05T10:00:00.000Z"));
    assert(!TimeUtils::ParseIso8601("2026-02-30T10:00:00.000Z"));
    assert(!TimeUtils::ParseIso8601("2026-01-05 10:00:00"));
    assert(!TimeUtils::ParseIso8601("2026-01-05T10:00:00.000+01:00"));

    const std::string a = IdGenerator::NewEventId(tp);
    const std::string b = IdGenerator::NewEventId(tp);
    assert(a != b);
    assert(a.size() == 21);
    assert(a.substr(0, 13) == b.substr(0, 13));
    assert(IdGenerator::NewEventId(tp + std::chrono::milliseconds(1)) > a.substr(0, 13));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Event Codec Test..." << std::endl;
    TestCanonicalOrder();
    TestEncodeDecode();
    TestUnknownOperationPreserved();
    TestDecodeFailures();
    TestTimestampsAndIds();
    std::cout << "[PASS] Event Codec Test." << std::endl;
    return 0;
}
