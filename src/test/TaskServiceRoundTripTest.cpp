#include "TestSupport.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/TaskService.hpp"
#include "infrastructure/EventLogFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/StateCache.hpp"

using namespace spool::domain;
using namespace spool::application;
using namespace spool::infrastructure;
using namespace spool::test;

namespace {

template <typename Exception, typename Fn>
void ExpectThrow(Fn&& fn) {
    bool thrown = false;
    try {
        fn();
    } catch (const Exception&) {
        thrown = true;
    }
    assert(thrown && "expected exception");
}

TaskCreated Titled(const std::string& title, Priority priority = Priority::P2) {
    TaskCreated created;
    created.title = title;
    created.priority = priority;
    return created;
}

std::size_t EventCount(const std::shared_ptr<EventLogFs>& log) {
    std::size_t n = 0;
    for (const auto& file : log->read(LogScope::All).files) n += file.lines.size();
    return n;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TaskService Round-Trip Test..." << std::endl;

    ScratchDir dir("service");
    auto now = std::make_shared<TimePoint>(At("2026-03-02T09:00:00.000Z"));
    auto tick = [now] {
        *now += std::chrono::minutes(1);
        return *now;
    };
    auto persistence = std::make_shared<PersistenceService>();
    auto log = std::make_shared<EventLogFs>(dir.path(), persistence);
    auto cache = std::make_shared<StateCache>(dir.path(), persistence);
    TaskService service(log, cache, Actor{"alice", "main"}, tick);

    // Create
    TaskCreated first = Titled("Draft the schema", Priority::P1);
    first.tags = {"design"};
    first.assignee = "bob";
    const Event created = service.create(first);
    assert(created.taskId == created.eventId);
    assert(created.seq == 1);
    assert(created.author == "alice" && created.branch == "main");
    const std::string id = created.taskId;

    // Update title, then read it back
    const Event renamed = service.apply(id, FieldUpdated{TaskField::Title, "Draft the event schema", {}});
    assert(renamed.seq == 2);
    auto task = service.get(id);
    assert(task && "Task should exist after creation.");
    assert(task->title == "Draft the event schema");
    assert(task->priority == Priority::P1);
    assert(task->assignee == std::string("bob"));
    assert(task->lastSeq == 2);
    assert(task->createdBy == "alice");
    assert(service.history(id).size() == 2);
    assert(!service.get("no-such-task"));
    assert(service.history("no-such-task").empty());

    // Remaining operations
    service.apply(id, FieldUpdated{TaskField::Tags, "", {"design", "core"}});
    service.apply(id, FieldUpdated{TaskField::Description, "Fields and ordering key", {}});
    service.apply(id, CommentAdded{"see the notes", std::string("docs/notes.md")});
    service.apply(id, StreamSet{std::string("storage")});
    service.apply(id, TaskUnassigned{});
    task = service.get(id);
    assert(task->tags.size() == 2 && task->tags.count("core"));
    assert(task->description == "Fields and ordering key");
    assert(task->comments.size() == 1 && task->comments[0].ref == std::string("docs/notes.md"));
    assert(task->stream == std::string("storage"));
    assert(!task->assignee);
    assert(task->lastSeq == 7);

    // Links are mirrored onto the target
    const std::string other = service.create(Titled("Write the replay engine", Priority::P0)).taskId;
    service.apply(id, LinkAdded{LinkRelation::Blocks, other});
    assert(service.get(id)->blocks.count(other));
    assert(service.get(other)->blockedBy.count(id));
    assert(service.get(other)->lastSeq == 2);
    assert(service.validate().passed(true));

    service.apply(other, LinkRemoved{LinkRelation::BlockedBy, id});
    assert(service.get(id)->blocks.empty());
    assert(service.get(other)->blockedBy.empty());
    assert(service.validate().passed(true));

    // Rejected operations append nothing
    const std::size_t before = EventCount(log);
    ExpectThrow<std::runtime_error>([&] { service.apply("no-such-task", TaskReopened{}); });
    ExpectThrow<std::invalid_argument>([&] { service.create(Titled("   ")); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, FieldUpdated{TaskField::Title, "", {}}); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, FieldUpdated{TaskField::Priority, "p9", {}}); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, LinkAdded{LinkRelation::Blocks, id}); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, LinkAdded{LinkRelation::Parent, "missing"}); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, LinkRemoved{LinkRelation::Blocks, other}); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, TaskReopened{}); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, TaskCreated{}); });
    ExpectThrow<std::invalid_argument>([&] { service.apply(id, UnknownOperation{"estimate", "{}"}); });
    TaskCreated orphanChild = Titled("Child");
    orphanChild.parent = "missing";
    ExpectThrow<std::invalid_argument>([&] { service.create(orphanChild); });
    assert(EventCount(log) == before);

    // Complete / reopen
    service.apply(other, TaskCompleted{Resolution::Done});
    ExpectThrow<std::invalid_argument>([&] { service.apply(other, TaskCompleted{Resolution::WontFix}); });
    auto closed = service.get(other);
    assert(closed->isComplete() && closed->completedAt);
    service.apply(other, TaskReopened{});
    auto reopened = service.get(other);
    assert(!reopened->isComplete() && !reopened->resolution && !reopened->completedAt);
    service.apply(other, TaskCompleted{Resolution::Obsolete});

    // Listing and filters
    TaskCreated third = Titled("Triage old bugs", Priority::P1);
    third.assignee = "carol";
    third.stream = "storage";
    const std::string triage = service.create(third).taskId;

    TaskFilter open;
    auto rows = service.list(open);
    assert(rows.size() == 2);
    // Same priority: older first.
    assert(rows[0].id == id && rows[1].id == triage);

    TaskFilter all;
    all.status.reset();
    rows = service.list(all);
    assert(rows.size() == 3);
    assert(rows[0].id == other); // p0 first

    TaskFilter done;
    done.status = TaskStatus::Complete;
    assert(service.list(done).size() == 1);

    TaskFilter byAssignee;
    byAssignee.assignee = "carol";
    assert(service.list(byAssignee).size() == 1);

    TaskFilter byTag;
    byTag.tag = "core";
    assert(service.list(byTag).size() == 1 && service.list(byTag)[0].id == id);

    TaskFilter byStream;
    byStream.stream = "storage";
    assert(service.list(byStream).size() == 2);

    TaskFilter byPriority;
    byPriority.priority = Priority::P0;
    assert(service.list(byPriority).empty());
    byPriority.status.reset();
    assert(service.list(byPriority).size() == 1);

    // Everything survives a cold start from the log alone
    TaskState rebuilt = service.rebuild();
    assert(rebuilt.tasks.size() == 3);
    assert(rebuilt.diagnostics.empty());
    assert(rebuilt.tasks.at(other).resolution == Resolution::Obsolete);
    assert(service.validate().passed(true));

    std::cout << "[PASS] TaskService Round-Trip Test." << std::endl;
    return 0;
}
