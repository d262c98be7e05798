#include "TestSupport.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "application/Archiver.hpp"
#include "application/TaskService.hpp"
#include "infrastructure/EventLogFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/StateCache.hpp"
#include "infrastructure/StateJson.hpp"

using namespace spool::domain;
using namespace spool::application;
using namespace spool::infrastructure;
using namespace spool::test;

namespace {

struct Fixture {
    explicit Fixture(const std::string& name) : dir(name), now(std::make_shared<TimePoint>()) {
        persistence = std::make_shared<PersistenceService>();
        log = std::make_shared<EventLogFs>(dir.path(), persistence);
        auto cache = std::make_shared<StateCache>(dir.path(), persistence);
        auto clock = now;
        service = std::make_unique<TaskService>(log, cache, Actor{"alice", "main"}, [clock] { return *clock; });
    }

    std::string createAt(const std::string& iso, const std::string& title) {
        *now = At(iso);
        TaskCreated created;
        created.title = title;
        return service->create(created).taskId;
    }

    void applyAt(const std::string& iso, const std::string& id, const TaskOperation& op) {
        *now = At(iso);
        service->apply(id, op);
    }

    std::vector<std::string> encodedHistory(const std::string& id) const {
        std::vector<std::string> out;
        for (const auto& logged : service->history(id)) out.push_back(Line(logged.event));
        return out;
    }

    fs::path file(const std::string& relative) const { return dir.path() / relative; }

    ScratchDir dir;
    std::shared_ptr<TimePoint> now;
    std::shared_ptr<PersistenceService> persistence;
    std::shared_ptr<EventLogFs> log;
    std::unique_ptr<TaskService> service;
};

std::string Render(const std::optional<Task>& task) {
    assert(task);
    return StateJson::ToJson(*task).dump();
}

void TestArchiveMovesClosedTasks() {
    std::cout << "[Test] Archive moves closed tasks and compacts active files..." << std::endl;
    Fixture f("archive_move");

    const std::string done = f.createAt("2026-01-05T09:00:00.000Z", "Old and done");
    const std::string open = f.createAt("2026-01-06T09:00:00.000Z", "Still open");
    f.applyAt("2026-01-06T10:00:00.000Z", done, CommentAdded{"wrapping up", std::nullopt});
    f.applyAt("2026-01-10T09:00:00.000Z", done, TaskCompleted{Resolution::Done});
    const std::string recent = f.createAt("2026-01-10T10:00:00.000Z", "Recently done");
    f.applyAt("2026-02-03T09:00:00.000Z", recent, TaskCompleted{Resolution::WontFix});

    const auto historyBefore = f.encodedHistory(done);
    const std::string stateBefore = Render(f.service->get(done));
    const std::string openLineBefore = ReadFile(f.file("events/2026-01-06.jsonl"));
    assert(historyBefore.size() == 3);

    const auto cutoff = At("2026-02-01T00:00:00.000Z");

    // A dry run reports without touching anything.
    const ArchivePlan plan = f.service->planArchive(cutoff);
    assert(plan.candidates.size() == 1);
    assert(plan.candidates[0].taskId == done);
    assert(plan.candidates[0].archiveFile == "archive/2026-01.jsonl");
    assert(plan.candidates[0].eventCount == 3);
    assert(!fs::exists(f.file("archive/2026-01.jsonl")));

    assert(f.service->archive(cutoff) == 1);

    // The file holding only the create of the archived task is gone.
    assert(!fs::exists(f.file("events/2026-01-05.jsonl")));
    // Mixed file: the open task's line is kept byte for byte.
    const std::string mixed = ReadFile(f.file("events/2026-01-06.jsonl"));
    assert(mixed.find(done) == std::string::npos);
    assert(mixed.find(open) != std::string::npos);
    assert(CountLines(mixed) == 1);
    assert(openLineBefore.find(mixed) != std::string::npos);
    // Only the completion of the archived task lived here, next to "recent".
    const std::string jan10 = ReadFile(f.file("events/2026-01-10.jsonl"));
    assert(jan10.find(done) == std::string::npos);
    assert(jan10.find(recent) != std::string::npos);

    const std::string archived = ReadFile(f.file("archive/2026-01.jsonl"));
    assert(CountLines(archived) == 3);

    // History and state are unchanged by the move.
    assert(f.encodedHistory(done) == historyBefore);
    assert(Render(f.service->get(done)) == stateBefore);
    for (const auto& logged : f.service->history(done)) {
        assert(logged.position.file == "archive/2026-01.jsonl");
    }

    TaskFilter all;
    all.status.reset();
    assert(f.service->list(all).size() == 3);
    assert(f.service->validate().passed(true));

    // Nothing left to do.
    assert(f.service->planArchive(cutoff).empty());
    assert(f.service->archive(cutoff) == 0);
    assert(ReadFile(f.file("archive/2026-01.jsonl")) == archived);
}

void TestArchiveAppendsInCanonicalOrder() {
    std::cout << "[Test] Archive lines follow canonical order and append to existing months..." << std::endl;
    Fixture f("archive_order");

    // Pre-existing archive content stays first.
    const std::string existing = Line(MakeCreate("legacy", "Archived long ago", "2025-12-01T00:00:00.000Z")) + "\n";
    WriteFile(f.file("archive/2026-01.jsonl"), existing);

    const std::string id = f.createAt("2026-01-20T09:00:00.000Z", "Out of order");
    // Written to an earlier-dated file than the create, so physical order differs from canonical.
    f.applyAt("2026-01-02T09:00:00.000Z", id, TaskAssigned{"bob"});
    f.applyAt("2026-01-25T09:00:00.000Z", id, TaskCompleted{Resolution::Done});

    assert(f.service->archive(At("2026-02-01T00:00:00.000Z")) == 1);
    assert(!fs::exists(f.file("events")) || fs::is_empty(f.file("events")));

    const std::string archived = ReadFile(f.file("archive/2026-01.jsonl"));
    assert(archived.rfind(existing, 0) == 0);
    std::vector<std::uint64_t> seqs;
    std::size_t start = existing.size();
    while (start < archived.size()) {
        std::size_t end = archived.find('\n', start);
        seqs.push_back(nlohmann::json::parse(archived.substr(start, end - start))["seq"].get<std::uint64_t>());
        start = end + 1;
    }
    assert((seqs == std::vector<std::uint64_t>{1, 2, 3}));
}

void TestOpenAndRecentTasksStay() {
    std::cout << "[Test] Open or recently closed tasks are not archived..." << std::endl;
    Fixture f("archive_keep");
    const std::string reopened = f.createAt("2026-01-05T09:00:00.000Z", "Reopened");
    f.applyAt("2026-01-06T09:00:00.000Z", reopened, TaskCompleted{Resolution::Done});
    f.applyAt("2026-01-07T09:00:00.000Z", reopened, TaskReopened{});
    const std::string late = f.createAt("2026-01-05T10:00:00.000Z", "Closed at the cutoff");
    f.applyAt("2026-02-01T00:00:00.000Z", late, TaskCompleted{Resolution::Done});

    assert(f.service->archive(At("2026-02-01T00:00:00.000Z")) == 0);
    assert(!fs::exists(f.file("archive/2026-01.jsonl")));
    assert(fs::exists(f.file("events/2026-01-05.jsonl")));
    assert(CountLines(ReadFile(f.file("events/2026-01-05.jsonl"))) == 2);
}

void TestRerunAfterInterruptedArchive() {
    std::cout << "[Test] A rerun after a partial archive does not duplicate lines..." << std::endl;
    Fixture f("archive_rerun");
    const std::string id = f.createAt("2026-01-05T09:00:00.000Z", "Half moved");
    f.applyAt("2026-01-06T09:00:00.000Z", id, TaskCompleted{Resolution::Done});

    // Simulate a crash that wrote the archive but left the active lines behind.
    std::string copy;
    for (const auto& line : f.encodedHistory(id)) copy += line + "\n";
    WriteFile(f.file("archive/2026-01.jsonl"), copy);

    assert(f.service->archive(At("2026-02-01T00:00:00.000Z")) == 1);
    assert(ReadFile(f.file("archive/2026-01.jsonl")) == copy);
    assert(!fs::exists(f.file("events/2026-01-05.jsonl")));
    assert(!fs::exists(f.file("events/2026-01-06.jsonl")));
    assert(f.service->validate().passed(true));
}

void TestCutoffFromAge() {
    std::cout << "[Test] Cutoff from an age in days..." << std::endl;
    const auto now = At("2026-03-15T12:30:00.000Z");
    assert(Archiver::CutoffFor(now, std::nullopt) == At("2026-03-01T00:00:00.000Z"));
    assert(Archiver::CutoffFor(now, 0) == now);
    assert(Archiver::CutoffFor(now, 14) == At("2026-03-01T12:30:00.000Z"));
    assert(Archiver::CutoffFor(now, Archiver::kMaxAgeDays) < At("1930-01-01T00:00:00.000Z"));

    for (int days : {-1, Archiver::kMaxAgeDays + 1, 200000000}) {
        bool threw = false;
        try {
            Archiver::CutoffFor(now, days);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting Archiver Test..." << std::endl;
    TestArchiveMovesClosedTasks();
    TestArchiveAppendsInCanonicalOrder();
    TestOpenAndRecentTasksStay();
    TestRerunAfterInterruptedArchive();
    TestCutoffFromAge();
    std::cout << "[PASS] Archiver Test." << std::endl;
    return 0;
}
