#include "TestSupport.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "application/ReplayEngine.hpp"
#include "infrastructure/EventLogFs.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace spool::domain;
using namespace spool::application;
using namespace spool::infrastructure;
using namespace spool::test;

// Uncoordinated writers share the day's file; records must never interleave.
int main() {
    std::cout << "[Test] Starting Concurrent Append Stress Test..." << std::endl;

    ScratchDir dir("concurrency");
    auto persistence = std::make_shared<PersistenceService>();
    auto log = std::make_shared<EventLogFs>(dir.path(), persistence);

    const int NUM_WRITERS = 8;
    const int EVENTS_PER_WRITER = 40;
    std::vector<std::thread> threads;
    std::atomic<int> completedAppends{0};

    std::cout << "[Test] Spawning " << NUM_WRITERS << " writers..." << std::endl;

    for (int w = 0; w < NUM_WRITERS; ++w) {
        threads.emplace_back([log, w, &completedAppends]() {
            for (int i = 0; i < EVENTS_PER_WRITER; ++i) {
                const std::string id = "w" + std::to_string(w) + "-t" + std::to_string(i);
                TaskCreated created;
                created.title = "Task " + std::to_string(i) + " from writer " + std::to_string(w);
                created.description = std::string(200, 'x');
                log->append(MakeEvent(id, id, 1, "2026-01-05T10:00:00.000Z", created, "writer-" + std::to_string(w)));
                completedAppends++;
            }
        });
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    assert(completedAppends == NUM_WRITERS * EVENTS_PER_WRITER);

    // Validation
    const LogSnapshot snapshot = log->read(LogScope::All);
    assert(snapshot.files.size() == 1);
    assert(snapshot.files[0].lines.size() == static_cast<size_t>(NUM_WRITERS * EVENTS_PER_WRITER));

    ReplayEngine engine;
    auto result = engine.replay(snapshot);
    std::cout << "[Test] Tasks replayed: " << result.state.tasks.size() << std::endl;
    assert(result.state.diagnostics.empty());
    assert(result.state.tasks.size() == static_cast<size_t>(NUM_WRITERS * EVENTS_PER_WRITER));

    std::cout << "[PASS] Concurrent Append Stress Test." << std::endl;
    return 0;
}
