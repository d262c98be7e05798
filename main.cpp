#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/TaskService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EventCodec.hpp"
#include "infrastructure/EventLogFs.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/StateCache.hpp"
#include "infrastructure/TimeUtils.hpp"

namespace fs = std::filesystem;
using namespace spool;
using namespace spool::domain;
using application::Archiver;
using application::TaskService;
using infrastructure::TimeUtils;

namespace {

const char* kUsage =
    "usage: spool <command> [args]\n"
    "\n"
    "  init\n"
    "  list [--status open|complete|all] [--assignee NAME] [--tag TAG]\n"
    "       [--priority p0..p3] [--stream NAME] [--format table|json|ids]\n"
    "  show <id> [--events]\n"
    "  create <title> [--description TEXT] [--priority P] [--tag TAG]...\n"
    "         [--assignee NAME] [--stream NAME] [--parent ID]\n"
    "  update <id> [--title T] [--description D] [--priority P] [--tags a,b,c]\n"
    "  assign <id> <name>\n"
    "  unassign <id>\n"
    "  comment <id> <body> [--ref REF]\n"
    "  link <id> blocks|blocked_by|parent <target>\n"
    "  unlink <id> blocks|blocked_by|parent <target>\n"
    "  stream <id> [<name>]          (no name clears the stream)\n"
    "  complete <id> [--resolution done|wontfix|duplicate|obsolete]\n"
    "  reopen <id>\n"
    "  rebuild\n"
    "  archive [--days N] [--dry-run]\n"
    "  validate [--strict]\n";

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- Argument parsing ---

struct Args {
    std::vector<std::string> positional;
    std::multimap<std::string, std::string> options;
    std::vector<std::string> flags;

    std::optional<std::string> option(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> all(const std::string& name) const {
        std::vector<std::string> out;
        auto range = options.equal_range(name);
        for (auto it = range.first; it != range.second; ++it) out.push_back(it->second);
        return out;
    }

    bool flag(const std::string& name) const {
        for (const auto& f : flags) {
            if (f == name) return true;
        }
        return false;
    }

    const std::string& at(size_t index, const char* what) const {
        if (index >= positional.size()) throw UsageError(std::string("missing ") + what);
        return positional[index];
    }
};

const char* kFlagNames[] = {"--events", "--dry-run", "--strict"};

Args ParseArgs(int argc, char** argv, int start) {
    Args args;
    for (int i = start; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            args.positional.push_back(token);
            continue;
        }
        bool isFlag = false;
        for (const char* name : kFlagNames) {
            if (token == name) isFlag = true;
        }
        if (isFlag) {
            args.flags.push_back(token);
            continue;
        }
        if (i + 1 >= argc) throw UsageError("option " + token + " needs a value");
        args.options.emplace(token, argv[++i]);
    }
    return args;
}

std::vector<std::string> SplitCsv(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(',', start);
        if (end == std::string::npos) end = text.size();
        std::string item = text.substr(start, end - start);
        if (!item.empty()) out.push_back(item);
        start = end + 1;
    }
    return out;
}

Priority ParsePriorityArg(const std::string& text) {
    auto p = PriorityFromString(text);
    if (!p) throw UsageError("unknown priority '" + text + "' (expected p0..p3)");
    return *p;
}

LinkRelation ParseRelationArg(const std::string& text) {
    auto rel = RelationFromString(text);
    if (!rel) throw UsageError("unknown relation '" + text + "' (expected blocks, blocked_by or parent)");
    return *rel;
}

// --- Rendering ---

std::string Optional(const std::optional<std::string>& value) {
    return value ? *value : "-";
}

std::string Join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out.empty() ? "-" : out;
}

void PrintTable(const std::vector<TaskSummary>& tasks) {
    if (tasks.empty()) {
        std::cout << "No tasks." << std::endl;
        return;
    }
    for (const auto& t : tasks) {
        std::cout << t.id << "  " << PriorityToString(t.priority) << "  " << StatusToString(t.status) << "  "
                  << t.title;
        if (t.assignee) std::cout << "  @" << *t.assignee;
        if (t.stream) std::cout << "  [" << *t.stream << "]";
        std::cout << std::endl;
    }
}

void PrintJson(const std::vector<TaskSummary>& tasks) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& t : tasks) {
        nlohmann::json row = {
            {"id", t.id},
            {"title", t.title},
            {"status", StatusToString(t.status)},
            {"priority", PriorityToString(t.priority)},
            {"tags", t.tags},
            {"created_at", TimeUtils::FormatIso8601(t.createdAt)},
            {"updated_at", TimeUtils::FormatIso8601(t.updatedAt)}
        };
        if (t.assignee) row["assignee"] = *t.assignee;
        if (t.stream) row["stream"] = *t.stream;
        if (t.completedAt) row["completed_at"] = TimeUtils::FormatIso8601(*t.completedAt);
        out.push_back(std::move(row));
    }
    std::cout << out.dump(2) << std::endl;
}

void PrintTask(const Task& task) {
    std::cout << task.id << ": " << task.title << "\n"
              << "  status:     " << StatusToString(task.status);
    if (task.resolution) std::cout << " (" << ResolutionToString(*task.resolution) << ")";
    std::cout << "\n"
              << "  priority:   " << PriorityToString(task.priority) << "\n"
              << "  assignee:   " << Optional(task.assignee) << "\n"
              << "  stream:     " << Optional(task.stream) << "\n"
              << "  tags:       " << Join(task.tags) << "\n"
              << "  blocks:     " << Join(task.blocks) << "\n"
              << "  blocked by: " << Join(task.blockedBy) << "\n"
              << "  parent:     " << Optional(task.parent) << "\n"
              << "  created:    " << TimeUtils::FormatIso8601(task.createdAt) << " by " << task.createdBy
              << " on " << task.createdBranch << "\n"
              << "  updated:    " << TimeUtils::FormatIso8601(task.updatedAt) << "\n";
    if (task.completedAt) {
        std::cout << "  completed:  " << TimeUtils::FormatIso8601(*task.completedAt) << "\n";
    }
    if (!task.description.empty()) {
        std::cout << "\n" << task.description << "\n";
    }
    for (const auto& c : task.comments) {
        std::cout << "\n  " << TimeUtils::FormatIso8601(c.timestamp) << " " << c.author;
        if (c.ref) std::cout << " (" << *c.ref << ")";
        std::cout << ":\n    " << c.body << "\n";
    }
    std::cout << std::flush;
}

// --- Commands ---

struct Workspace {
    fs::path root;
    infrastructure::SpoolSettings settings;
    std::unique_ptr<TaskService> service;
};

Workspace OpenWorkspace() {
    auto root = infrastructure::PathUtils::FindSpoolRoot(fs::current_path());
    if (!root) {
        throw std::runtime_error("Not inside a spool repository (run 'spool init')");
    }
    Workspace ws;
    ws.root = *root;
    ws.settings = infrastructure::ConfigLoader::Load(ws.root);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto log = std::make_shared<infrastructure::EventLogFs>(ws.root, persistence);
    auto cache = std::make_shared<infrastructure::StateCache>(ws.root, persistence);
    ws.service = std::make_unique<TaskService>(log, cache,
                                               application::Actor{ws.settings.author, ws.settings.branch});
    return ws;
}

void PrintEvent(const Event& event) {
    std::cout << event.eventId << std::endl;
}

int CmdList(TaskService& service, const Args& args) {
    application::TaskFilter filter;
    if (auto status = args.option("--status")) {
        if (*status == "all") {
            filter.status.reset();
        } else {
            filter.status = StatusFromString(*status);
            if (!filter.status) throw UsageError("unknown status '" + *status + "'");
        }
    }
    filter.assignee = args.option("--assignee");
    filter.tag = args.option("--tag");
    filter.stream = args.option("--stream");
    if (auto p = args.option("--priority")) filter.priority = ParsePriorityArg(*p);

    const auto tasks = service.list(filter);
    const std::string format = args.option("--format").value_or("table");
    if (format == "json") {
        PrintJson(tasks);
    } else if (format == "ids") {
        for (const auto& t : tasks) std::cout << t.id << "\n";
        std::cout << std::flush;
    } else if (format == "table") {
        PrintTable(tasks);
    } else {
        throw UsageError("unknown format '" + format + "'");
    }
    return 0;
}

int CmdShow(TaskService& service, const Args& args) {
    const std::string& id = args.at(0, "task id");
    auto task = service.get(id);
    if (!task) {
        std::cerr << "Task not found: " << id << std::endl;
        return 1;
    }
    PrintTask(*task);
    if (args.flag("--events")) {
        std::cout << "\nEvents:\n";
        for (const auto& logged : service.history(id)) {
            std::cout << "  " << logged.position.file << ":" << logged.position.line << "  "
                      << infrastructure::EventCodec::Encode(logged.event) << "\n";
        }
        std::cout << std::flush;
    }
    return 0;
}

int CmdCreate(TaskService& service, const Args& args) {
    TaskCreated created;
    created.title = args.at(0, "title");
    created.description = args.option("--description").value_or("");
    if (auto p = args.option("--priority")) created.priority = ParsePriorityArg(*p);
    created.tags = args.all("--tag");
    created.assignee = args.option("--assignee");
    created.stream = args.option("--stream");
    created.parent = args.option("--parent");
    PrintEvent(service.create(created));
    return 0;
}

int CmdUpdate(TaskService& service, const Args& args) {
    const std::string& id = args.at(0, "task id");
    std::vector<TaskOperation> ops;
    if (auto v = args.option("--title")) ops.push_back(FieldUpdated{TaskField::Title, *v, {}});
    if (auto v = args.option("--description")) ops.push_back(FieldUpdated{TaskField::Description, *v, {}});
    if (auto v = args.option("--priority")) {
        ParsePriorityArg(*v);
        ops.push_back(FieldUpdated{TaskField::Priority, *v, {}});
    }
    if (auto v = args.option("--tags")) ops.push_back(FieldUpdated{TaskField::Tags, "", SplitCsv(*v)});
    if (ops.empty()) throw UsageError("update needs at least one of --title --description --priority --tags");
    for (const auto& op : ops) {
        service.apply(id, op);
    }
    std::cout << "Updated " << id << std::endl;
    return 0;
}

int CmdArchive(const Workspace& ws, const Args& args) {
    const auto now = TimeUtils::NowMillis();
    std::optional<int> days = ws.settings.archiveAfterDays;
    if (auto d = args.option("--days")) {
        try {
            days = std::stoi(*d);
        } catch (const std::exception&) {
            throw UsageError("--days expects a number, got '" + *d + "'");
        }
    }
    std::chrono::system_clock::time_point cutoff;
    try {
        cutoff = Archiver::CutoffFor(now, days);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }

    if (args.flag("--dry-run")) {
        const auto plan = ws.service->planArchive(cutoff);
        if (plan.empty()) {
            std::cout << "Nothing to archive." << std::endl;
            return 0;
        }
        for (const auto& c : plan.candidates) {
            std::cout << c.taskId << "  " << TimeUtils::FormatDate(c.completedAt) << "  -> " << c.archiveFile
                      << "  (" << c.eventCount << " events)  " << c.title << "\n";
        }
        std::cout << plan.candidates.size() << " task(s) would be archived." << std::endl;
        return 0;
    }
    const size_t count = ws.service->archive(cutoff);
    std::cout << "Archived " << count << " task(s)." << std::endl;
    return 0;
}

int CmdValidate(TaskService& service, const Args& args) {
    const bool strict = args.flag("--strict");
    const auto report = service.validate();
    for (const auto& d : report.diagnostics) {
        std::cout << SeverityToString(d.severity()) << ": " << d.toString() << "\n";
    }
    std::cout << report.errorCount << " error(s), " << report.warningCount << " warning(s), "
              << report.conflictCount << " conflict(s)" << std::endl;
    return report.passed(strict) ? 0 : 1;
}

int Run(int argc, char** argv) {
    if (argc < 2) throw UsageError("missing command");
    const std::string command = argv[1];
    const Args args = ParseArgs(argc, argv, 2);

    if (command == "help" || command == "--help") {
        std::cout << kUsage;
        return 0;
    }
    if (command == "init") {
        const fs::path root = infrastructure::PathUtils::InitSpoolRoot(fs::current_path());
        std::cout << "Initialized spool in " << root.string() << std::endl;
        return 0;
    }

    Workspace ws = OpenWorkspace();
    TaskService& service = *ws.service;

    if (command == "list") return CmdList(service, args);
    if (command == "show") return CmdShow(service, args);
    if (command == "create") return CmdCreate(service, args);
    if (command == "update") return CmdUpdate(service, args);
    if (command == "assign") {
        PrintEvent(service.apply(args.at(0, "task id"), TaskAssigned{args.at(1, "assignee")}));
        return 0;
    }
    if (command == "unassign") {
        PrintEvent(service.apply(args.at(0, "task id"), TaskUnassigned{}));
        return 0;
    }
    if (command == "comment") {
        PrintEvent(service.apply(args.at(0, "task id"), CommentAdded{args.at(1, "comment"), args.option("--ref")}));
        return 0;
    }
    if (command == "link" || command == "unlink") {
        const LinkRelation rel = ParseRelationArg(args.at(1, "relation"));
        const std::string& target = args.at(2, "target id");
        if (command == "link") {
            PrintEvent(service.apply(args.at(0, "task id"), LinkAdded{rel, target}));
        } else {
            PrintEvent(service.apply(args.at(0, "task id"), LinkRemoved{rel, target}));
        }
        return 0;
    }
    if (command == "stream") {
        StreamSet op;
        if (args.positional.size() > 1) op.stream = args.positional[1];
        PrintEvent(service.apply(args.at(0, "task id"), op));
        return 0;
    }
    if (command == "complete") {
        TaskCompleted op;
        if (auto r = args.option("--resolution")) {
            auto parsed = ResolutionFromString(*r);
            if (!parsed) throw UsageError("unknown resolution '" + *r + "'");
            op.resolution = *parsed;
        }
        PrintEvent(service.apply(args.at(0, "task id"), op));
        return 0;
    }
    if (command == "reopen") {
        PrintEvent(service.apply(args.at(0, "task id"), TaskReopened{}));
        return 0;
    }
    if (command == "rebuild") {
        const auto state = service.rebuild();
        std::cout << "Rebuilt " << state.tasks.size() << " task(s), " << state.diagnostics.size()
                  << " diagnostic(s)." << std::endl;
        return 0;
    }
    if (command == "archive") return CmdArchive(ws, args);
    if (command == "validate") return CmdValidate(service, args);

    throw UsageError("unknown command '" + command + "'");
}

} // namespace

int main(int argc, char** argv) {
    try {
        return Run(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "spool: " << e.what() << "\n\n" << kUsage;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
