#include "infrastructure/PathUtils.hpp"

#include <stdexcept>

#include "infrastructure/PersistenceService.hpp"

namespace spool::infrastructure {

namespace fs = std::filesystem;

std::optional<fs::path> PathUtils::FindSpoolRoot(const fs::path& start) {
    fs::path dir = fs::absolute(start);
    while (true) {
        const fs::path candidate = dir / kSpoolDir;
        if (fs::is_directory(candidate)) {
            return candidate;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            return std::nullopt;
        }
        dir = dir.parent_path();
    }
}

fs::path PathUtils::InitSpoolRoot(const fs::path& dir) {
    const fs::path root = fs::absolute(dir) / kSpoolDir;
    if (fs::exists(root)) {
        throw std::runtime_error("Already initialized: " + root.string());
    }
    fs::create_directories(root / "events");
    fs::create_directories(root / "archive");

    // Caches and transaction leftovers are local; only the logs are versioned.
    PersistenceService persistence;
    persistence.saveTextAtomic(root / ".gitignore", ".index.json\n.state.json\n*.tmp\n*.bak\n");
    return root;
}

} // namespace spool::infrastructure
