#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include <boost/json/value.hpp>

#include "app/Navigation.h"

namespace infra::storage {
class JsonFileStore;
}

namespace app {

struct WorkspaceSnapshot {
    static constexpr int kVersion = 1;

    int version{kVersion};
    std::int64_t savedAtUnix{0};
    NavigationState navigation;
};

boost::json::value workspace_to_json(const WorkspaceSnapshot& snapshot);
// Throws domain::DecodeError when the document is not a workspace.
WorkspaceSnapshot workspace_from_json(const boost::json::value& document);

// Last viewed navigation state, kept across restarts in a single JSON file.
class WorkspaceStore {
public:
    explicit WorkspaceStore(std::filesystem::path file);
    ~WorkspaceStore();

    // Missing file gives nullopt. An unreadable file is backed up and also gives nullopt.
    std::optional<WorkspaceSnapshot> load();

    // Writes on a helper thread and waits at most timeout. Returns false on timeout or error;
    // a timed out write finishes in the background and still replaces the file atomically.
    bool save(const WorkspaceSnapshot& snapshot, std::chrono::milliseconds timeout);

private:
    std::shared_ptr<infra::storage::JsonFileStore> file_;
};

}  // namespace app
