#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <boost/json.hpp>

#include "app/WorkspaceStore.h"
#include "domain/Errors.h"

using app::NavigationState;
using app::WorkspaceSnapshot;
using app::WorkspaceStore;

namespace fs = std::filesystem;

namespace {
using namespace std::chrono_literals;

struct TempDir {
    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / (name + "_" + std::to_string(::getpid()))) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path path;
};

std::size_t backupCount(const fs::path& dir) {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().find(".corrupt.") != std::string::npos) {
            ++count;
        }
    }
    return count;
}

std::string readAll(const fs::path& file) {
    std::ifstream input(file);
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

int main() {
    TempDir dir("tickwatch_workspace");
    const auto file = dir.path / "workspace.json";
    WorkspaceStore store(file);

    if (store.load()) {
        std::cerr << "Missing workspace should load as nothing\n";
        return 1;
    }

    NavigationState nav;
    nav.view = app::View::Stock;
    nav.groupId = 7;
    nav.selected = domain::InstrumentId("AAPL.US");
    nav.detail = domain::InstrumentId("AAPL.US");
    nav.period = domain::ChartPeriod::Min5;
    nav.chartOffset = 12;
    nav.sort.column = 2;
    nav.sort.order = 1;
    nav.sort.descending = true;
    nav.watchlistHidden = true;
    nav.logPanelVisible = true;

    WorkspaceSnapshot snapshot;
    snapshot.navigation = nav;
    if (!store.save(snapshot, 2000ms)) {
        std::cerr << "Save should succeed well within the timeout\n";
        return 1;
    }
    if (fs::exists(fs::path(file.string() + ".tmp"))) {
        std::cerr << "Temporary file must be renamed away\n";
        return 1;
    }
    const auto text = readAll(file);
    if (text.find("\"last_state\": \"stock\"") == std::string::npos
        || text.find("\"kline_type\": \"5m\"") == std::string::npos) {
        std::cerr << "Unexpected workspace file content:\n" << text;
        return 1;
    }

    auto loaded = store.load();
    if (!loaded || loaded->navigation != nav || loaded->savedAtUnix <= 0 || loaded->version != 1) {
        std::cerr << "Reloaded workspace differs from the saved one\n";
        return 1;
    }

    // Default state survives the round trip too.
    {
        WorkspaceSnapshot empty;
        if (!store.save(empty, 2000ms) || !store.load() || store.load()->navigation != NavigationState{}) {
            std::cerr << "Default navigation state should round trip\n";
            return 1;
        }
    }

    // Stock view without a detail instrument falls back to the watch list.
    {
        auto doc = boost::json::parse(R"({"version":1,"last_state":"stock","stock_detail_counter":null})");
        if (app::workspace_from_json(doc).navigation.view != app::View::Watchlist) {
            std::cerr << "Stock view without detail should fall back to the watch list\n";
            return 1;
        }
        bool rejected = false;
        try {
            app::workspace_from_json(boost::json::parse(R"({"version":1,"kline_type":"2h"})"));
        }
        catch (const domain::DecodeError&) {
            rejected = true;
        }
        if (!rejected) {
            std::cerr << "Unknown chart period must be rejected\n";
            return 1;
        }
    }

    // Unparsable and unsupported files are backed up and ignored without throwing.
    std::ofstream(file, std::ios::trunc) << "{ broken";
    if (store.load() || backupCount(dir.path) != 1 || fs::exists(file)) {
        std::cerr << "Corrupt workspace should be backed up and ignored\n";
        return 1;
    }
    std::ofstream(file, std::ios::trunc) << R"({"version": 9})";
    if (store.load() || backupCount(dir.path) != 2) {
        std::cerr << "Unsupported workspace version should be backed up and ignored\n";
        return 1;
    }

    // A directory that cannot be created makes save report failure.
    {
        std::ofstream(dir.path / "blocker") << "x";
        WorkspaceStore blocked(dir.path / "blocker" / "workspace.json");
        if (blocked.save(snapshot, 2000ms)) {
            std::cerr << "Save into an impossible path must report failure\n";
            return 1;
        }
    }

    return 0;
}
