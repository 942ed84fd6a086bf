#include "app/WorkspaceStore.h"

#include <chrono>
#include <exception>
#include <future>
#include <string>
#include <thread>
#include <utility>

#include <boost/json.hpp>

#include "common/JsonUtil.hpp"
#include "domain/Errors.h"
#include "infra/storage/JsonFileStore.h"
#include "logging/Log.h"

namespace app {
namespace {

namespace json = boost::json;
namespace fields = tw::common::json;

constexpr logging::LogCategory kLogCategory = logging::LogCategory::WORKSPACE;

View parseView(const std::string& label) {
    if (label == "watchlist") {
        return View::Watchlist;
    }
    if (label == "stock") {
        return View::Stock;
    }
    if (label == "portfolio") {
        return View::Portfolio;
    }
    throw domain::DecodeError("last_state: unknown view '" + label + "'");
}

json::value optionalInstrument(const std::optional<domain::InstrumentId>& id) {
    if (!id) {
        return nullptr;
    }
    return json::value(id->str());
}

std::optional<domain::InstrumentId> readInstrument(const json::object& obj, std::string_view key) {
    auto text = fields::optional_string(obj, key);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return domain::InstrumentId(*text);
}

std::uint8_t readSmall(const json::value& value, std::string_view field) {
    const auto raw = fields::to_int(value, field);
    if (raw < 0 || raw > 255) {
        throw domain::DecodeError(std::string(field) + ": out of range");
    }
    return static_cast<std::uint8_t>(raw);
}

}  // namespace

json::value workspace_to_json(const WorkspaceSnapshot& snapshot) {
    const auto& nav = snapshot.navigation;
    json::object obj;
    obj["version"] = snapshot.version;
    obj["saved_at_unix"] = snapshot.savedAtUnix;
    obj["last_state"] = view_label(nav.view);
    if (nav.groupId) {
        obj["watchlist_group_id"] = *nav.groupId;
    }
    else {
        obj["watchlist_group_id"] = nullptr;
    }
    obj["watchlist_sort_by"] = json::array{nav.sort.column, nav.sort.order, nav.sort.descending};
    obj["watchlist_hidden"] = nav.watchlistHidden;
    obj["selected_counter"] = optionalInstrument(nav.selected);
    obj["stock_detail_counter"] = optionalInstrument(nav.detail);
    obj["kline_type"] = domain::chart_period_label(nav.period);
    obj["kline_index"] = static_cast<std::uint64_t>(nav.chartOffset);
    obj["log_panel_visible"] = nav.logPanelVisible;
    return obj;
}

WorkspaceSnapshot workspace_from_json(const json::value& document) {
    const auto& obj = fields::as_object(document, "workspace");

    WorkspaceSnapshot snapshot;
    snapshot.version = static_cast<int>(fields::int_field(obj, "version"));
    if (snapshot.version != WorkspaceSnapshot::kVersion) {
        throw domain::DecodeError("workspace: unsupported version " + std::to_string(snapshot.version));
    }
    snapshot.savedAtUnix = fields::optional_int(obj, "saved_at_unix").value_or(0);

    auto& nav = snapshot.navigation;
    if (auto view = fields::optional_string(obj, "last_state")) {
        nav.view = parseView(*view);
    }
    if (auto group = fields::optional_int(obj, "watchlist_group_id")) {
        if (*group < 0) {
            throw domain::DecodeError("watchlist_group_id: negative");
        }
        nav.groupId = static_cast<std::uint64_t>(*group);
    }
    if (const auto* sort = obj.if_contains("watchlist_sort_by"); sort != nullptr && !sort->is_null()) {
        if (!sort->is_array() || sort->get_array().size() != 3 || !sort->get_array()[2].is_bool()) {
            throw domain::DecodeError("watchlist_sort_by: expected [column, order, descending]");
        }
        const auto& arr = sort->get_array();
        nav.sort.column = readSmall(arr[0], "watchlist_sort_by[0]");
        nav.sort.order = readSmall(arr[1], "watchlist_sort_by[1]");
        nav.sort.descending = arr[2].get_bool();
    }
    nav.watchlistHidden = fields::optional_bool(obj, "watchlist_hidden").value_or(false);
    nav.selected = readInstrument(obj, "selected_counter");
    nav.detail = readInstrument(obj, "stock_detail_counter");
    if (auto period = fields::optional_string(obj, "kline_type")) {
        auto parsed = domain::chart_period_from_label(*period);
        if (!parsed) {
            throw domain::DecodeError("kline_type: unknown period '" + *period + "'");
        }
        nav.period = *parsed;
    }
    if (auto offset = fields::optional_int(obj, "kline_index")) {
        nav.chartOffset = *offset < 0 ? 0U : static_cast<std::size_t>(*offset);
    }
    nav.logPanelVisible = fields::optional_bool(obj, "log_panel_visible").value_or(false);

    if (nav.view == View::Stock && !nav.detail) {
        nav.view = View::Watchlist;
    }
    return snapshot;
}

WorkspaceStore::WorkspaceStore(std::filesystem::path file)
    : file_(std::make_shared<infra::storage::JsonFileStore>(std::move(file))) {}

WorkspaceStore::~WorkspaceStore() = default;

std::optional<WorkspaceSnapshot> WorkspaceStore::load() {
    try {
        auto document = file_->load();
        if (!document) {
            LOG_INFO(kLogCategory, "no workspace at %s, using defaults", file_->path().string().c_str());
            return std::nullopt;
        }
        auto snapshot = workspace_from_json(*document);
        LOG_INFO(kLogCategory, "workspace restored from %s (view=%s period=%s)", file_->path().string().c_str(),
                 view_label(snapshot.navigation.view), domain::chart_period_label(snapshot.navigation.period));
        return snapshot;
    }
    catch (const domain::DecodeError& ex) {
        LOG_WARN(kLogCategory, "workspace %s is corrupt: %s", file_->path().string().c_str(), ex.what());
        try {
            file_->backupCorrupt();
        }
        catch (const std::exception& backupError) {
            LOG_ERROR(kLogCategory, "workspace backup failed: %s", backupError.what());
        }
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "workspace %s unreadable: %s", file_->path().string().c_str(), ex.what());
    }
    return std::nullopt;
}

bool WorkspaceStore::save(const WorkspaceSnapshot& snapshot, std::chrono::milliseconds timeout) {
    WorkspaceSnapshot stamped = snapshot;
    stamped.version = WorkspaceSnapshot::kVersion;
    stamped.savedAtUnix = std::chrono::duration_cast<std::chrono::seconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
    auto document = workspace_to_json(stamped);

    auto promise = std::make_shared<std::promise<void>>();
    auto done = promise->get_future();
    std::thread([file = file_, document = std::move(document), promise]() {
        try {
            file->save(document);
            promise->set_value();
        }
        catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (done.wait_for(timeout) != std::future_status::ready) {
        LOG_WARN(kLogCategory, "workspace save exceeded %lld ms, continuing shutdown",
                 static_cast<long long>(timeout.count()));
        return false;
    }
    try {
        done.get();
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "workspace save failed: %s", ex.what());
        return false;
    }
    LOG_INFO(kLogCategory, "workspace saved to %s", file_->path().string().c_str());
    return true;
}

}  // namespace app
