#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

#include "domain/Types.h"

namespace app {

enum class View { Watchlist, Stock, Portfolio };

const char* view_label(View view);

struct WatchlistSort {
    std::uint8_t column{0};
    std::uint8_t order{0};
    bool descending{false};

    bool operator==(const WatchlistSort& other) const {
        return column == other.column && order == other.order && descending == other.descending;
    }
};

// What the user is looking at. Only changed through apply().
struct NavigationState {
    View view{View::Watchlist};
    std::optional<std::uint64_t> groupId;
    std::optional<domain::InstrumentId> selected;
    std::optional<domain::InstrumentId> detail;
    domain::ChartPeriod period{domain::ChartPeriod::Day};
    std::size_t chartOffset{0};
    WatchlistSort sort;
    bool watchlistHidden{false};
    bool logPanelVisible{false};

    bool operator==(const NavigationState& other) const;
    bool operator!=(const NavigationState& other) const { return !(*this == other); }
};

namespace nav {

struct SelectGroup {
    std::optional<std::uint64_t> groupId;
};

struct SelectInstrument {
    domain::InstrumentId instrument;
};

// Opens the detail view for instrument, or for the current selection when empty.
struct OpenDetail {
    std::optional<domain::InstrumentId> instrument;
};

struct CloseDetail {};

struct SwitchView {
    View view{View::Watchlist};
};

struct SetChartPeriod {
    domain::ChartPeriod period{domain::ChartPeriod::Day};
};

// Positive delta scrolls back in time.
struct ScrollChart {
    long delta{0};
};

struct ToggleWatchlist {};
struct ToggleLogPanel {};

struct SetSort {
    WatchlistSort sort;
};

using Command = std::variant<SelectGroup, SelectInstrument, OpenDetail, CloseDetail, SwitchView, SetChartPeriod,
                             ScrollChart, ToggleWatchlist, ToggleLogPanel, SetSort>;

}  // namespace nav

NavigationState apply(const NavigationState& state, const nav::Command& command);

}  // namespace app
