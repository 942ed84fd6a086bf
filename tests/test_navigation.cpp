#include <iostream>
#include <string>

#include "app/Navigation.h"

using app::NavigationState;
using app::View;
using domain::InstrumentId;

namespace nav = app::nav;

int main() {
    const NavigationState initial;

    {
        auto state = app::apply(initial, nav::OpenDetail{});
        if (state != initial) {
            std::cerr << "Opening the detail view without a selection must be a no-op\n";
            return 1;
        }
        state = app::apply(initial, nav::SwitchView{View::Stock});
        if (state.view != View::Watchlist) {
            std::cerr << "Switching to the stock view without a detail instrument must be ignored\n";
            return 1;
        }
    }

    {
        auto state = app::apply(initial, nav::SelectInstrument{InstrumentId("700.HK")});
        state = app::apply(state, nav::OpenDetail{});
        if (state.view != View::Stock || !state.detail || state.detail->str() != "700.HK") {
            std::cerr << "Opening the detail view should use the current selection\n";
            return 1;
        }

        state = app::apply(state, nav::ScrollChart{5});
        state = app::apply(state, nav::ScrollChart{-2});
        if (state.chartOffset != 3) {
            std::cerr << "Chart offset should follow scroll deltas, got " << state.chartOffset << '\n';
            return 1;
        }
        state = app::apply(state, nav::ScrollChart{-10});
        if (state.chartOffset != 0) {
            std::cerr << "Chart offset must never go below zero\n";
            return 1;
        }

        state = app::apply(state, nav::ScrollChart{4});
        auto samePeriod = app::apply(state, nav::SetChartPeriod{state.period});
        if (samePeriod.chartOffset != 4) {
            std::cerr << "Re-selecting the same period should keep the scroll position\n";
            return 1;
        }
        state = app::apply(state, nav::SetChartPeriod{domain::ChartPeriod::Min5});
        if (state.period != domain::ChartPeriod::Min5 || state.chartOffset != 0) {
            std::cerr << "Changing the period should reset the scroll position\n";
            return 1;
        }

        state = app::apply(state, nav::ScrollChart{2});
        state = app::apply(state, nav::OpenDetail{InstrumentId("AAPL.US")});
        if (state.chartOffset != 0 || state.selected != InstrumentId("AAPL.US")) {
            std::cerr << "Opening another instrument should select it and reset the scroll position\n";
            return 1;
        }

        state = app::apply(state, nav::SwitchView{View::Portfolio});
        state = app::apply(state, nav::SwitchView{View::Stock});
        if (state.view != View::Stock) {
            std::cerr << "Returning to the stock view should work while a detail instrument is set\n";
            return 1;
        }

        state = app::apply(state, nav::CloseDetail{});
        if (state.view != View::Watchlist || state.detail || state.selected != InstrumentId("AAPL.US")) {
            std::cerr << "Closing the detail view should return to the watchlist and keep the selection\n";
            return 1;
        }
    }

    {
        auto state = app::apply(initial, nav::SelectInstrument{InstrumentId("700.HK")});
        state = app::apply(state, nav::SelectGroup{std::uint64_t{7}});
        if (state.groupId != std::uint64_t{7} || state.selected) {
            std::cerr << "Switching groups should clear the selection\n";
            return 1;
        }
        state = app::apply(state, nav::SelectInstrument{InstrumentId("")});
        if (state.selected) {
            std::cerr << "Selecting an empty instrument must be ignored\n";
            return 1;
        }

        app::WatchlistSort sort;
        sort.column = 2;
        sort.order = 1;
        sort.descending = true;
        state = app::apply(state, nav::SetSort{sort});
        state = app::apply(state, nav::ToggleWatchlist{});
        state = app::apply(state, nav::ToggleLogPanel{});
        if (!(state.sort == sort) || !state.watchlistHidden || !state.logPanelVisible) {
            std::cerr << "Sort and panel toggles should be recorded\n";
            return 1;
        }
        state = app::apply(state, nav::ToggleWatchlist{});
        if (state.watchlistHidden) {
            std::cerr << "Toggling the watchlist twice should show it again\n";
            return 1;
        }
    }

    {
        if (std::string(app::view_label(View::Stock)) != "stock"
            || std::string(app::view_label(View::Portfolio)) != "portfolio") {
            std::cerr << "Unexpected view labels\n";
            return 1;
        }
    }

    std::cout << "Navigation tests passed\n";
    return 0;
}
