#include "app/Navigation.h"

#include <type_traits>

namespace app {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

const char* view_label(View view) {
    switch (view) {
    case View::Watchlist:
        return "watchlist";
    case View::Stock:
        return "stock";
    case View::Portfolio:
        return "portfolio";
    }
    return "watchlist";
}

bool NavigationState::operator==(const NavigationState& other) const {
    return view == other.view && groupId == other.groupId && selected == other.selected
        && detail == other.detail && period == other.period && chartOffset == other.chartOffset
        && sort == other.sort && watchlistHidden == other.watchlistHidden
        && logPanelVisible == other.logPanelVisible;
}

NavigationState apply(const NavigationState& state, const nav::Command& command) {
    NavigationState next = state;
    std::visit(Overloaded{
                   [&](const nav::SelectGroup& cmd) {
                       if (next.groupId != cmd.groupId) {
                           next.groupId = cmd.groupId;
                           next.selected.reset();
                       }
                   },
                   [&](const nav::SelectInstrument& cmd) {
                       if (!cmd.instrument.empty()) {
                           next.selected = cmd.instrument;
                       }
                   },
                   [&](const nav::OpenDetail& cmd) {
                       auto target = cmd.instrument ? cmd.instrument : next.selected;
                       if (!target || target->empty()) {
                           return;
                       }
                       if (next.detail != target) {
                           next.chartOffset = 0;
                       }
                       next.detail = target;
                       next.selected = target;
                       next.view = View::Stock;
                   },
                   [&](const nav::CloseDetail&) {
                       next.detail.reset();
                       next.chartOffset = 0;
                       next.view = View::Watchlist;
                   },
                   [&](const nav::SwitchView& cmd) {
                       if (cmd.view == View::Stock && !next.detail) {
                           return;
                       }
                       next.view = cmd.view;
                   },
                   [&](const nav::SetChartPeriod& cmd) {
                       if (next.period != cmd.period) {
                           next.period = cmd.period;
                           next.chartOffset = 0;
                       }
                   },
                   [&](const nav::ScrollChart& cmd) {
                       if (cmd.delta < 0 && static_cast<std::size_t>(-cmd.delta) > next.chartOffset) {
                           next.chartOffset = 0;
                       }
                       else {
                           next.chartOffset = static_cast<std::size_t>(static_cast<long>(next.chartOffset) + cmd.delta);
                       }
                   },
                   [&](const nav::ToggleWatchlist&) { next.watchlistHidden = !next.watchlistHidden; },
                   [&](const nav::ToggleLogPanel&) { next.logPanelVisible = !next.logPanelVisible; },
                   [&](const nav::SetSort& cmd) { next.sort = cmd.sort; },
               },
               command);
    return next;
}

}  // namespace app
