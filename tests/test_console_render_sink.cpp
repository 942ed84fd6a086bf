#include <iostream>
#include <sstream>
#include <string>

#include "core/MarketStateStore.h"
#include "ui/ConsoleRenderSink.h"

using core::Region;
using domain::InstrumentId;

namespace {

domain::Quote makeQuote(double last, double prevClose, std::uint64_t volume, domain::TimestampMs ts) {
    domain::Quote q;
    q.lastPrice = last;
    q.prevClose = prevClose;
    q.open = prevClose;
    q.high = last;
    q.low = prevClose;
    q.volume = volume;
    q.timestamp = ts;
    q.tradeStatus = "normal";
    return q;
}

bool before(const std::string& text, const std::string& first, const std::string& second) {
    const auto a = text.find(first);
    const auto b = text.find(second);
    return a != std::string::npos && b != std::string::npos && a < b;
}

}  // namespace

int main() {
    if (InstrumentId("700.HK").market() != "HK" || InstrumentId("BRK.B.US").market() != "US"
        || !InstrumentId("HSI").market().empty() || InstrumentId("BRK.B.US").code() != "BRK.B") {
        std::cerr << "Instrument ids should split into code and market at the last dot\n";
        return 1;
    }

    core::MarketStateStore store;
    store.updateQuote(InstrumentId("700.HK"), makeQuote(321.5, 300.0, 1200, 1000));
    store.updateQuote(InstrumentId("AAPL.US"), makeQuote(190.0, 200.0, 50000, 1000));

    ui::RenderContext context;
    context.store = &store;
    context.watchlist = {InstrumentId("TSLA.US"), InstrumentId("AAPL.US"), InstrumentId("700.HK")};
    context.indexes = {InstrumentId("HSI.HK")};
    context.navigation.selected = InstrumentId("700.HK");
    context.stream.state = domain::StreamState::Open;
    context.stream.lastFrameMs = 10000;
    context.nowMs = 15000;
    context.stats.renders = 3;
    context.stats.skipPercent = 25.0;

    std::ostringstream out;
    ui::ConsoleRenderSink::Options options;
    options.ansi = false;
    ui::ConsoleRenderSink sink(out, options);

    {
        sink.render(core::DirtyRegionSet::all(), context);
        const auto screen = out.str();
        if (screen.find('\x1b') != std::string::npos) {
            std::cerr << "Plain mode must not write escape sequences\n";
            return 1;
        }
        const auto watchlist = sink.section(Region::WatchList);
        if (!before(watchlist, "AAPL.US", "700.HK") || !before(watchlist, "TSLA.US", "AAPL.US")) {
            std::cerr << "Default sort should keep the configured order:\n" << watchlist;
            return 1;
        }
        if (watchlist.find(">700.HK") == std::string::npos || watchlist.find("+7.17%") == std::string::npos
            || watchlist.find("50.0K") == std::string::npos) {
            std::cerr << "Watchlist rows should mark the selection and format change and volume:\n" << watchlist;
            return 1;
        }
        if (sink.section(Region::Indexes).find("HSI --") == std::string::npos) {
            std::cerr << "Index without a quote should show a placeholder\n";
            return 1;
        }
        const auto status = sink.section(Region::StatusBar);
        if (status != "stream open | last update 5s ago | frames 3 skipped 25.0%\n") {
            std::cerr << "Unexpected status bar: " << status;
            return 1;
        }
        if (screen.find("SYMBOL") == std::string::npos || screen.find("== ") != std::string::npos) {
            std::cerr << "Watchlist view should not show the detail panel\n";
            return 1;
        }
    }

    {
        context.navigation.sort.column = 2;
        context.navigation.sort.descending = true;
        sink.render({Region::WatchList}, context);
        const auto watchlist = sink.section(Region::WatchList);
        if (!before(watchlist, "700.HK", "AAPL.US") || !before(watchlist, "AAPL.US", "TSLA.US")) {
            std::cerr << "Descending change sort should put quoteless rows last:\n" << watchlist;
            return 1;
        }
    }

    {
        const auto cached = sink.section(Region::WatchList);
        store.updateQuote(InstrumentId("700.HK"), makeQuote(330.0, 300.0, 1300, 2000));
        context.stream.fatalReason = "peer gone";
        sink.render({Region::StatusBar}, context);
        if (sink.section(Region::WatchList) != cached) {
            std::cerr << "Regions that are not dirty must not be rebuilt\n";
            return 1;
        }
        if (sink.section(Region::StatusBar).find("| peer gone |") == std::string::npos) {
            std::cerr << "Status bar should show the fatal reason\n";
            return 1;
        }
    }

    {
        context.navigation.view = app::View::Stock;
        context.navigation.detail = InstrumentId("9988.HK");
        context.navigation.chartOffset = 4;
        context.navigation.logPanelVisible = true;
        context.messages = {"rule #1 added"};
        out.str("");
        sink.render(core::DirtyRegionSet::all(), context);
        const auto screen = out.str();
        if (screen.find("== 9988.HK  [1d]  HK market  offset 4") == std::string::npos
            || screen.find("quote: waiting for data") == std::string::npos) {
            std::cerr << "Stock view should show the detail header and a waiting quote:\n" << screen;
            return 1;
        }
        if (screen.find("SYMBOL") != std::string::npos) {
            std::cerr << "Stock view should not show the watchlist\n";
            return 1;
        }
        if (!before(screen, "no alerts fired yet", "rule #1 added") || !before(screen, "rule #1 added", "stream ")) {
            std::cerr << "Popup should sit above the status bar:\n" << screen;
            return 1;
        }
    }

    {
        app::AlertEvent event;
        event.ruleId = 2;
        event.instrument = InstrumentId("700.HK");
        event.kind = app::AlertKind::PriceAbove;
        event.threshold = 320.0;
        event.value = 321.5;
        event.timestampMs = 1000;
        context.alerts = {event};
        context.messages.clear();
        sink.render({Region::Popup}, context);
        const auto popup = sink.section(Region::Popup);
        if (popup != "ALERT #2 700.HK price_above 320.000 -> 321.500 at 00:00:01\n") {
            std::cerr << "Unexpected alert line: " << popup;
            return 1;
        }
    }

    if (sink.frames() != 5) {
        std::cerr << "Expected five frames, got " << sink.frames() << '\n';
        return 1;
    }

    std::cout << "ConsoleRenderSink tests passed\n";
    return 0;
}
