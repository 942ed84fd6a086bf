#include "ui/ConsoleRenderSink.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/MarketStateStore.h"

namespace ui {
namespace {

constexpr const char* kClearScreen = "\x1b[H\x1b[2J";
constexpr std::size_t kChartWidth = 32;

std::tm toUtcTm(long long timestampMs) {
    const std::time_t seconds = static_cast<std::time_t>(timestampMs / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return tm;
}

std::string formatTime(long long timestampMs, const char* format) {
    if (timestampMs <= 0) {
        return "--";
    }
    std::tm tm = toUtcTm(timestampMs);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string formatPrice(double value, int decimals = 3) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    oss << std::setprecision(std::clamp(decimals, 0, 8)) << value;
    return oss.str();
}

std::string formatPercent(const std::optional<double>& percent) {
    if (!percent) {
        return "--";
    }
    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    oss << std::showpos << std::setprecision(2) << *percent << '%';
    return oss.str();
}

std::string formatVolume(std::uint64_t volume) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    if (volume >= 1000000000ULL) {
        oss << std::setprecision(2) << static_cast<double>(volume) / 1e9 << 'B';
    }
    else if (volume >= 1000000ULL) {
        oss << std::setprecision(2) << static_cast<double>(volume) / 1e6 << 'M';
    }
    else if (volume >= 10000ULL) {
        oss << std::setprecision(1) << static_cast<double>(volume) / 1e3 << 'K';
    }
    else {
        oss << volume;
    }
    return oss.str();
}

std::string formatAge(domain::TimestampMs nowMs, domain::TimestampMs thenMs) {
    if (thenMs <= 0) {
        return "never";
    }
    const long long seconds = std::max<long long>(0, (nowMs - thenMs) / 1000);
    std::ostringstream oss;
    if (seconds < 60) {
        oss << seconds << "s ago";
    }
    else if (seconds < 3600) {
        oss << seconds / 60 << "m ago";
    }
    else {
        oss << seconds / 3600 << "h ago";
    }
    return oss.str();
}

const char* directionMark(domain::TradeDirection direction) {
    switch (direction) {
    case domain::TradeDirection::Up:
        return "+";
    case domain::TradeDirection::Down:
        return "-";
    case domain::TradeDirection::Neutral:
        break;
    }
    return " ";
}

std::optional<domain::MarketSnapshot> snapshotOf(const RenderContext& context,
                                                 const std::optional<domain::InstrumentId>& id) {
    if (!context.store || !id) {
        return std::nullopt;
    }
    return context.store->get(*id);
}

// Column 0 keeps the configured order; 1 last price, 2 change percent, 3 volume, 4 symbol.
// Rows without a quote stay at the bottom.
std::vector<domain::InstrumentId> sortedWatchlist(
    const RenderContext& context, const std::unordered_map<domain::InstrumentId, domain::MarketSnapshot>& snapshots) {
    std::vector<domain::InstrumentId> ids = context.watchlist;
    const auto& sort = context.navigation.sort;
    if (sort.column == 0 || sort.column > 4) {
        if (sort.descending) {
            std::reverse(ids.begin(), ids.end());
        }
        return ids;
    }
    auto keyOf = [&](const domain::InstrumentId& id) -> std::optional<double> {
        auto it = snapshots.find(id);
        if (it == snapshots.end() || !it->second.quote) {
            return std::nullopt;
        }
        const auto& quote = *it->second.quote;
        switch (sort.column) {
        case 1:
            return quote.lastPrice;
        case 2:
            return quote.changePercent();
        case 3:
            return static_cast<double>(quote.volume);
        default:
            return 0.0;
        }
    };
    std::stable_sort(ids.begin(), ids.end(), [&](const domain::InstrumentId& a, const domain::InstrumentId& b) {
        if (sort.column == 4) {
            return sort.descending ? b < a : a < b;
        }
        const auto ka = keyOf(a);
        const auto kb = keyOf(b);
        if (!ka || !kb) {
            return ka.has_value() && !kb.has_value();
        }
        return sort.descending ? *ka > *kb : *ka < *kb;
    });
    return ids;
}

// Regions written for the current view, top to bottom.
std::vector<core::Region> layoutFor(const app::NavigationState& navigation) {
    using core::Region;
    std::vector<Region> layout{Region::Indexes, Region::Navigation};
    switch (navigation.view) {
    case app::View::Watchlist:
        if (!navigation.watchlistHidden) {
            layout.push_back(Region::WatchList);
        }
        break;
    case app::View::Stock:
        layout.insert(layout.end(), {Region::Detail, Region::Quote, Region::Depth, Region::Trades, Region::Chart});
        break;
    case app::View::Portfolio:
        layout.push_back(Region::Portfolio);
        break;
    }
    layout.push_back(Region::Popup);
    layout.push_back(Region::StatusBar);
    return layout;
}

}  // namespace

ConsoleRenderSink::ConsoleRenderSink(std::ostream& out) : ConsoleRenderSink(out, Options{}) {}

ConsoleRenderSink::ConsoleRenderSink(std::ostream& out, Options options) : out_(out), options_(options) {}

void ConsoleRenderSink::render(const core::DirtyRegionSet& regions, const RenderContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < core::DirtyRegionSet::kRegionCount; ++i) {
        const auto region = static_cast<core::Region>(i);
        if (regions.contains(region)) {
            sections_[i] = build_(region, context);
        }
    }
    out_ << compose_(context);
    out_.flush();
    ++frames_;
}

std::uint64_t ConsoleRenderSink::frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
}

std::string ConsoleRenderSink::section(core::Region region) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sections_[static_cast<std::size_t>(region)];
}

std::string ConsoleRenderSink::compose_(const RenderContext& context) const {
    std::string screen;
    if (options_.ansi) {
        screen.append(kClearScreen);
    }
    for (auto region : layoutFor(context.navigation)) {
        const auto& text = sections_[static_cast<std::size_t>(region)];
        if (text.empty()) {
            continue;
        }
        screen.append(text);
        if (text.back() != '\n') {
            screen.push_back('\n');
        }
    }
    return screen;
}

std::string ConsoleRenderSink::build_(core::Region region, const RenderContext& context) const {
    switch (region) {
    case core::Region::WatchList:
        return buildWatchList_(context);
    case core::Region::Indexes:
        return buildIndexes_(context);
    case core::Region::Detail: {
        const auto& nav = context.navigation;
        if (!nav.detail) {
            return {};
        }
        std::ostringstream oss;
        oss << "== " << nav.detail->str() << "  [" << domain::chart_period_label(nav.period) << "]";
        const auto market = nav.detail->market();
        if (!market.empty()) {
            oss << "  " << market << " market";
        }
        if (nav.chartOffset > 0) {
            oss << "  offset " << nav.chartOffset;
        }
        oss << '\n';
        return oss.str();
    }
    case core::Region::Quote:
        return buildQuote_(context);
    case core::Region::Depth:
        return buildDepth_(context);
    case core::Region::Trades:
        return buildTrades_(context);
    case core::Region::Chart:
        return buildChart_(context);
    case core::Region::Portfolio:
        return buildPortfolio_(context);
    case core::Region::Navigation:
        return buildNavigation_(context);
    case core::Region::StatusBar:
        return buildStatusBar_(context);
    case core::Region::Popup:
        return buildPopup_(context);
    case core::Region::Count_:
        break;
    }
    return {};
}

std::string ConsoleRenderSink::buildWatchList_(const RenderContext& context) const {
    std::ostringstream oss;
    oss << std::left << std::setw(12) << "SYMBOL" << std::right << std::setw(12) << "LAST" << std::setw(11) << "CHG%"
        << std::setw(10) << "VOLUME" << '\n';
    if (!context.store) {
        return oss.str();
    }
    const auto snapshots = context.store->getMany(context.watchlist);
    for (const auto& id : sortedWatchlist(context, snapshots)) {
        const bool selected = context.navigation.selected && *context.navigation.selected == id;
        oss << (selected ? '>' : ' ') << std::left << std::setw(11) << id.str() << std::right;
        auto it = snapshots.find(id);
        if (it == snapshots.end() || !it->second.quote) {
            oss << std::setw(12) << "--" << std::setw(11) << "--" << std::setw(10) << "--" << '\n';
            continue;
        }
        const auto& quote = *it->second.quote;
        oss << std::setw(12) << formatPrice(quote.lastPrice) << std::setw(11) << formatPercent(quote.changePercent())
            << std::setw(10) << formatVolume(quote.volume) << '\n';
    }
    return oss.str();
}

std::string ConsoleRenderSink::buildIndexes_(const RenderContext& context) const {
    if (!context.store || context.indexes.empty()) {
        return {};
    }
    const auto snapshots = context.store->getMany(context.indexes);
    std::ostringstream oss;
    bool first = true;
    for (const auto& id : context.indexes) {
        if (!first) {
            oss << " | ";
        }
        first = false;
        oss << id.code() << ' ';
        auto it = snapshots.find(id);
        if (it == snapshots.end() || !it->second.quote) {
            oss << "--";
            continue;
        }
        oss << formatPrice(it->second.quote->lastPrice, 2) << ' ' << formatPercent(it->second.quote->changePercent());
    }
    oss << '\n';
    return oss.str();
}

std::string ConsoleRenderSink::buildQuote_(const RenderContext& context) const {
    auto snapshot = snapshotOf(context, context.navigation.detail);
    if (!snapshot || !snapshot->quote) {
        return "quote: waiting for data\n";
    }
    const auto& q = *snapshot->quote;
    std::ostringstream oss;
    oss << "last " << formatPrice(q.lastPrice) << "  chg " << formatPrice(q.change()) << " ("
        << formatPercent(q.changePercent()) << ")  status " << (q.tradeStatus.empty() ? "-" : q.tradeStatus) << '\n'
        << "open " << formatPrice(q.open) << "  high " << formatPrice(q.high) << "  low " << formatPrice(q.low)
        << "  prev " << formatPrice(q.prevClose) << '\n'
        << "vol " << formatVolume(q.volume) << "  turnover " << formatPrice(q.turnover, 0) << "  at "
        << formatTime(q.timestamp, "%H:%M:%S") << '\n';
    return oss.str();
}

std::string ConsoleRenderSink::buildDepth_(const RenderContext& context) const {
    auto snapshot = snapshotOf(context, context.navigation.detail);
    if (!snapshot || !snapshot->depth) {
        return {};
    }
    const auto& book = *snapshot->depth;
    std::ostringstream oss;
    oss << std::setw(24) << "BID" << " | " << "ASK" << '\n';
    const std::size_t rows = std::min(options_.depthLevels, std::max(book.bids.size(), book.asks.size()));
    for (std::size_t i = 0; i < rows; ++i) {
        if (i < book.bids.size()) {
            oss << std::setw(12) << formatVolume(book.bids[i].volume) << std::setw(12) << formatPrice(book.bids[i].price);
        }
        else {
            oss << std::setw(24) << "";
        }
        oss << " | ";
        if (i < book.asks.size()) {
            oss << std::left << std::setw(12) << formatPrice(book.asks[i].price) << formatVolume(book.asks[i].volume)
                << std::right;
        }
        oss << '\n';
    }
    return oss.str();
}

std::string ConsoleRenderSink::buildTrades_(const RenderContext& context) const {
    auto snapshot = snapshotOf(context, context.navigation.detail);
    if (!snapshot || !snapshot->trades || snapshot->trades->trades.empty()) {
        return {};
    }
    const auto& trades = snapshot->trades->trades;
    std::ostringstream oss;
    oss << "trades\n";
    const std::size_t rows = std::min(options_.tradeRows, trades.size());
    for (std::size_t i = 0; i < rows; ++i) {
        const auto& trade = trades[trades.size() - 1 - i];
        oss << "  " << formatTime(trade.timestamp, "%H:%M:%S") << ' ' << directionMark(trade.direction)
            << std::setw(12) << formatPrice(trade.price) << std::setw(10) << formatVolume(trade.volume) << '\n';
    }
    return oss.str();
}

std::string ConsoleRenderSink::buildChart_(const RenderContext& context) const {
    auto snapshot = snapshotOf(context, context.navigation.detail);
    if (!snapshot || !snapshot->candles || snapshot->candles->period != context.navigation.period) {
        return std::string{"chart "} + domain::chart_period_label(context.navigation.period) + ": no bars\n";
    }
    const auto& bars = snapshot->candles->bars;
    if (bars.empty()) {
        return "chart: no bars\n";
    }
    const std::size_t offset = std::min(context.navigation.chartOffset, bars.size() - 1);
    const std::size_t end = bars.size() - offset;
    const std::size_t begin = end > options_.chartBars ? end - options_.chartBars : 0;

    double low = bars[begin].low;
    double high = bars[begin].high;
    for (std::size_t i = begin; i < end; ++i) {
        low = std::min(low, bars[i].low);
        high = std::max(high, bars[i].high);
    }
    const double span = high - low;
    const char* timeFormat = context.navigation.period >= domain::ChartPeriod::Day ? "%Y-%m-%d" : "%m-%d %H:%M";

    std::ostringstream oss;
    oss << "chart " << domain::chart_period_label(context.navigation.period) << "  low " << formatPrice(low)
        << "  high " << formatPrice(high) << '\n';
    for (std::size_t i = begin; i < end; ++i) {
        const auto& bar = bars[i];
        const double ratio = span > 0.0 ? (bar.close - low) / span : 0.5;
        const auto width = static_cast<std::size_t>(std::lround(ratio * static_cast<double>(kChartWidth)));
        oss << "  " << std::left << std::setw(12) << formatTime(bar.openTime, timeFormat) << std::right
            << std::setw(11) << formatPrice(bar.close) << ' ' << (bar.close >= bar.open ? '+' : '-')
            << std::string(width, '#') << (bar.closed ? "" : " *") << '\n';
    }
    return oss.str();
}

std::string ConsoleRenderSink::buildPortfolio_(const RenderContext& context) const {
    if (!context.portfolio) {
        return "portfolio: not loaded\n";
    }
    const auto& portfolio = *context.portfolio;
    std::ostringstream oss;
    oss << std::left << std::setw(12) << "SYMBOL" << std::right << std::setw(10) << "QTY" << std::setw(12) << "COST"
        << std::setw(12) << "LAST" << std::setw(14) << "P/L" << '\n';
    std::vector<domain::InstrumentId> ids;
    ids.reserve(portfolio.positions.size());
    for (const auto& position : portfolio.positions) {
        ids.push_back(position.instrument);
    }
    const auto snapshots = context.store ? context.store->getMany(ids)
                                         : std::unordered_map<domain::InstrumentId, domain::MarketSnapshot>{};
    for (const auto& position : portfolio.positions) {
        oss << std::left << std::setw(12) << position.instrument.str() << std::right << std::setw(10)
            << formatPrice(position.quantity, 0) << std::setw(12) << formatPrice(position.costPrice);
        auto it = snapshots.find(position.instrument);
        if (it == snapshots.end() || !it->second.quote) {
            oss << std::setw(12) << "--" << std::setw(14) << "--" << '\n';
            continue;
        }
        const double last = it->second.quote->lastPrice;
        oss << std::setw(12) << formatPrice(last) << std::setw(14)
            << formatPrice((last - position.costPrice) * position.quantity, 2) << '\n';
    }
    oss << "cash " << formatPrice(portfolio.totalCash, 2) << ' ' << portfolio.currency << '\n';
    return oss.str();
}

std::string ConsoleRenderSink::buildNavigation_(const RenderContext& context) const {
    const auto& nav = context.navigation;
    std::ostringstream oss;
    oss << "[" << app::view_label(nav.view) << "]";
    if (nav.groupId) {
        oss << " group " << *nav.groupId;
    }
    if (nav.selected) {
        oss << " selected " << nav.selected->str();
    }
    if (nav.watchlistHidden) {
        oss << " (watchlist hidden)";
    }
    oss << '\n';
    return oss.str();
}

std::string ConsoleRenderSink::buildStatusBar_(const RenderContext& context) const {
    const auto& stream = context.stream;
    std::ostringstream oss;
    oss << "stream " << domain::stream_state_label(stream.state) << " | last update "
        << formatAge(context.nowMs, stream.lastFrameMs);
    if (!stream.fatalReason.empty()) {
        oss << " | " << stream.fatalReason;
    }
    oss.setf(std::ios::fixed, std::ios::floatfield);
    oss << " | frames " << context.stats.renders << " skipped " << std::setprecision(1) << context.stats.skipPercent
        << "%\n";
    return oss.str();
}

std::string ConsoleRenderSink::buildPopup_(const RenderContext& context) const {
    if (context.alerts.empty() && context.messages.empty() && !context.navigation.logPanelVisible) {
        return {};
    }
    std::ostringstream oss;
    if (context.navigation.logPanelVisible && context.alerts.empty()) {
        oss << "no alerts fired yet\n";
    }
    for (const auto& event : context.alerts) {
        oss << "ALERT #" << event.ruleId << ' ' << event.instrument.str() << ' ' << app::alert_kind_label(event.kind)
            << ' ' << formatPrice(event.threshold) << " -> " << formatPrice(event.value) << " at "
            << formatTime(event.timestampMs, "%H:%M:%S") << '\n';
    }
    for (const auto& message : context.messages) {
        oss << message;
        if (message.empty() || message.back() != '\n') {
            oss << '\n';
        }
    }
    return oss.str();
}

}  // namespace ui
