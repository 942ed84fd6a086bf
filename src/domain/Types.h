#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace domain {

using TimestampMs = long long;

// Exchange-qualified symbol such as "700.HK" or "AAPL.US". Compared as an exact string.
class InstrumentId {
public:
    InstrumentId() = default;
    explicit InstrumentId(std::string value) : value_(std::move(value)) {}

    const std::string& str() const noexcept { return value_; }
    bool empty() const noexcept { return value_.empty(); }

    std::string code() const {
        const auto dot = value_.rfind('.');
        return dot == std::string::npos ? value_ : value_.substr(0, dot);
    }

    // Exchange suffix ("HK" for "700.HK"); empty when the id has none.
    std::string market() const {
        const auto dot = value_.rfind('.');
        return dot == std::string::npos ? std::string{} : value_.substr(dot + 1);
    }

    bool operator==(const InstrumentId& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const InstrumentId& other) const noexcept { return value_ != other.value_; }
    bool operator<(const InstrumentId& other) const noexcept { return value_ < other.value_; }

private:
    std::string value_;
};

struct Quote {
    double lastPrice{0.0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double prevClose{0.0};
    std::uint64_t volume{0};
    double turnover{0.0};
    TimestampMs timestamp{0};
    std::string tradeStatus;

    double change() const noexcept { return lastPrice - prevClose; }

    std::optional<double> changePercent() const noexcept {
        if (prevClose <= 0.0) {
            return std::nullopt;
        }
        return (lastPrice - prevClose) / prevClose * 100.0;
    }
};

struct DepthLevel {
    int position{0};
    double price{0.0};
    std::uint64_t volume{0};
    std::uint32_t orderCount{0};
};

struct DepthBook {
    std::vector<DepthLevel> asks;
    std::vector<DepthLevel> bids;
    TimestampMs timestamp{0};
};

enum class TradeDirection { Neutral, Up, Down };

struct Trade {
    double price{0.0};
    std::uint64_t volume{0};
    TimestampMs timestamp{0};
    TradeDirection direction{TradeDirection::Neutral};
};

struct TradeTape {
    static constexpr std::size_t kMaxTrades = 50;

    std::vector<Trade> trades;  // oldest first
    TimestampMs timestamp{0};
};

enum class ChartPeriod { Min1, Min5, Min15, Min30, Hour1, Day, Week, Month, Year };

inline const char* chart_period_label(ChartPeriod period) {
    switch (period) {
    case ChartPeriod::Min1:
        return "1m";
    case ChartPeriod::Min5:
        return "5m";
    case ChartPeriod::Min15:
        return "15m";
    case ChartPeriod::Min30:
        return "30m";
    case ChartPeriod::Hour1:
        return "1h";
    case ChartPeriod::Day:
        return "1d";
    case ChartPeriod::Week:
        return "1w";
    case ChartPeriod::Month:
        return "1M";
    case ChartPeriod::Year:
        return "1y";
    }
    return "1d";
}

inline std::optional<ChartPeriod> chart_period_from_label(std::string_view label) {
    static constexpr ChartPeriod kAll[] = {ChartPeriod::Min1, ChartPeriod::Min5, ChartPeriod::Min15,
                                           ChartPeriod::Min30, ChartPeriod::Hour1, ChartPeriod::Day,
                                           ChartPeriod::Week, ChartPeriod::Month, ChartPeriod::Year};
    for (auto period : kAll) {
        if (label == chart_period_label(period)) {
            return period;
        }
    }
    return std::nullopt;
}

struct Candle {
    TimestampMs openTime{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    std::uint64_t volume{0};
    bool closed{false};
};

struct CandleFragment {
    static constexpr std::size_t kMaxBars = 240;

    ChartPeriod period{ChartPeriod::Day};
    std::vector<Candle> bars;  // oldest first

    TimestampMs timestamp() const noexcept { return bars.empty() ? 0 : bars.back().openTime; }
};

// Point-in-time copy of everything known about one instrument.
struct MarketSnapshot {
    InstrumentId instrument;
    std::optional<Quote> quote;
    std::optional<DepthBook> depth;
    std::optional<TradeTape> trades;
    std::optional<CandleFragment> candles;
    TimestampMs lastUpdated{0};
};

enum class ChangeCategory { Quote, Depth, Trades, Candle };

inline const char* change_category_label(ChangeCategory category) {
    switch (category) {
    case ChangeCategory::Quote:
        return "quote";
    case ChangeCategory::Depth:
        return "depth";
    case ChangeCategory::Trades:
        return "trades";
    case ChangeCategory::Candle:
        return "candle";
    }
    return "unknown";
}

struct ChangeNotification {
    InstrumentId instrument;
    ChangeCategory category{ChangeCategory::Quote};
    std::uint64_t sequence{0};
};

struct Position {
    InstrumentId instrument;
    std::string name;
    double quantity{0.0};
    double costPrice{0.0};
    std::string currency;
};

struct Portfolio {
    std::vector<Position> positions;
    double totalCash{0.0};
    std::string currency;
};

enum class StreamState { Connecting, Open, Closing, Closed };

inline const char* stream_state_label(StreamState state) {
    switch (state) {
    case StreamState::Connecting:
        return "connecting";
    case StreamState::Open:
        return "open";
    case StreamState::Closing:
        return "closing";
    case StreamState::Closed:
        return "closed";
    }
    return "unknown";
}

}  // namespace domain

namespace std {
template <>
struct hash<domain::InstrumentId> {
    std::size_t operator()(const domain::InstrumentId& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};
}  // namespace std
