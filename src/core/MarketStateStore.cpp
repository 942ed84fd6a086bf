#include "core/MarketStateStore.h"

#include <algorithm>
#include <functional>
#include <utility>

#include "logging/Log.h"

namespace core {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::STORE;

template <typename T>
void trimFront(std::vector<T>& values, std::size_t maxSize) {
    if (values.size() > maxSize) {
        values.erase(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(values.size() - maxSize));
    }
}

}  // namespace

MarketStateStore::Shard& MarketStateStore::shardFor_(const domain::InstrumentId& id) const {
    return shards_[std::hash<domain::InstrumentId>{}(id) % kShardCount];
}

std::shared_ptr<MarketStateStore::Entry> MarketStateStore::find_(const domain::InstrumentId& id) const {
    auto& shard = shardFor_(id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(id);
    return it == shard.entries.end() ? nullptr : it->second;
}

std::shared_ptr<MarketStateStore::Entry> MarketStateStore::findOrCreate_(const domain::InstrumentId& id) {
    if (auto existing = find_(id)) {
        return existing;
    }
    auto& shard = shardFor_(id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto [it, inserted] = shard.entries.try_emplace(id, nullptr);
    if (inserted) {
        it->second = std::make_shared<Entry>(id);
        LOG_DEBUG(kLogCategory, "new instrument %s", id.str().c_str());
    }
    return it->second;
}

domain::ChangeNotification MarketStateStore::notify_(Entry& entry, domain::ChangeCategory category,
                                                     domain::TimestampMs ts) {
    auto prev = entry.lastUpdated.load(std::memory_order_relaxed);
    while (ts > prev && !entry.lastUpdated.compare_exchange_weak(prev, ts, std::memory_order_relaxed)) {
    }
    domain::ChangeNotification note;
    note.instrument = entry.id;
    note.category = category;
    note.sequence = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return note;
}

std::optional<domain::ChangeNotification> MarketStateStore::updateQuote(const domain::InstrumentId& id,
                                                                        domain::Quote quote) {
    auto entry = findOrCreate_(id);
    std::lock_guard<std::mutex> lock(entry->quote.writeMutex);
    const auto current = entry->quote.load();
    if (current && quote.timestamp < current->timestamp) {
        LOG_DEBUG(kLogCategory, "stale quote for %s ts=%lld < %lld", id.str().c_str(), quote.timestamp,
                  current->timestamp);
        return std::nullopt;
    }
    const auto ts = quote.timestamp;
    entry->quote.store(std::make_shared<const domain::Quote>(std::move(quote)));
    return notify_(*entry, domain::ChangeCategory::Quote, ts);
}

std::optional<domain::ChangeNotification> MarketStateStore::updateDepth(const domain::InstrumentId& id,
                                                                        domain::DepthBook depth) {
    auto entry = findOrCreate_(id);
    std::lock_guard<std::mutex> lock(entry->depth.writeMutex);
    const auto current = entry->depth.load();
    if (current && depth.timestamp < current->timestamp) {
        LOG_DEBUG(kLogCategory, "stale depth for %s ts=%lld < %lld", id.str().c_str(), depth.timestamp,
                  current->timestamp);
        return std::nullopt;
    }
    const auto ts = depth.timestamp;
    entry->depth.store(std::make_shared<const domain::DepthBook>(std::move(depth)));
    return notify_(*entry, domain::ChangeCategory::Depth, ts);
}

std::optional<domain::ChangeNotification> MarketStateStore::updateTrades(const domain::InstrumentId& id,
                                                                         const std::vector<domain::Trade>& trades) {
    auto entry = findOrCreate_(id);
    std::lock_guard<std::mutex> lock(entry->trades.writeMutex);
    const auto current = entry->trades.load();

    auto next = std::make_shared<domain::TradeTape>();
    if (current) {
        *next = *current;
    }
    std::size_t appended = 0;
    for (const auto& trade : trades) {
        if (trade.timestamp < next->timestamp) {
            continue;
        }
        next->trades.push_back(trade);
        next->timestamp = trade.timestamp;
        ++appended;
    }
    if (appended == 0) {
        LOG_DEBUG(kLogCategory, "no new trades for %s", id.str().c_str());
        return std::nullopt;
    }
    trimFront(next->trades, domain::TradeTape::kMaxTrades);

    const auto ts = next->timestamp;
    entry->trades.store(std::move(next));
    return notify_(*entry, domain::ChangeCategory::Trades, ts);
}

std::optional<domain::ChangeNotification> MarketStateStore::updateCandle(const domain::InstrumentId& id,
                                                                         domain::ChartPeriod period,
                                                                         const domain::Candle& bar) {
    auto entry = findOrCreate_(id);
    std::lock_guard<std::mutex> lock(entry->candles.writeMutex);
    const auto current = entry->candles.load();

    auto next = std::make_shared<domain::CandleFragment>();
    next->period = period;
    if (current) {
        if (current->period != period) {
            LOG_DEBUG(kLogCategory, "candle for %s period %s ignored, showing %s", id.str().c_str(),
                      domain::chart_period_label(period), domain::chart_period_label(current->period));
            return std::nullopt;
        }
        if (bar.openTime < current->timestamp()) {
            LOG_DEBUG(kLogCategory, "stale candle for %s open=%lld", id.str().c_str(), bar.openTime);
            return std::nullopt;
        }
        next->bars = current->bars;
    }

    if (!next->bars.empty() && next->bars.back().openTime == bar.openTime) {
        next->bars.back() = bar;
    }
    else {
        next->bars.push_back(bar);
        trimFront(next->bars, domain::CandleFragment::kMaxBars);
    }

    const auto ts = next->timestamp();
    entry->candles.store(std::move(next));
    return notify_(*entry, domain::ChangeCategory::Candle, ts);
}

std::optional<domain::ChangeNotification> MarketStateStore::replaceCandles(const domain::InstrumentId& id,
                                                                           domain::CandleFragment fragment) {
    auto entry = findOrCreate_(id);
    std::lock_guard<std::mutex> lock(entry->candles.writeMutex);
    const auto current = entry->candles.load();

    // Bars pushed while the history request was in flight stay on top of it.
    if (current && current->period == fragment.period) {
        for (const auto& bar : current->bars) {
            if (bar.openTime > fragment.timestamp()) {
                fragment.bars.push_back(bar);
            }
            else if (!fragment.bars.empty() && bar.openTime == fragment.bars.back().openTime) {
                fragment.bars.back() = bar;
            }
        }
    }
    trimFront(fragment.bars, domain::CandleFragment::kMaxBars);

    const auto ts = fragment.timestamp();
    entry->candles.store(std::make_shared<const domain::CandleFragment>(std::move(fragment)));
    return notify_(*entry, domain::ChangeCategory::Candle, ts);
}

domain::MarketSnapshot MarketStateStore::copyOf_(const Entry& entry) {
    domain::MarketSnapshot snapshot;
    snapshot.instrument = entry.id;
    if (auto quote = entry.quote.load()) {
        snapshot.quote = *quote;
    }
    if (auto depth = entry.depth.load()) {
        snapshot.depth = *depth;
    }
    if (auto trades = entry.trades.load()) {
        snapshot.trades = *trades;
    }
    if (auto candles = entry.candles.load()) {
        snapshot.candles = *candles;
    }
    snapshot.lastUpdated = entry.lastUpdated.load(std::memory_order_relaxed);
    return snapshot;
}

std::optional<domain::MarketSnapshot> MarketStateStore::get(const domain::InstrumentId& id) const {
    auto entry = find_(id);
    if (!entry) {
        return std::nullopt;
    }
    return copyOf_(*entry);
}

std::optional<domain::Quote> MarketStateStore::getQuote(const domain::InstrumentId& id) const {
    auto entry = find_(id);
    if (!entry) {
        return std::nullopt;
    }
    auto quote = entry->quote.load();
    if (!quote) {
        return std::nullopt;
    }
    return *quote;
}

std::unordered_map<domain::InstrumentId, domain::MarketSnapshot> MarketStateStore::getMany(
    const std::vector<domain::InstrumentId>& ids) const {
    std::unordered_map<domain::InstrumentId, domain::MarketSnapshot> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (result.count(id) != 0) {
            continue;
        }
        if (auto entry = find_(id)) {
            result.emplace(id, copyOf_(*entry));
        }
    }
    return result;
}

std::vector<domain::InstrumentId> MarketStateStore::instruments() const {
    std::vector<domain::InstrumentId> ids;
    for (auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        for (const auto& [id, entry] : shard.entries) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t MarketStateStore::size() const {
    std::size_t total = 0;
    for (auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

}  // namespace core
