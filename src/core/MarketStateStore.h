#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "domain/Types.h"

namespace core {

// Latest known market state per instrument.
//
// Every sub-record (quote, depth, trades, candles) is an immutable value behind a shared_ptr
// that writers swap atomically, so readers always see a whole record. Writers of the same
// sub-record are serialized by a per-slot mutex; different sub-records and different
// instruments never contend. Instruments are spread over shards that only lock to find or
// insert an entry.
class MarketStateStore {
public:
    static constexpr std::size_t kShardCount = 16;

    MarketStateStore() = default;
    MarketStateStore(const MarketStateStore&) = delete;
    MarketStateStore& operator=(const MarketStateStore&) = delete;

    // Each update returns the notification to broadcast, or nothing when the update is older
    // than what is stored.
    std::optional<domain::ChangeNotification> updateQuote(const domain::InstrumentId& id, domain::Quote quote);
    std::optional<domain::ChangeNotification> updateDepth(const domain::InstrumentId& id, domain::DepthBook depth);
    std::optional<domain::ChangeNotification> updateTrades(const domain::InstrumentId& id,
                                                           const std::vector<domain::Trade>& trades);
    std::optional<domain::ChangeNotification> updateCandle(const domain::InstrumentId& id,
                                                           domain::ChartPeriod period,
                                                           const domain::Candle& bar);
    std::optional<domain::ChangeNotification> replaceCandles(const domain::InstrumentId& id,
                                                             domain::CandleFragment fragment);

    std::optional<domain::MarketSnapshot> get(const domain::InstrumentId& id) const;
    std::optional<domain::Quote> getQuote(const domain::InstrumentId& id) const;
    std::unordered_map<domain::InstrumentId, domain::MarketSnapshot> getMany(
        const std::vector<domain::InstrumentId>& ids) const;

    std::vector<domain::InstrumentId> instruments() const;
    std::size_t size() const;

private:
    template <typename T>
    struct Slot {
        std::mutex writeMutex;
        std::shared_ptr<const T> value;

        std::shared_ptr<const T> load() const { return std::atomic_load_explicit(&value, std::memory_order_acquire); }
        void store(std::shared_ptr<const T> next) {
            std::atomic_store_explicit(&value, std::move(next), std::memory_order_release);
        }
    };

    struct Entry {
        explicit Entry(domain::InstrumentId instrumentId) : id(std::move(instrumentId)) {}

        const domain::InstrumentId id;
        Slot<domain::Quote> quote;
        Slot<domain::DepthBook> depth;
        Slot<domain::TradeTape> trades;
        Slot<domain::CandleFragment> candles;
        std::atomic<domain::TimestampMs> lastUpdated{0};
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<domain::InstrumentId, std::shared_ptr<Entry>> entries;
    };

    Shard& shardFor_(const domain::InstrumentId& id) const;
    std::shared_ptr<Entry> find_(const domain::InstrumentId& id) const;
    std::shared_ptr<Entry> findOrCreate_(const domain::InstrumentId& id);
    domain::ChangeNotification notify_(Entry& entry, domain::ChangeCategory category, domain::TimestampMs ts);
    static domain::MarketSnapshot copyOf_(const Entry& entry);

    mutable std::array<Shard, kShardCount> shards_;
    std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace core
