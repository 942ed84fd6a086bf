#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "app/AlertRules.h"
#include "domain/Types.h"

namespace core {
class MarketStateStore;
}

namespace infra::storage {
class AppendOnlyLog;
}

namespace app {

struct NewAlertRule {
    domain::InstrumentId instrument;
    AlertKind kind{AlertKind::PriceAbove};
    double threshold{0.0};
    bool enabled{true};
    std::optional<int> cooldownSeconds;  // engine default when empty
};

// Evaluates price alerts against quote changes.
//
// A rule fires on the false to true edge of its predicate, unless it fired less than its
// cooldown ago; an edge inside the cooldown is consumed. Rules evaluated in the same pass fire
// independently in ascending id order. Mutations are written to the rule file before they
// return and rolled back when the write fails.
class AlertEngine {
public:
    using WallClock = std::function<domain::TimestampMs()>;
    using Listener = std::function<void(const AlertEvent&)>;

    struct Options {
        std::filesystem::path rulesFile;
        std::filesystem::path eventLog;
        std::chrono::seconds defaultCooldown{30};
    };

    AlertEngine(const core::MarketStateStore& store, Options options, WallClock clock = {});
    ~AlertEngine();

    AlertEngine(const AlertEngine&) = delete;
    AlertEngine& operator=(const AlertEngine&) = delete;

    // Replaces the in-memory rules with the rule file. Returns the number of rules loaded.
    std::size_t load();

    void onChange(const domain::ChangeNotification& note);

    // Throws std::invalid_argument for an empty instrument or negative cooldown, and
    // std::runtime_error when the rule file could not be written.
    AlertRule createRule(const NewAlertRule& request);
    // False when no rule has this id.
    bool setEnabled(std::uint64_t id, bool enabled);
    bool deleteRule(std::uint64_t id);

    std::vector<AlertRule> rules() const;
    std::optional<AlertRule> rule(std::uint64_t id) const;

    // Every fired event is handed out exactly once.
    std::vector<AlertEvent> drainPending();
    void setListener(Listener listener);

    // Persists the current rules, including trigger times. Logs instead of throwing.
    bool flush();

    std::uint64_t fired() const { return fired_.load(std::memory_order_relaxed); }

private:
    struct RuleState {
        AlertRule rule;
        bool lastSatisfied{false};
        std::optional<domain::TimestampMs> lastTriggeredMs;
    };

    domain::TimestampMs now_() const;
    std::vector<AlertRule> snapshotLocked_() const;
    void persistLocked_();
    void reindexLocked_();
    void emit_(const AlertEvent& event);

    const core::MarketStateStore& store_;
    const Options options_;
    WallClock clock_;

    std::unique_ptr<AlertRuleStore> ruleFile_;
    std::unique_ptr<infra::storage::AppendOnlyLog> eventLog_;

    mutable std::mutex mutex_;
    std::map<std::uint64_t, RuleState> rules_;
    std::unordered_map<domain::InstrumentId, std::vector<std::uint64_t>> index_;
    std::uint64_t nextId_{1};

    std::mutex pendingMutex_;
    std::deque<AlertEvent> pending_;

    std::mutex listenerMutex_;
    Listener listener_;

    std::atomic<std::uint64_t> fired_{0};
};

}  // namespace app
