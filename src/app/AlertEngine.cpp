#include "app/AlertEngine.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Metrics.hpp"
#include "core/MarketStateStore.h"
#include "infra/storage/JsonFileStore.h"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::ALERT;
constexpr std::size_t kMaxPending = 1024;

domain::TimestampMs systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

AlertEngine::AlertEngine(const core::MarketStateStore& store, Options options, WallClock clock)
    : store_(store),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : WallClock(systemNowMs)),
      ruleFile_(std::make_unique<AlertRuleStore>(options_.rulesFile)),
      eventLog_(std::make_unique<infra::storage::AppendOnlyLog>(options_.eventLog)) {}

AlertEngine::~AlertEngine() = default;

domain::TimestampMs AlertEngine::now_() const {
    return clock_();
}

std::size_t AlertEngine::load() {
    auto loaded = ruleFile_->load();

    std::lock_guard<std::mutex> lock(mutex_);
    rules_.clear();
    nextId_ = 1;
    for (auto& rule : loaded) {
        RuleState state;
        if (rule.lastTriggeredAt) {
            state.lastTriggeredMs = *rule.lastTriggeredAt * 1000;
        }
        nextId_ = std::max(nextId_, rule.id + 1);
        state.rule = std::move(rule);
        rules_.emplace(state.rule.id, std::move(state));
    }
    reindexLocked_();
    return rules_.size();
}

void AlertEngine::reindexLocked_() {
    index_.clear();
    for (const auto& [id, state] : rules_) {
        if (state.rule.enabled) {
            index_[state.rule.instrument].push_back(id);
        }
    }
    tw::common::metrics::Registry::instance().setGauge("alert_rules", static_cast<double>(rules_.size()));
}

std::vector<AlertRule> AlertEngine::snapshotLocked_() const {
    std::vector<AlertRule> out;
    out.reserve(rules_.size());
    for (const auto& entry : rules_) {
        out.push_back(entry.second.rule);
    }
    return out;
}

void AlertEngine::persistLocked_() {
    ruleFile_->save(snapshotLocked_());
}

void AlertEngine::onChange(const domain::ChangeNotification& note) {
    if (note.category != domain::ChangeCategory::Quote) {
        return;
    }

    std::vector<AlertEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto indexed = index_.find(note.instrument);
        if (indexed == index_.end()) {
            return;
        }
        auto quote = store_.getQuote(note.instrument);
        if (!quote) {
            return;
        }

        const auto now = now_();
        for (auto id : indexed->second) {
            auto& state = rules_.at(id);
            const bool satisfied = rule_satisfied(state.rule, *quote);
            const bool rising = satisfied && !state.lastSatisfied;
            state.lastSatisfied = satisfied;
            if (!rising) {
                continue;
            }

            const auto cooldownMs = static_cast<domain::TimestampMs>(state.rule.cooldownSeconds) * 1000;
            if (state.lastTriggeredMs && now - *state.lastTriggeredMs < cooldownMs) {
                LOG_DEBUG(kLogCategory, "rule %llu on %s inside cooldown, edge consumed",
                          static_cast<unsigned long long>(id), note.instrument.str().c_str());
                continue;
            }

            state.lastTriggeredMs = now;
            state.rule.lastTriggeredAt = now / 1000;
            state.rule.updatedAt = now / 1000;

            AlertEvent event;
            event.ruleId = id;
            event.instrument = state.rule.instrument;
            event.kind = state.rule.kind;
            event.threshold = state.rule.threshold;
            event.value = rule_observed_value(state.rule, *quote);
            event.timestampMs = now;
            events.push_back(std::move(event));
        }

        if (!events.empty()) {
            try {
                persistLocked_();
            }
            catch (const std::exception& ex) {
                LOG_WARN(kLogCategory, "trigger times not saved: %s", ex.what());
            }
        }
    }

    for (const auto& event : events) {
        emit_(event);
    }
}

void AlertEngine::emit_(const AlertEvent& event) {
    LOG_INFO(kLogCategory, "alert %llu fired: %s %s %.4f (value %.4f)", static_cast<unsigned long long>(event.ruleId),
             event.instrument.str().c_str(), alert_kind_label(event.kind), event.threshold, event.value);

    try {
        eventLog_->append(alert_event_to_json_line(event));
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "alert event log write failed: %s", ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        if (pending_.size() >= kMaxPending) {
            pending_.pop_front();
            LOG_WARN(kLogCategory, "pending alert queue full, dropped oldest event");
        }
        pending_.push_back(event);
    }

    Listener listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }
    if (listener) {
        try {
            listener(event);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "alert listener threw: %s", ex.what());
        }
    }

    fired_.fetch_add(1, std::memory_order_relaxed);
    tw::common::metrics::Registry::instance().incrementCounter("alerts_fired_total");
}

AlertRule AlertEngine::createRule(const NewAlertRule& request) {
    if (request.instrument.empty()) {
        throw std::invalid_argument("alert rule needs an instrument");
    }
    if (!std::isfinite(request.threshold)) {
        throw std::invalid_argument("alert threshold must be a finite number");
    }
    const int cooldown = request.cooldownSeconds.value_or(static_cast<int>(options_.defaultCooldown.count()));
    if (cooldown < 0 || cooldown > kMaxCooldownSeconds) {
        throw std::invalid_argument("alert cooldown must be between 0 and " + std::to_string(kMaxCooldownSeconds)
                                    + " seconds");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto nowSec = now_() / 1000;

    RuleState state;
    state.rule.id = nextId_;
    state.rule.instrument = request.instrument;
    state.rule.kind = request.kind;
    state.rule.threshold = request.threshold;
    state.rule.enabled = request.enabled;
    state.rule.cooldownSeconds = cooldown;
    state.rule.createdAt = nowSec;
    state.rule.updatedAt = nowSec;
    const auto created = state.rule;

    rules_.emplace(created.id, std::move(state));
    try {
        persistLocked_();
    }
    catch (const std::exception& ex) {
        rules_.erase(created.id);
        LOG_ERROR(kLogCategory, "alert rule not created: %s", ex.what());
        throw;
    }
    ++nextId_;
    reindexLocked_();
    LOG_INFO(kLogCategory, "alert rule %llu created: %s %s %.4f", static_cast<unsigned long long>(created.id),
             created.instrument.str().c_str(), alert_kind_label(created.kind), created.threshold);
    return created;
}

bool AlertEngine::setEnabled(std::uint64_t id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(id);
    if (it == rules_.end()) {
        return false;
    }
    if (it->second.rule.enabled == enabled) {
        return true;
    }

    const RuleState previous = it->second;
    it->second.rule.enabled = enabled;
    it->second.rule.updatedAt = now_() / 1000;
    it->second.lastSatisfied = false;
    try {
        persistLocked_();
    }
    catch (const std::exception& ex) {
        it->second = previous;
        LOG_ERROR(kLogCategory, "alert rule %llu not changed: %s", static_cast<unsigned long long>(id), ex.what());
        throw;
    }
    reindexLocked_();
    LOG_INFO(kLogCategory, "alert rule %llu %s", static_cast<unsigned long long>(id),
             enabled ? "enabled" : "disabled");
    return true;
}

bool AlertEngine::deleteRule(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(id);
    if (it == rules_.end()) {
        return false;
    }

    RuleState removed = std::move(it->second);
    rules_.erase(it);
    try {
        persistLocked_();
    }
    catch (const std::exception& ex) {
        rules_.emplace(id, std::move(removed));
        LOG_ERROR(kLogCategory, "alert rule %llu not deleted: %s", static_cast<unsigned long long>(id), ex.what());
        throw;
    }
    reindexLocked_();
    LOG_INFO(kLogCategory, "alert rule %llu deleted", static_cast<unsigned long long>(id));
    return true;
}

std::vector<AlertRule> AlertEngine::rules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshotLocked_();
}

std::optional<AlertRule> AlertEngine::rule(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rules_.find(id);
    if (it == rules_.end()) {
        return std::nullopt;
    }
    return it->second.rule;
}

std::vector<AlertEvent> AlertEngine::drainPending() {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    std::vector<AlertEvent> out(pending_.begin(), pending_.end());
    pending_.clear();
    return out;
}

void AlertEngine::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

bool AlertEngine::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        persistLocked_();
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "alert rules not flushed to %s: %s", ruleFile_->path().string().c_str(), ex.what());
        return false;
    }
    LOG_INFO(kLogCategory, "alert rules flushed (%zu)", rules_.size());
    return true;
}

}  // namespace app
