#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json/value.hpp>

#include "domain/Types.h"

namespace infra::storage {
class JsonFileStore;
}

namespace app {

// Upper bound for a rule cooldown; longer persisted values are clamped on load.
constexpr int kMaxCooldownSeconds = 86400;

enum class AlertKind { PriceAbove, PriceBelow, ChangePercentAbove, ChangePercentBelow, VolumeAbove };

const char* alert_kind_label(AlertKind kind);
std::optional<AlertKind> alert_kind_from_label(std::string_view label);

struct AlertRule {
    std::uint64_t id{0};
    domain::InstrumentId instrument;
    AlertKind kind{AlertKind::PriceAbove};
    double threshold{0.0};
    bool enabled{true};
    int cooldownSeconds{30};
    std::optional<std::int64_t> lastTriggeredAt;  // unix seconds
    std::int64_t createdAt{0};
    std::int64_t updatedAt{0};

    bool operator==(const AlertRule& other) const;
    bool operator!=(const AlertRule& other) const { return !(*this == other); }
};

// Predicate of the rule against one quote. Percent rules are false without a previous close.
bool rule_satisfied(const AlertRule& rule, const domain::Quote& quote);
// Value the predicate compared, for the event record.
double rule_observed_value(const AlertRule& rule, const domain::Quote& quote);

struct AlertEvent {
    std::uint64_t ruleId{0};
    domain::InstrumentId instrument;
    AlertKind kind{AlertKind::PriceAbove};
    double threshold{0.0};
    double value{0.0};
    domain::TimestampMs timestampMs{0};
};

boost::json::value rules_to_json(const std::vector<AlertRule>& rules);
// Throws domain::DecodeError.
std::vector<AlertRule> rules_from_json(const boost::json::value& document);

// One line of the event log, without the trailing newline.
std::string alert_event_to_json_line(const AlertEvent& event);

// The rule file: {"version": 1, "rules": [...]}.
class AlertRuleStore {
public:
    static constexpr int kVersion = 1;

    explicit AlertRuleStore(std::filesystem::path file);
    ~AlertRuleStore();

    // Missing file gives an empty set. A file that does not decode is backed up and also
    // gives an empty set. Never throws.
    std::vector<AlertRule> load();

    // Throws std::runtime_error when the file could not be replaced.
    void save(const std::vector<AlertRule>& rules);

    const std::filesystem::path& path() const;

private:
    std::unique_ptr<infra::storage::JsonFileStore> file_;
};

}  // namespace app
