#include "app/AlertRules.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/json.hpp>

#include "common/JsonUtil.hpp"
#include "domain/Errors.h"
#include "infra/storage/JsonFileStore.h"
#include "logging/Log.h"

namespace app {
namespace {

namespace json = boost::json;
namespace fields = tw::common::json;

constexpr logging::LogCategory kLogCategory = logging::LogCategory::ALERT;

constexpr AlertKind kAllKinds[] = {AlertKind::PriceAbove, AlertKind::PriceBelow, AlertKind::ChangePercentAbove,
                                   AlertKind::ChangePercentBelow, AlertKind::VolumeAbove};

json::value ruleToJson(const AlertRule& rule) {
    json::object obj;
    obj["id"] = rule.id;
    obj["symbol"] = rule.instrument.str();
    obj["kind"] = alert_kind_label(rule.kind);
    obj["threshold"] = rule.threshold;
    obj["enabled"] = rule.enabled;
    obj["cooldown_seconds"] = rule.cooldownSeconds;
    if (rule.lastTriggeredAt) {
        obj["last_triggered_at"] = *rule.lastTriggeredAt;
    }
    else {
        obj["last_triggered_at"] = nullptr;
    }
    obj["created_at"] = rule.createdAt;
    obj["updated_at"] = rule.updatedAt;
    return obj;
}

AlertRule ruleFromJson(const json::value& value) {
    const auto& obj = fields::as_object(value, "rule");

    AlertRule rule;
    const auto id = fields::int_field(obj, "id");
    if (id <= 0) {
        throw domain::DecodeError("rule id must be positive");
    }
    rule.id = static_cast<std::uint64_t>(id);
    rule.instrument = domain::InstrumentId(fields::string_field(obj, "symbol"));
    if (rule.instrument.empty()) {
        throw domain::DecodeError("rule " + std::to_string(id) + ": empty symbol");
    }
    const auto kind = fields::string_field(obj, "kind");
    auto parsed = alert_kind_from_label(kind);
    if (!parsed) {
        throw domain::DecodeError("rule " + std::to_string(id) + ": unknown kind '" + kind + "'");
    }
    rule.kind = *parsed;
    rule.threshold = fields::number_field(obj, "threshold");
    rule.enabled = fields::optional_bool(obj, "enabled").value_or(true);
    const auto cooldown = fields::int_field(obj, "cooldown_seconds");
    if (cooldown < 0) {
        throw domain::DecodeError("rule " + std::to_string(id) + ": negative cooldown");
    }
    if (cooldown > kMaxCooldownSeconds) {
        LOG_WARN(kLogCategory, "rule %llu: cooldown %lld clamped to %d", static_cast<unsigned long long>(id),
                 static_cast<long long>(cooldown), kMaxCooldownSeconds);
    }
    rule.cooldownSeconds = static_cast<int>(std::min<std::int64_t>(cooldown, kMaxCooldownSeconds));
    rule.lastTriggeredAt = fields::optional_int(obj, "last_triggered_at");
    rule.createdAt = fields::optional_int(obj, "created_at").value_or(0);
    rule.updatedAt = fields::optional_int(obj, "updated_at").value_or(rule.createdAt);
    return rule;
}

}  // namespace

const char* alert_kind_label(AlertKind kind) {
    switch (kind) {
    case AlertKind::PriceAbove:
        return "price_above";
    case AlertKind::PriceBelow:
        return "price_below";
    case AlertKind::ChangePercentAbove:
        return "change_percent_above";
    case AlertKind::ChangePercentBelow:
        return "change_percent_below";
    case AlertKind::VolumeAbove:
        return "volume_above";
    }
    return "price_above";
}

std::optional<AlertKind> alert_kind_from_label(std::string_view label) {
    for (auto kind : kAllKinds) {
        if (label == alert_kind_label(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

bool AlertRule::operator==(const AlertRule& other) const {
    return id == other.id && instrument == other.instrument && kind == other.kind && threshold == other.threshold
        && enabled == other.enabled && cooldownSeconds == other.cooldownSeconds
        && lastTriggeredAt == other.lastTriggeredAt && createdAt == other.createdAt && updatedAt == other.updatedAt;
}

bool rule_satisfied(const AlertRule& rule, const domain::Quote& quote) {
    switch (rule.kind) {
    case AlertKind::PriceAbove:
        return quote.lastPrice >= rule.threshold;
    case AlertKind::PriceBelow:
        return quote.lastPrice <= rule.threshold;
    case AlertKind::ChangePercentAbove: {
        auto pct = quote.changePercent();
        return pct && *pct >= rule.threshold;
    }
    case AlertKind::ChangePercentBelow: {
        auto pct = quote.changePercent();
        return pct && *pct <= rule.threshold;
    }
    case AlertKind::VolumeAbove:
        return static_cast<double>(quote.volume) >= rule.threshold;
    }
    return false;
}

double rule_observed_value(const AlertRule& rule, const domain::Quote& quote) {
    switch (rule.kind) {
    case AlertKind::PriceAbove:
    case AlertKind::PriceBelow:
        return quote.lastPrice;
    case AlertKind::ChangePercentAbove:
    case AlertKind::ChangePercentBelow:
        return quote.changePercent().value_or(0.0);
    case AlertKind::VolumeAbove:
        return static_cast<double>(quote.volume);
    }
    return quote.lastPrice;
}

json::value rules_to_json(const std::vector<AlertRule>& rules) {
    json::array list;
    list.reserve(rules.size());
    for (const auto& rule : rules) {
        list.push_back(ruleToJson(rule));
    }
    json::object doc;
    doc["version"] = AlertRuleStore::kVersion;
    doc["rules"] = std::move(list);
    return doc;
}

std::vector<AlertRule> rules_from_json(const json::value& document) {
    const auto& obj = fields::as_object(document, "alert rules");
    const auto version = fields::int_field(obj, "version");
    if (version != AlertRuleStore::kVersion) {
        throw domain::DecodeError("alert rules: unsupported version " + std::to_string(version));
    }
    const auto* list = obj.if_contains("rules");
    if (list == nullptr || !list->is_array()) {
        throw domain::DecodeError("alert rules: 'rules' must be an array");
    }

    std::vector<AlertRule> rules;
    rules.reserve(list->get_array().size());
    for (const auto& entry : list->get_array()) {
        auto rule = ruleFromJson(entry);
        for (const auto& existing : rules) {
            if (existing.id == rule.id) {
                throw domain::DecodeError("alert rules: duplicate id " + std::to_string(rule.id));
            }
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

std::string alert_event_to_json_line(const AlertEvent& event) {
    json::object obj;
    obj["rule_id"] = event.ruleId;
    obj["symbol"] = event.instrument.str();
    obj["kind"] = alert_kind_label(event.kind);
    obj["threshold"] = event.threshold;
    obj["value"] = event.value;
    obj["timestamp_ms"] = event.timestampMs;
    return json::serialize(obj);
}

AlertRuleStore::AlertRuleStore(std::filesystem::path file)
    : file_(std::make_unique<infra::storage::JsonFileStore>(std::move(file))) {}

AlertRuleStore::~AlertRuleStore() = default;

const std::filesystem::path& AlertRuleStore::path() const {
    return file_->path();
}

std::vector<AlertRule> AlertRuleStore::load() {
    try {
        auto document = file_->load();
        if (!document) {
            LOG_INFO(kLogCategory, "no alert rules at %s", file_->path().string().c_str());
            return {};
        }
        auto rules = rules_from_json(*document);
        LOG_INFO(kLogCategory, "loaded %zu alert rule(s) from %s", rules.size(), file_->path().string().c_str());
        return rules;
    }
    catch (const domain::DecodeError& ex) {
        LOG_WARN(kLogCategory, "alert rule file %s is corrupt, starting empty: %s", file_->path().string().c_str(),
                 ex.what());
        try {
            file_->backupCorrupt();
        }
        catch (const std::exception& backupError) {
            LOG_ERROR(kLogCategory, "alert rule backup failed: %s", backupError.what());
        }
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "alert rule file %s unreadable, starting empty: %s", file_->path().string().c_str(),
                 ex.what());
    }
    return {};
}

void AlertRuleStore::save(const std::vector<AlertRule>& rules) {
    file_->save(rules_to_json(rules));
}

}  // namespace app
