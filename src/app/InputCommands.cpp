#include "app/InputCommands.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace app {
namespace {

std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        const std::size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        if (i > start) {
            tokens.emplace_back(line.substr(start, i - start));
        }
    }
    return tokens;
}

std::string lowercase(std::string text) {
    for (auto& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text;
}

double parseNumber(const std::string& text, const char* what) {
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end == nullptr || *end != '\0') {
        throw std::invalid_argument(std::string{"expected a number for "} + what + ", got '" + text + "'");
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string{what} + " must be finite, got '" + text + "'");
    }
    return value;
}

std::uint64_t parseUnsigned(const std::string& text, const char* what) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        throw std::invalid_argument(std::string{"expected a non-negative integer for "} + what + ", got '" + text + "'");
    }
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        throw std::invalid_argument(std::string{"expected a non-negative integer for "} + what + ", got '" + text + "'");
    }
    return static_cast<std::uint64_t>(value);
}

std::uint8_t parseSmall(const std::string& text, const char* what) {
    const auto value = parseUnsigned(text, what);
    if (value > 255) {
        throw std::invalid_argument(std::string{what} + " out of range: " + text);
    }
    return static_cast<std::uint8_t>(value);
}

void expectArgs(const std::vector<std::string>& tokens, std::size_t min, std::size_t max, const char* usage) {
    const std::size_t args = tokens.size() - 1;
    if (args < min || args > max) {
        throw std::invalid_argument(std::string{"usage: "} + usage);
    }
}

InputCommand parseAlert(const std::vector<std::string>& tokens) {
    if (tokens.size() < 2) {
        return cmd::AlertList{};
    }
    const std::string action = lowercase(tokens[1]);
    if (action == "list" || action == "ls") {
        return cmd::AlertList{};
    }
    if (action == "add") {
        constexpr const char* kUsage = "alert add SYMBOL KIND THRESHOLD [COOLDOWN_SECONDS]";
        if (tokens.size() < 5 || tokens.size() > 6) {
            throw std::invalid_argument(std::string{"usage: "} + kUsage);
        }
        const auto kind = alert_kind_from_label(lowercase(tokens[3]));
        if (!kind) {
            throw std::invalid_argument("unknown alert kind '" + tokens[3]
                                        + "' (price_above, price_below, change_percent_above, "
                                          "change_percent_below, volume_above)");
        }
        cmd::AlertAdd add;
        add.rule.instrument = domain::InstrumentId(tokens[2]);
        add.rule.kind = *kind;
        add.rule.threshold = parseNumber(tokens[4], "threshold");
        if (tokens.size() == 6) {
            const auto cooldown = parseUnsigned(tokens[5], "cooldown");
            if (cooldown > static_cast<std::uint64_t>(kMaxCooldownSeconds)) {
                throw std::invalid_argument("cooldown must be at most " + std::to_string(kMaxCooldownSeconds)
                                            + " seconds");
            }
            add.rule.cooldownSeconds = static_cast<int>(cooldown);
        }
        return add;
    }
    if (action == "rm" || action == "remove" || action == "del") {
        if (tokens.size() != 3) {
            throw std::invalid_argument("usage: alert rm ID");
        }
        return cmd::AlertRemove{parseUnsigned(tokens[2], "rule id")};
    }
    if (action == "on" || action == "off") {
        if (tokens.size() != 3) {
            throw std::invalid_argument("usage: alert on|off ID");
        }
        return cmd::AlertToggle{parseUnsigned(tokens[2], "rule id"), action == "on"};
    }
    throw std::invalid_argument("unknown alert action '" + tokens[1] + "'");
}

}  // namespace

std::optional<InputCommand> parse_input(std::string_view line) {
    const auto tokens = tokenize(line);
    if (tokens.empty()) {
        return std::nullopt;
    }
    const std::string head = lowercase(tokens[0]);

    if (head == "q" || head == "quit" || head == "exit") {
        expectArgs(tokens, 0, 0, "q");
        return cmd::Quit{};
    }
    if (head == "?" || head == "help") {
        return cmd::Help{};
    }
    if (head == "r" || head == "refresh") {
        expectArgs(tokens, 0, 0, "r");
        return cmd::Refresh{};
    }
    if (head == "alert" || head == "alerts" || head == "a") {
        return parseAlert(tokens);
    }

    if (head == "w") {
        expectArgs(tokens, 0, 0, "w");
        return nav::Command{nav::SwitchView{View::Watchlist}};
    }
    if (head == "p") {
        expectArgs(tokens, 0, 0, "p");
        return nav::Command{nav::SwitchView{View::Portfolio}};
    }
    if (head == "d") {
        expectArgs(tokens, 0, 0, "d");
        return nav::Command{nav::SwitchView{View::Stock}};
    }
    if (head == "s" || head == "select") {
        expectArgs(tokens, 1, 1, "s SYMBOL");
        return nav::Command{nav::SelectInstrument{domain::InstrumentId(tokens[1])}};
    }
    if (head == "o" || head == "open") {
        expectArgs(tokens, 0, 1, "o [SYMBOL]");
        nav::OpenDetail open;
        if (tokens.size() == 2) {
            open.instrument = domain::InstrumentId(tokens[1]);
        }
        return nav::Command{open};
    }
    if (head == "c" || head == "close") {
        expectArgs(tokens, 0, 0, "c");
        return nav::Command{nav::CloseDetail{}};
    }
    if (head == "period" || head == "k") {
        expectArgs(tokens, 1, 1, "period 1m|5m|15m|30m|1h|1d|1w|1M|1y");
        // Period labels are case sensitive: 1m is a minute, 1M a month.
        const auto period = domain::chart_period_from_label(tokens[1]);
        if (!period) {
            throw std::invalid_argument("unknown chart period '" + tokens[1] + "'");
        }
        return nav::Command{nav::SetChartPeriod{*period}};
    }
    if (head == "[" || head == "]") {
        expectArgs(tokens, 0, 1, "[ [N] or ] [N]");
        long step = 1;
        if (tokens.size() == 2) {
            step = static_cast<long>(parseUnsigned(tokens[1], "scroll step"));
        }
        return nav::Command{nav::ScrollChart{head == "[" ? step : -step}};
    }
    if (head == "g" || head == "group") {
        expectArgs(tokens, 1, 1, "g ID|none");
        nav::SelectGroup group;
        if (lowercase(tokens[1]) != "none") {
            group.groupId = parseUnsigned(tokens[1], "group id");
        }
        return nav::Command{group};
    }
    if (head == "h") {
        expectArgs(tokens, 0, 0, "h");
        return nav::Command{nav::ToggleWatchlist{}};
    }
    if (head == "l") {
        expectArgs(tokens, 0, 0, "l");
        return nav::Command{nav::ToggleLogPanel{}};
    }
    if (head == "sort") {
        expectArgs(tokens, 2, 3, "sort COLUMN ORDER [desc]");
        nav::SetSort sort;
        sort.sort.column = parseSmall(tokens[1], "sort column");
        sort.sort.order = parseSmall(tokens[2], "sort order");
        if (tokens.size() == 4) {
            const auto direction = lowercase(tokens[3]);
            if (direction != "desc" && direction != "asc") {
                throw std::invalid_argument("sort direction must be asc or desc");
            }
            sort.sort.descending = direction == "desc";
        }
        return nav::Command{sort};
    }

    throw std::invalid_argument("unknown command '" + tokens[0] + "' (type help)");
}

const char* input_help() {
    return "w | p | d                  watchlist, portfolio or detail view\n"
           "s SYMBOL                   select an instrument\n"
           "o [SYMBOL]                 open the detail view\n"
           "c                          close the detail view\n"
           "period LABEL               chart period: 1m 5m 15m 30m 1h 1d 1w 1M 1y\n"
           "[ [N] | ] [N]              scroll the chart back or forward\n"
           "g ID|none                  watchlist group\n"
           "sort COLUMN ORDER [desc]   watchlist sort\n"
           "h | l                      toggle watchlist, toggle log panel\n"
           "alert add SYM KIND THR [S] add an alert rule\n"
           "alert rm|on|off ID         remove, enable or disable a rule\n"
           "alert list                 show alert rules\n"
           "r                          refresh quotes over REST\n"
           "q                          quit\n";
}

}  // namespace app
