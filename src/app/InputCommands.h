#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "app/AlertEngine.h"
#include "app/Navigation.h"

namespace app {

namespace cmd {

struct Quit {};
struct Help {};
// Re-seeds quotes and the portfolio over REST.
struct Refresh {};

struct AlertAdd {
    NewAlertRule rule;
};

struct AlertRemove {
    std::uint64_t id{0};
};

struct AlertToggle {
    std::uint64_t id{0};
    bool enabled{true};
};

struct AlertList {};

}  // namespace cmd

using InputCommand =
    std::variant<nav::Command, cmd::Quit, cmd::Help, cmd::Refresh, cmd::AlertAdd, cmd::AlertRemove, cmd::AlertToggle,
                 cmd::AlertList>;

// Parses one console line. Blank lines give nullopt; anything malformed throws
// std::invalid_argument with a message fit for the status line.
std::optional<InputCommand> parse_input(std::string_view line);

// Help text, one command per line.
const char* input_help();

}  // namespace app
