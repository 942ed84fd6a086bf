#include "config/ConfigProvider.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <vector>

#include "logging/Log.h"

namespace config {

namespace {

std::string_view stripped(std::string_view text) {
    const auto notSpace = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto first = std::find_if(text.begin(), text.end(), notSpace);
    const auto last = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    return first < last ? text.substr(static_cast<std::size_t>(first - text.begin()),
                                       static_cast<std::size_t>(last - first))
                        : std::string_view{};
}

std::optional<long> toInteger(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<bool> toBool(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* yes : {"true", "1", "yes", "on"}) {
        if (text == yes) {
            return true;
        }
    }
    for (const char* no : {"false", "0", "no", "off"}) {
        if (text == no) {
            return false;
        }
    }
    return std::nullopt;
}

// Trimmed, de-duplicated, order preserving.
std::vector<std::string> toList(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream in(text);
    std::string piece;
    while (std::getline(in, piece, ',')) {
        const std::string item(stripped(piece));
        if (!item.empty() && std::find(items.begin(), items.end(), item) == items.end()) {
            items.push_back(item);
        }
    }
    return items;
}

// Each setter returns false when the value is rejected; the field is left untouched.
using Setter = bool (*)(Config&, const std::string&);

template <int Config::*Field, long Min>
bool setInt(Config& cfg, const std::string& text) {
    const auto parsed = toInteger(text);
    if (!parsed || *parsed < Min || *parsed > 1000000000L) {
        return false;
    }
    cfg.*Field = static_cast<int>(*parsed);
    return true;
}

template <std::string Config::*Field>
bool setText(Config& cfg, const std::string& text) {
    cfg.*Field = text;
    return true;
}

template <std::vector<std::string> Config::*Field>
bool setList(Config& cfg, const std::string& text) {
    cfg.*Field = toList(text);
    return true;
}

bool setExitOnStreamLoss(Config& cfg, const std::string& text) {
    const auto parsed = toBool(text);
    if (!parsed) {
        return false;
    }
    cfg.exitOnStreamLoss = *parsed;
    return true;
}

bool setLogLevel(Config& cfg, const std::string& text) {
    return logging::Log::try_parse_log_level(text, cfg.logLevel);
}

struct Option {
    const char* key;
    const char* env;
    const char* flag;
    const char* alias;
    const char* help;
    Setter set;
};

const Option kOptions[] = {
    {"watchlist", "TW_WATCHLIST", "--watchlist", "-w", "comma separated instruments, e.g. 700.HK,AAPL.US",
     &setList<&Config::watchlist>},
    {"indexes", "TW_INDEXES", "--indexes", nullptr, "comma separated index instruments", &setList<&Config::indexes>},
    {"rateLimitPerSecond", "TW_RATE_PER_SEC", "--rate", nullptr, "outbound calls per second (default 10)",
     &setInt<&Config::rateLimitPerSecond, 1>},
    {"rateLimitBurst", "TW_RATE_BURST", "--burst", nullptr, "outbound call burst capacity (default 20)",
     &setInt<&Config::rateLimitBurst, 1>},
    {"renderIntervalMs", "TW_RENDER_INTERVAL_MS", "--render-interval-ms", nullptr, "minimum redraw interval",
     &setInt<&Config::renderIntervalMs, 1>},
    {"alertCooldownSec", "TW_ALERT_COOLDOWN_SEC", "--alert-cooldown", nullptr, "default rule cooldown",
     &setInt<&Config::alertCooldownSec, 0>},
    {"dataDir", "TW_DATA_DIR", "--data-dir", "-d", "rules, alert log and workspace directory",
     &setText<&Config::dataDir>},
    {"logDir", "TW_LOG_DIR", "--log-dir", nullptr, "debug log directory", &setText<&Config::logDir>},
    {"workspaceSaveTimeoutMs", "TW_WORKSPACE_SAVE_TIMEOUT_MS", "--workspace-save-timeout-ms", nullptr,
     "bound for the workspace save at exit", &setInt<&Config::workspaceSaveTimeoutMs, 1>},
    {"restHost", "TW_REST_HOST", "--rest-host", nullptr, "quote API host", &setText<&Config::restHost>},
    {"wsHost", "TW_WS_HOST", "--ws-host", nullptr, "push stream host", &setText<&Config::wsHost>},
    {"wsPort", "TW_WS_PORT", "--ws-port", nullptr, "push stream port", &setText<&Config::wsPort>},
    {"wsPath", "TW_WS_PATH", "--ws-path", nullptr, "push stream path", &setText<&Config::wsPath>},
    {"accessToken", "TW_ACCESS_TOKEN", nullptr, nullptr, nullptr, &setText<&Config::accessToken>},
    {"caFile", "TW_CA_FILE", "--ca-file", nullptr, "extra PEM trust anchors for REST and push TLS",
     &setText<&Config::caFile>},
    {"httpTimeoutSec", "TW_HTTP_TIMEOUT_SEC", "--http-timeout", nullptr, "REST timeout in seconds",
     &setInt<&Config::httpTimeoutSec, 1>},
    {"streamMaxReconnects", "TW_STREAM_MAX_RECONNECTS", "--stream-max-reconnects", nullptr,
     "reconnects before the stream is declared lost", &setInt<&Config::streamMaxReconnects, 0>},
    {"restWorkers", "TW_REST_WORKERS", "--rest-workers", nullptr, "threads for blocking REST calls",
     &setInt<&Config::restWorkers, 1>},
    {"exitOnStreamLoss", "TW_EXIT_ON_STREAM_LOSS", "--exit-on-stream-loss", nullptr,
     "true|false: quit once the push stream is lost for good", &setExitOnStreamLoss},
    {"logLevel", "TW_LOG_LEVEL", "--log-level", "-l", "trace|debug|info|warn|error", &setLogLevel},
};

const Option* optionByKey(std::string_view key) {
    for (const auto& option : kOptions) {
        if (key == option.key) {
            return &option;
        }
    }
    return nullptr;
}

const Option* optionByFlag(std::string_view flag) {
    for (const auto& option : kOptions) {
        if ((option.flag != nullptr && flag == option.flag) || (option.alias != nullptr && flag == option.alias)) {
            return &option;
        }
    }
    return nullptr;
}

void apply(Config& cfg, const Option& option, const std::string& value, const std::string& source) {
    if (!option.set(cfg, value)) {
        std::fprintf(stderr, "Ignoring %s=%s from %s\n", option.key, value.c_str(), source.c_str());
    }
}

// --config is consumed before everything else so the file can sit at the bottom of the stack.
std::string configPathFromArgs(int argc, const char* const* argv) {
    std::string path;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i] != nullptr ? argv[i] : "";
        if (arg == "--config") {
            if (i + 1 < argc && argv[i + 1] != nullptr) {
                path = argv[++i];
            }
            else {
                std::fprintf(stderr, "Missing value for --config\n");
            }
        }
        else if (arg.substr(0, 9) == "--config=") {
            path = std::string(arg.substr(9));
        }
    }
    return path;
}

}  // namespace

ConfigProvider::ConfigProvider(int argc, const char* const* argv) {
    std::string path = configPathFromArgs(argc, argv);
    if (path.empty()) {
        if (const char* fromEnv = std::getenv("TW_CONFIG")) {
            path = fromEnv;
        }
    }
    if (!path.empty()) {
        loadFile_(path);
    }
    loadEnvironment_();
    loadArguments_(argc, argv);
}

LogLevel ConfigProvider::parseLogLevel(const std::string& s) {
    LogLevel level = LogLevel::Info;
    if (!logging::Log::try_parse_log_level(s, level)) {
        return LogLevel::Info;
    }
    return level;
}

std::string ConfigProvider::logLevelToString(LogLevel l) {
    std::string name = logging::Log::level_to_string(l);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::string ConfigProvider::usage() {
    std::ostringstream out;
    out << "Usage: tickwatch [options]\n"
        << "  --config <file>   key=value config file (also TW_CONFIG)\n";
    for (const auto& option : kOptions) {
        if (option.flag == nullptr) {
            continue;
        }
        out << "  " << option.flag;
        if (option.alias != nullptr) {
            out << ", " << option.alias;
        }
        out << " <value>   " << option.help << " (env " << option.env << ")\n";
    }
    out << "  --help, --version\n";
    return out.str();
}

void ConfigProvider::loadFile_(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::fprintf(stderr, "Config file not found: %s\n", path.c_str());
        return;
    }
    cfg_.configFile = path;

    std::string raw;
    int lineNo = 0;
    while (std::getline(input, raw)) {
        ++lineNo;
        const auto line = stripped(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const auto key = stripped(line.substr(0, eq));
        const Option* option = optionByKey(key);
        if (option == nullptr) {
            std::fprintf(stderr, "%s:%d: unknown key '%.*s'\n", path.c_str(), lineNo, static_cast<int>(key.size()),
                         key.data());
            continue;
        }
        apply(cfg_, *option, std::string(stripped(line.substr(eq + 1))), path + ":" + std::to_string(lineNo));
    }
}

void ConfigProvider::loadEnvironment_() {
    for (const auto& option : kOptions) {
        if (const char* value = std::getenv(option.env)) {
            apply(cfg_, option, value, option.env);
        }
    }
}

void ConfigProvider::loadArguments_(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string arg(argv[i]);
        if (arg == "--help") {
            cfg_.showHelp = true;
            continue;
        }
        if (arg == "--version") {
            cfg_.showVersion = true;
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg.rfind("--config=", 0) == 0) {
            continue;
        }

        std::string flag = arg;
        std::optional<std::string> value;
        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        const Option* option = optionByFlag(flag);
        if (option == nullptr) {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            continue;
        }
        if (!value) {
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                std::fprintf(stderr, "Missing value for %s\n", flag.c_str());
                continue;
            }
            value = std::string(argv[++i]);
        }
        apply(cfg_, *option, *value, "command line");
    }
}

}  // namespace config
