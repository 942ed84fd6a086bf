#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace config {

enum class LogLevel { Trace, Debug, Info, Warn, Error };

inline int logLevelSeverity(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return 0;
    case LogLevel::Debug:
        return 1;
    case LogLevel::Info:
        return 2;
    case LogLevel::Warn:
        return 3;
    case LogLevel::Error:
        return 4;
    }
    return 2;
}

struct Config {
    // instruments
    std::vector<std::string> watchlist  = {"700.HK", "9988.HK", "AAPL.US", "TSLA.US"};
    std::vector<std::string> indexes    = {".DJI.US", ".IXIC.US", "SPY.US", "HSI.HK", "HSCEI.HK", "HSTECH.HK"};

    // rate governor
    int rateLimitPerSecond           = 10;
    int rateLimitBurst               = 20;

    // render / alerts
    int renderIntervalMs             = 16;
    int alertCooldownSec             = 30;

    // IO / paths
    std::string dataDir              = "./data";
    std::string logDir               = "./logs";
    std::string configFile           = "";
    int workspaceSaveTimeoutMs       = 500;

    // network
    std::string restHost             = "openapi.example-broker.com";
    std::string wsHost               = "openapi-quote.example-broker.com";
    std::string wsPort               = "443";
    std::string wsPath               = "/v1/stream";
    std::string accessToken          = "";
    std::string caFile               = "";
    int httpTimeoutSec               = 10;
    int streamMaxReconnects          = 5;
    int restWorkers                  = 2;
    bool exitOnStreamLoss            = false;

    // logs
    LogLevel logLevel                = LogLevel::Info;

    // util
    bool showHelp                    = false;
    bool showVersion                 = false;
};

}  // namespace config
