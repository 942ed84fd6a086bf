#pragma once

#include "config/Config.h"

#include <string>

namespace config {

// Resolves the runtime Config from, in increasing precedence: the key=value file named by
// --config or TW_CONFIG, TW_* environment variables, then command line flags. Bad values are
// reported on stderr and leave the previous value in place.
class ConfigProvider {
public:
    ConfigProvider(int argc, const char* const* argv);

    const Config& get() const { return cfg_; }

    // Unrecognised names map to Info.
    static LogLevel parseLogLevel(const std::string& s);
    static std::string logLevelToString(LogLevel l);
    static std::string usage();

private:
    void loadFile_(const std::string& path);
    void loadEnvironment_();
    void loadArguments_(int argc, const char* const* argv);

    Config cfg_;
};

}  // namespace config
