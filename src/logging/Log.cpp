#include "logging/Log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace {

namespace fs = std::filesystem;

constexpr std::size_t kLineLimit = 1024;
constexpr std::size_t kBacklogLimit = 4096;
constexpr std::uintmax_t kRotateAtBytes = 8u * 1024u * 1024u;
constexpr const char* kVerboseFileName = "tickwatch-debug.log";

bool isVerbose(config::LogLevel level) {
    return config::logLevelSeverity(level) <= config::logLevelSeverity(config::LogLevel::Debug);
}

struct Record {
    config::LogLevel level{};
    logging::LogCategory category{};
    std::chrono::system_clock::time_point at{};
    std::string text;
};

// Size-capped file for debug and trace output. One rotated generation (".1") is kept.
class VerboseFile {
public:
    void setDirectory(const std::string& dir) {
        std::lock_guard<std::mutex> lock(mutex_);
        closeUnlocked_();
        path_ = fs::path(dir.empty() ? std::string{"."} : dir) / kVerboseFileName;
    }

    void setEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        enabled_ = enabled;
        if (!enabled_) {
            closeUnlocked_();
        }
    }

    bool append(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_ || !openUnlocked_()) {
            return false;
        }
        if (written_ + line.size() + 1 > kRotateAtBytes) {
            closeUnlocked_();
            std::error_code ec;
            fs::path previous = path_;
            previous += ".1";
            fs::remove(previous, ec);
            fs::rename(path_, previous, ec);
            if (!openUnlocked_()) {
                return false;
            }
        }
        out_ << line << '\n';
        out_.flush();
        written_ += line.size() + 1;
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closeUnlocked_();
    }

private:
    bool openUnlocked_() {
        if (out_.is_open()) {
            return true;
        }
        std::error_code ec;
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path(), ec);
        }
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_) {
            return false;
        }
        const auto existing = fs::file_size(path_, ec);
        written_ = ec ? 0 : existing;
        return true;
    }

    void closeUnlocked_() {
        if (out_.is_open()) {
            out_.flush();
            out_.close();
        }
        written_ = 0;
    }

    std::mutex mutex_;
    fs::path path_{fs::path("./logs") / kVerboseFileName};
    std::ofstream out_;
    std::uintmax_t written_ = 0;
    bool enabled_ = false;
};

std::string render(const Record& record) {
    using namespace std::chrono;
    const auto sinceEpoch = duration_cast<milliseconds>(record.at.time_since_epoch()).count();
    const std::time_t secs = static_cast<std::time_t>(sinceEpoch / 1000);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    char prefix[96];
    std::snprintf(prefix, sizeof(prefix), "%02d:%02d:%02d.%03d %-5s %-9s ", utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<int>(sinceEpoch % 1000), logging::Log::level_to_string(record.level),
                  logging::Log::category_to_string(record.category));
    return prefix + record.text;
}

void writeConsole(FILE* target, const std::string& line) {
    std::fprintf(target, "%s\n", line.c_str());
    std::fflush(target);
}

// Background writer. Producers never touch stdio; one thread drains the backlog.
class Writer {
public:
    static Writer& instance() {
        static Writer writer;
        return writer;
    }

    VerboseFile& verboseFile() { return file_; }

    bool submit(Record record) {
        std::call_once(started_, [this] {
            thread_ = std::thread([this] { drain_(); });
            std::atexit([] { Writer::instance().shutdown_(); });
        });
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || backlog_.size() >= kBacklogLimit) {
                return false;
            }
            backlog_.push_back(std::move(record));
        }
        wake_.notify_one();
        return true;
    }

    void waitIdle() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        idle_.wait(lock, [this] { return closed_ || (backlog_.empty() && !writing_); });
    }

    void emit(const Record& record) {
        const std::string line = render(record);
        if (record.level == config::LogLevel::Error || record.level == config::LogLevel::Warn) {
            writeConsole(stderr, line);
        }
        else if (record.level == config::LogLevel::Info || !file_.append(line)) {
            writeConsole(stdout, line);
        }
    }

private:
    void drain_() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            wake_.wait(lock, [this] { return closed_ || !backlog_.empty(); });
            if (backlog_.empty()) {
                break;
            }
            Record next = std::move(backlog_.front());
            backlog_.pop_front();
            writing_ = true;
            lock.unlock();
            emit(next);
            lock.lock();
            writing_ = false;
            if (backlog_.empty()) {
                idle_.notify_all();
            }
        }
        idle_.notify_all();
    }

    void shutdown_() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        file_.close();
    }

    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<Record> backlog_;
    bool writing_ = false;
    bool closed_ = false;
    std::once_flag started_;
    std::thread thread_;
    VerboseFile file_;
};

}  // namespace

namespace logging {

std::atomic<config::LogLevel> Log::currentLevel{config::LogLevel::Info};

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
    Writer::instance().verboseFile().setEnabled(isVerbose(level));
}

void Log::set_log_directory(const std::string& dir) {
    Writer::instance().verboseFile().setDirectory(dir);
}

void Log::flush() {
    Writer::instance().waitIdle();
}

bool Log::try_parse_log_level(std::string_view value, config::LogLevel& levelOut) {
    struct Name {
        const char* text;
        config::LogLevel level;
    };
    static constexpr std::array<Name, 6> kNames{{
        {"trace", config::LogLevel::Trace},
        {"debug", config::LogLevel::Debug},
        {"info", config::LogLevel::Info},
        {"warn", config::LogLevel::Warn},
        {"warning", config::LogLevel::Warn},
        {"error", config::LogLevel::Error},
    }};

    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto match = std::find_if(kNames.begin(), kNames.end(), [&](const Name& n) { return lowered == n.text; });
    if (match == kNames.end()) {
        return false;
    }
    levelOut = match->level;
    return true;
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error: return "ERROR";
    case config::LogLevel::Warn: return "WARN";
    case config::LogLevel::Info: return "INFO";
    case config::LogLevel::Debug: return "DEBUG";
    case config::LogLevel::Trace: return "TRACE";
    }
    return "?";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET: return "NET";
    case LogCategory::DATA: return "DATA";
    case LogCategory::STORE: return "STORE";
    case LogCategory::RENDER: return "RENDER";
    case LogCategory::ALERT: return "ALERT";
    case LogCategory::RATE: return "RATE";
    case LogCategory::WORKSPACE: return "WORKSPACE";
    case LogCategory::UI: return "UI";
    }
    return "?";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (config::logLevelSeverity(level) < config::logLevelSeverity(currentLevel.load(std::memory_order_relaxed))) {
        return;
    }

    std::array<char, kLineLimit> text{};
    const int needed = std::vsnprintf(text.data(), text.size(), fmt, args);
    Record record{level, category, std::chrono::system_clock::now(), {}};
    if (needed < 0) {
        record.text = "<bad log format>";
    }
    else {
        record.text.assign(text.data());
        if (static_cast<std::size_t>(needed) >= text.size()) {
            record.text.replace(record.text.size() - 3, 3, "...");
        }
    }

    auto& writer = Writer::instance();
    const bool urgent = level == config::LogLevel::Error || level == config::LogLevel::Warn;
    Record fallback = urgent ? record : Record{};
    // A full backlog drops chatter but still writes warnings and errors in place.
    if (!writer.submit(std::move(record)) && urgent) {
        writer.emit(fallback);
    }
}

}  // namespace logging
