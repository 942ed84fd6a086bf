#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace app {

// Single-threaded merge of the four event sources driving the UI.
//
// Priority is UserInput > FatalSignal > DataUpdate > Tick, one source per step. Data
// notifications are coalesced by (instrument, category) until served. A tick that is due
// after a data batch runs before the next batch, so ticks are never starved by a busy feed.
class EventDispatcher {
public:
    using Clock = std::chrono::steady_clock;

    enum class Source { UserInput, FatalSignal, DataUpdate, Tick };

    struct Config {
        std::size_t inputCapacity = 256;
        std::chrono::milliseconds tickInterval{16};
    };

    struct Handlers {
        std::function<void(const std::string& line)> onInput;
        std::function<void(const std::string& reason)> onFatal;
        std::function<void(const std::vector<domain::ChangeNotification>& batch)> onData;
        std::function<void(Clock::time_point now)> onTick;
    };

    EventDispatcher(Config config, Handlers handlers);

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Thread safe producers.
    void postInput(std::string line);
    void postFatal(std::string reason);
    void postData(const domain::ChangeNotification& note);

    // Serves sources until stop().
    void run();
    // Waits at most timeout for work and serves one source. Empty when nothing was served.
    std::optional<Source> runOnce(std::chrono::milliseconds timeout);

    void stop();
    bool stopped() const;

    std::size_t pendingData() const;
    std::size_t pendingInput() const;
    std::uint64_t droppedInput() const;

private:
    struct PendingKeyHash {
        std::size_t operator()(const std::pair<domain::InstrumentId, domain::ChangeCategory>& key) const noexcept;
    };

    std::optional<Source> selectLocked_(Clock::time_point now) const;
    void serve_(Source source, std::unique_lock<std::mutex>& lock, Clock::time_point now);

    const Config config_;
    Handlers handlers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> input_;
    std::deque<std::string> fatal_;
    std::vector<domain::ChangeNotification> data_;
    std::unordered_map<std::pair<domain::InstrumentId, domain::ChangeCategory>, std::size_t, PendingKeyHash> dataKeys_;
    Clock::time_point nextTick_;
    bool lastServedData_{false};
    bool stopped_{false};
    std::uint64_t droppedInput_{0};
};

const char* dispatcher_source_label(EventDispatcher::Source source);

}  // namespace app
