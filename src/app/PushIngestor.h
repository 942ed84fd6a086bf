#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "domain/Ports.hpp"
#include "domain/Types.h"

namespace core {
class EventBus;
class MarketStateStore;
}

namespace app {

// Single consumer of the push stream: decodes frames, applies them to the store and
// publishes the resulting change notifications in receipt order.
class PushIngestor {
public:
    struct Callbacks {
        // Called once when the stream closes for good.
        std::function<void(const std::string& reason)> onFatal;
        std::function<void(domain::StreamState state)> onStatus;
    };

    PushIngestor(domain::IPushStream& stream,
                 core::MarketStateStore& store,
                 core::EventBus& bus,
                 Callbacks callbacks,
                 std::chrono::milliseconds readTimeout = std::chrono::milliseconds(100));
    ~PushIngestor();

    PushIngestor(const PushIngestor&) = delete;
    PushIngestor& operator=(const PushIngestor&) = delete;

    // Starts the stream and the consumer thread.
    void start();
    // Stops the consumer thread, then the stream.
    void stop();

    // Applies one raw frame. Returns false when it was skipped (control frame, stale or
    // undecodable). Used by the consumer thread.
    bool handleFrame(const std::string& payload);

    domain::StreamState state() const { return state_.load(std::memory_order_acquire); }
    domain::TimestampMs lastFrameMs() const { return lastFrameMs_.load(std::memory_order_acquire); }
    std::string fatalReason() const;

    std::uint64_t applied() const { return applied_.load(std::memory_order_relaxed); }
    std::uint64_t decodeErrors() const { return decodeErrors_.load(std::memory_order_relaxed); }

private:
    void run_();
    void observeState_(domain::StreamState state);
    void reportFatal_(const std::string& reason);

    domain::IPushStream& stream_;
    core::MarketStateStore& store_;
    core::EventBus& bus_;
    Callbacks callbacks_;
    const std::chrono::milliseconds readTimeout_;

    std::atomic<bool> stopRequested_{false};
    std::thread worker_;

    std::atomic<domain::StreamState> state_{domain::StreamState::Connecting};
    std::atomic<domain::TimestampMs> lastFrameMs_{0};
    std::atomic<bool> fatalReported_{false};
    mutable std::mutex reasonMutex_;
    std::string fatalReason_;

    std::atomic<std::uint64_t> applied_{0};
    std::atomic<std::uint64_t> decodeErrors_{0};
};

}  // namespace app
