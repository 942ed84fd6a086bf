#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "common/Metrics.hpp"
#include "domain/Errors.h"

namespace core {

// Token bucket in front of every outbound vendor call.
//
// Tokens refill continuously at tokensPerSecond up to burst. The refill is computed from the
// elapsed time whenever a caller asks for a token, so an idle governor costs nothing. Waiters
// take numbered tickets and are served in ticket order, which keeps acquisition starvation free.
class RateGovernor {
public:
    using Clock = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Config {
        double tokensPerSecond = 10.0;
        double burst = 20.0;
        std::vector<std::chrono::milliseconds> backoff{std::chrono::seconds(1), std::chrono::seconds(2),
                                                       std::chrono::seconds(4)};
    };

    // sleeper replaces the interruptible backoff wait, for tests.
    explicit RateGovernor(Config config, Sleeper sleeper = {});
    ~RateGovernor();

    RateGovernor(const RateGovernor&) = delete;
    RateGovernor& operator=(const RateGovernor&) = delete;

    // Blocks until a token is available. Throws GovernorStopped after shutdown().
    void acquire();
    bool tryAcquire();
    double availableTokens();

    // Runs call under a permit. Rate-limited failures are retried on the backoff schedule;
    // when the schedule is used up the last failure is rethrown as RateLimitExhausted.
    template <typename Call>
    auto execute(const std::string& name, Call&& call) -> decltype(call()) {
        const int maxRetries = static_cast<int>(config_.backoff.size());
        for (int attempt = 0;; ++attempt) {
            acquire();
            try {
                tw::common::metrics::Registry::ScopedTimer timer(name);
                return call();
            }
            catch (const std::exception& ex) {
                if (!isRateLimited_(ex)) {
                    throw;
                }
                if (attempt >= maxRetries) {
                    throw exhausted_(name, ex.what(), attempt + 1);
                }
                backoff_(name, attempt, ex.what());
            }
        }
    }

    void shutdown();

    std::uint64_t granted() const;
    const Config& config() const { return config_; }

private:
    static bool isRateLimited_(const std::exception& ex);
    domain::RateLimitExhausted exhausted_(const std::string& name, const std::string& lastError, int attempts);
    void backoff_(const std::string& name, int attempt, const std::string& reason);
    void refillLocked_(Clock::time_point now);

    const Config config_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    double tokens_;
    Clock::time_point lastRefill_;
    std::uint64_t nextTicket_{0};
    std::uint64_t nowServing_{0};
    std::uint64_t granted_{0};
    bool stopped_{false};
};

}  // namespace core
