#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/RateGovernor.h"
#include "domain/Errors.h"

using core::RateGovernor;

namespace {
using namespace std::chrono_literals;

RateGovernor::Config makeConfig(double rate, double burst) {
    RateGovernor::Config config;
    config.tokensPerSecond = rate;
    config.burst = burst;
    return config;
}

}  // namespace

int main() {
    // Burst capacity is available immediately, the next call is refused.
    {
        RateGovernor governor(makeConfig(10.0, 20.0));
        int granted = 0;
        for (int i = 0; i < 21; ++i) {
            if (governor.tryAcquire()) {
                ++granted;
            }
        }
        if (granted != 20) {
            std::cerr << "Expected 20 immediate permits, got " << granted << "\n";
            return 1;
        }
        if (governor.availableTokens() < 0.0) {
            std::cerr << "Token count went negative\n";
            return 1;
        }
    }

    // 30 concurrent callers: 20 pass at once, the rest drain at the refill rate, none dropped.
    {
        RateGovernor governor(makeConfig(10.0, 20.0));
        std::vector<RateGovernor::Clock::time_point> grantedAt(30);
        std::vector<std::thread> callers;
        const auto start = RateGovernor::Clock::now();
        for (std::size_t i = 0; i < grantedAt.size(); ++i) {
            callers.emplace_back([&, i]() {
                governor.acquire();
                grantedAt[i] = RateGovernor::Clock::now();
            });
        }
        for (auto& caller : callers) {
            caller.join();
        }
        const auto elapsed = RateGovernor::Clock::now() - start;
        if (governor.granted() != 30) {
            std::cerr << "Expected 30 permits, got " << governor.granted() << "\n";
            return 1;
        }
        if (elapsed < 800ms || elapsed > 3s) {
            std::cerr << "Expected the last 10 permits to take about one second, took "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << " ms\n";
            return 1;
        }
        int early = 0;
        for (const auto& at : grantedAt) {
            if (at - start < 200ms) {
                ++early;
            }
        }
        if (early > 21) {
            std::cerr << "More than burst + refill permits granted in the first 200 ms: " << early << "\n";
            return 1;
        }
    }

    // Rate-limited failures are retried on the backoff schedule.
    {
        std::vector<std::chrono::milliseconds> slept;
        RateGovernor governor(makeConfig(100.0, 10.0), [&](std::chrono::milliseconds delay) { slept.push_back(delay); });
        int calls = 0;
        const int result = governor.execute("test.retry", [&]() {
            if (++calls < 3) {
                throw domain::UpstreamError("too many requests", 429);
            }
            return 42;
        });
        if (result != 42 || calls != 3) {
            std::cerr << "Expected success on the third attempt (calls=" << calls << ")\n";
            return 1;
        }
        if (slept.size() != 2 || slept[0] != 1s || slept[1] != 2s) {
            std::cerr << "Expected backoff of 1s then 2s\n";
            return 1;
        }
    }

    // Schedule exhausted: the failure surfaces as RateLimitExhausted.
    {
        RateGovernor governor(makeConfig(100.0, 10.0), [](std::chrono::milliseconds) {});
        int calls = 0;
        bool exhausted = false;
        try {
            governor.execute("test.exhaust", [&]() {
                ++calls;
                throw domain::UpstreamError("rate limited", 429);
            });
        }
        catch (const domain::RateLimitExhausted& ex) {
            exhausted = ex.attempts() == 4;
        }
        if (!exhausted || calls != 4) {
            std::cerr << "Expected RateLimitExhausted after 4 attempts (calls=" << calls << ")\n";
            return 1;
        }
    }

    // Other failures are not retried.
    {
        RateGovernor governor(makeConfig(100.0, 10.0), [](std::chrono::milliseconds) {});
        int calls = 0;
        bool passedThrough = false;
        try {
            governor.execute("test.fail", [&]() {
                ++calls;
                throw domain::UpstreamError("not found", 404);
            });
        }
        catch (const domain::RateLimitExhausted&) {
            passedThrough = false;
        }
        catch (const domain::UpstreamError& ex) {
            passedThrough = ex.status() == 404;
        }
        if (!passedThrough || calls != 1) {
            std::cerr << "Expected a 404 to pass through after one call\n";
            return 1;
        }
    }

    // A waiter blocked on an empty bucket is released by shutdown.
    {
        RateGovernor governor(makeConfig(1.0, 1.0));
        governor.acquire();
        std::atomic<bool> stopped{false};
        std::thread waiter([&]() {
            try {
                governor.acquire();
            }
            catch (const domain::GovernorStopped&) {
                stopped.store(true);
            }
        });
        std::this_thread::sleep_for(50ms);
        governor.shutdown();
        waiter.join();
        if (!stopped.load()) {
            std::cerr << "Expected GovernorStopped after shutdown\n";
            return 1;
        }
    }

    return 0;
}
