#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>

namespace core {

// Throttles a noisy log site to one line per window and counts the lines it held back.
class LogRateLimiter {
public:
    explicit LogRateLimiter(std::chrono::milliseconds window) : window_(window) {}

    // When it returns true, `suppressedOut` (if given) receives the count dropped since the last pass.
    bool allow(std::size_t* suppressedOut = nullptr);

private:
    const std::chrono::milliseconds window_;
    std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> lastPass_;
    std::size_t held_{0};
};

}  // namespace core
