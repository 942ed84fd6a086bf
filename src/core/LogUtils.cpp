#include "core/LogUtils.h"

namespace core {

bool LogRateLimiter::allow(std::size_t* suppressedOut) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (lastPass_ && now - *lastPass_ < window_) {
        ++held_;
        return false;
    }
    lastPass_ = now;
    if (suppressedOut != nullptr) {
        *suppressedOut = held_;
    }
    held_ = 0;
    return true;
}

}  // namespace core
