#include "core/RateGovernor.h"

#include <algorithm>

#include "logging/Log.h"

namespace core {
namespace {
constexpr logging::LogCategory kLogCategory = logging::LogCategory::RATE;
}

RateGovernor::RateGovernor(Config config, Sleeper sleeper)
    : config_([&config] {
          config.tokensPerSecond = std::max(config.tokensPerSecond, 1.0);
          config.burst = std::max(config.burst, 1.0);
          return config;
      }()),
      sleeper_(std::move(sleeper)),
      tokens_(config_.burst),
      lastRefill_(Clock::now()) {}

RateGovernor::~RateGovernor() {
    shutdown();
}

void RateGovernor::refillLocked_(Clock::time_point now) {
    if (now <= lastRefill_) {
        return;
    }
    const std::chrono::duration<double> elapsed = now - lastRefill_;
    tokens_ = std::min(config_.burst, tokens_ + elapsed.count() * config_.tokensPerSecond);
    lastRefill_ = now;
}

void RateGovernor::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::uint64_t ticket = nextTicket_++;
    while (true) {
        if (stopped_) {
            throw domain::GovernorStopped();
        }
        if (ticket != nowServing_) {
            cv_.wait(lock);
            continue;
        }

        refillLocked_(Clock::now());
        if (tokens_ >= 1.0) {
            tokens_ -= 1.0;
            ++nowServing_;
            ++granted_;
            lock.unlock();
            cv_.notify_all();
            return;
        }

        const double missing = 1.0 - tokens_;
        const auto wait = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(missing / config_.tokensPerSecond));
        cv_.wait_for(lock, wait);
    }
}

bool RateGovernor::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || nextTicket_ != nowServing_) {
        return false;
    }
    refillLocked_(Clock::now());
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    ++granted_;
    return true;
}

double RateGovernor::availableTokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refillLocked_(Clock::now());
    return tokens_;
}

void RateGovernor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    cv_.notify_all();
}

std::uint64_t RateGovernor::granted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return granted_;
}

bool RateGovernor::isRateLimited_(const std::exception& ex) {
    if (const auto* upstream = dynamic_cast<const domain::UpstreamError*>(&ex)) {
        return upstream->rateLimited();
    }
    return domain::is_rate_limit_message(ex.what());
}

domain::RateLimitExhausted RateGovernor::exhausted_(const std::string& name, const std::string& lastError,
                                                    int attempts) {
    tw::common::metrics::Registry::instance().incrementCounter("rate_limit_exhausted_total");
    LOG_WARN(kLogCategory, "request=%s rate limited after %d attempts: %s", name.c_str(), attempts,
             lastError.c_str());
    return domain::RateLimitExhausted(name, lastError, attempts);
}

void RateGovernor::backoff_(const std::string& name, int attempt, const std::string& reason) {
    const auto delay = config_.backoff[static_cast<std::size_t>(attempt)];
    tw::common::metrics::Registry::instance().incrementCounter("rate_limited_retries_total");
    LOG_INFO(kLogCategory, "request=%s rate limited (%s), retry %d in %lld ms", name.c_str(), reason.c_str(),
             attempt + 1, static_cast<long long>(delay.count()));

    if (sleeper_) {
        sleeper_(delay);
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, delay, [this] { return stopped_; })) {
        throw domain::GovernorStopped();
    }
}

}  // namespace core
