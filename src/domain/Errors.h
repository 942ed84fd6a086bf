#pragma once

#include <stdexcept>
#include <string>

namespace domain {

// Failure of an outbound call. status is the HTTP status when one was received, 0 otherwise.
class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& message, unsigned status = 0U)
        : std::runtime_error(message), status_(status) {}

    unsigned status() const noexcept { return status_; }
    bool rateLimited() const;

private:
    unsigned status_;
};

// Raised by the rate governor once the retry schedule is used up.
class RateLimitExhausted : public UpstreamError {
public:
    RateLimitExhausted(const std::string& request, const std::string& lastError, int attempts);

    int attempts() const noexcept { return attempts_; }

private:
    int attempts_;
};

class GovernorStopped : public std::runtime_error {
public:
    GovernorStopped() : std::runtime_error("rate governor stopped") {}
};

// Push frame or persisted document that could not be understood.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// True when a message looks like a throttling response from the vendor.
bool is_rate_limit_message(const std::string& message);

}  // namespace domain
