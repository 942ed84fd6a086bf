#include "domain/Errors.h"

#include <algorithm>
#include <cctype>

namespace domain {

bool is_rate_limit_message(const std::string& message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lower.find("429") != std::string::npos
        || lower.find("rate limit") != std::string::npos
        || lower.find("too many requests") != std::string::npos;
}

bool UpstreamError::rateLimited() const {
    return status_ == 429U || is_rate_limit_message(what());
}

RateLimitExhausted::RateLimitExhausted(const std::string& request, const std::string& lastError, int attempts)
    : UpstreamError("rate limit exhausted for " + request + " after " + std::to_string(attempts)
                        + " attempts: " + lastError,
                    429U),
      attempts_(attempts) {}

}  // namespace domain
