#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace domain {

// Request/response side of the vendor API. Implementations throw UpstreamError.
class IQuoteGateway {
public:
    // Largest instrument list one fetchQuotes call accepts; callers split longer lists.
    static constexpr std::size_t kMaxQuotesPerCall = 50;

    virtual ~IQuoteGateway() = default;

    virtual std::vector<std::pair<InstrumentId, Quote>> fetchQuotes(const std::vector<InstrumentId>& instruments) = 0;
    virtual CandleFragment fetchCandles(const InstrumentId& instrument, ChartPeriod period, std::size_t count) = 0;
    virtual Portfolio fetchPortfolio() = 0;
};

struct StreamRead {
    enum class Kind { Frame, Timeout, Closed };

    Kind kind{Kind::Timeout};
    std::string payload;  // Frame: raw text; Closed: reason
};

// Push-subscription side of the vendor API.
class IPushStream {
public:
    virtual ~IPushStream() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    // Waits up to timeout for the next frame. Closed is terminal.
    virtual StreamRead next(std::chrono::milliseconds timeout) = 0;

    virtual void subscribe(const std::vector<InstrumentId>& instruments,
                           const std::vector<ChangeCategory>& topics) = 0;
    virtual void unsubscribe(const std::vector<InstrumentId>& instruments,
                             const std::vector<ChangeCategory>& topics) = 0;

    virtual StreamState state() const = 0;
};

}  // namespace domain
