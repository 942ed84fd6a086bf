#include "app/ApiContext.h"

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace app {

ApiContext::ApiContext(core::RateGovernor& governor, domain::IQuoteGateway& gateway, domain::IPushStream& stream)
    : governor_(governor), gateway_(gateway), stream_(stream) {}

std::vector<std::pair<domain::InstrumentId, domain::Quote>> ApiContext::fetchQuotes(
    const std::vector<domain::InstrumentId>& instruments) {
    std::vector<std::pair<domain::InstrumentId, domain::Quote>> quotes;
    const std::size_t step = domain::IQuoteGateway::kMaxQuotesPerCall;
    // One permit per request; a rate-limited chunk is retried alone.
    for (std::size_t begin = 0; begin < instruments.size(); begin += step) {
        const auto first = instruments.begin() + static_cast<std::ptrdiff_t>(begin);
        const std::vector<domain::InstrumentId> chunk(
            first, first + static_cast<std::ptrdiff_t>(std::min(step, instruments.size() - begin)));
        auto part = governor_.execute("rest.quote", [&]() { return gateway_.fetchQuotes(chunk); });
        quotes.insert(quotes.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return quotes;
}

domain::CandleFragment ApiContext::fetchCandles(const domain::InstrumentId& instrument, domain::ChartPeriod period,
                                                std::size_t count) {
    return governor_.execute("rest.candlesticks",
                             [&]() { return gateway_.fetchCandles(instrument, period, count); });
}

domain::Portfolio ApiContext::fetchPortfolio() {
    return governor_.execute("rest.portfolio", [&]() { return gateway_.fetchPortfolio(); });
}

void ApiContext::subscribe(const std::vector<domain::InstrumentId>& instruments,
                           const std::vector<domain::ChangeCategory>& topics) {
    governor_.execute("push.subscribe", [&]() { stream_.subscribe(instruments, topics); });
}

void ApiContext::unsubscribe(const std::vector<domain::InstrumentId>& instruments,
                             const std::vector<domain::ChangeCategory>& topics) {
    governor_.execute("push.unsubscribe", [&]() { stream_.unsubscribe(instruments, topics); });
}

}  // namespace app
