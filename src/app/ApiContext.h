#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "core/RateGovernor.h"
#include "domain/Ports.hpp"

namespace app {

// The one place outbound vendor calls are made from. Built once at startup and passed by
// reference; every call runs under the rate governor.
class ApiContext {
public:
    ApiContext(core::RateGovernor& governor, domain::IQuoteGateway& gateway, domain::IPushStream& stream);

    std::vector<std::pair<domain::InstrumentId, domain::Quote>> fetchQuotes(
        const std::vector<domain::InstrumentId>& instruments);
    domain::CandleFragment fetchCandles(const domain::InstrumentId& instrument, domain::ChartPeriod period,
                                        std::size_t count);
    domain::Portfolio fetchPortfolio();

    void subscribe(const std::vector<domain::InstrumentId>& instruments,
                   const std::vector<domain::ChangeCategory>& topics);
    void unsubscribe(const std::vector<domain::InstrumentId>& instruments,
                     const std::vector<domain::ChangeCategory>& topics);

private:
    core::RateGovernor& governor_;
    domain::IQuoteGateway& gateway_;
    domain::IPushStream& stream_;
};

}  // namespace app
