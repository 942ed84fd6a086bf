#include "app/PushIngestor.h"

#include <exception>
#include <utility>

#include "adapters/vendor/VendorCodec.hpp"
#include "common/Metrics.hpp"
#include "core/EventBus.h"
#include "core/LogUtils.h"
#include "core/MarketStateStore.h"
#include "domain/Errors.h"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::DATA;

domain::TimestampMs wallNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

core::LogRateLimiter& decodeErrorLimiter() {
    static core::LogRateLimiter limiter(std::chrono::seconds(5));
    return limiter;
}

}  // namespace

PushIngestor::PushIngestor(domain::IPushStream& stream,
                           core::MarketStateStore& store,
                           core::EventBus& bus,
                           Callbacks callbacks,
                           std::chrono::milliseconds readTimeout)
    : stream_(stream),
      store_(store),
      bus_(bus),
      callbacks_(std::move(callbacks)),
      readTimeout_(readTimeout) {}

PushIngestor::~PushIngestor() {
    stop();
}

void PushIngestor::start() {
    if (worker_.joinable()) {
        return;
    }
    stopRequested_.store(false, std::memory_order_release);
    fatalReported_.store(false, std::memory_order_release);
    stream_.start();
    observeState_(stream_.state());

    worker_ = std::thread([this]() {
        try {
            LOG_INFO(kLogCategory, "push ingestion thread starting");
            run_();
            LOG_INFO(kLogCategory, "push ingestion thread finished (applied=%llu decode_errors=%llu)",
                     static_cast<unsigned long long>(applied()), static_cast<unsigned long long>(decodeErrors()));
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "push ingestion thread crashed: %s", ex.what());
            reportFatal_(std::string{"ingestion crashed: "} + ex.what());
        }
    });
}

void PushIngestor::stop() {
    stopRequested_.store(true, std::memory_order_release);
    if (worker_.joinable()) {
        worker_.join();
    }
    stream_.stop();
}

std::string PushIngestor::fatalReason() const {
    std::lock_guard<std::mutex> lock(reasonMutex_);
    return fatalReason_;
}

void PushIngestor::run_() {
    while (!stopRequested_.load(std::memory_order_acquire)) {
        auto read = stream_.next(readTimeout_);
        observeState_(stream_.state());

        switch (read.kind) {
        case domain::StreamRead::Kind::Timeout:
            break;
        case domain::StreamRead::Kind::Frame:
            lastFrameMs_.store(wallNowMs(), std::memory_order_release);
            handleFrame(read.payload);
            break;
        case domain::StreamRead::Kind::Closed:
            if (stopRequested_.load(std::memory_order_acquire)) {
                return;
            }
            reportFatal_(read.payload.empty() ? std::string{"stream closed"} : read.payload);
            return;
        }
    }
}

bool PushIngestor::handleFrame(const std::string& payload) {
    namespace vendor = adapters::vendor;
    LOG_GUARD_RET(!payload.empty(), kLogCategory, false, "empty push frame skipped");
    try {
        auto frame = vendor::parse_push_frame(payload);
        std::optional<domain::ChangeNotification> note;
        switch (frame.type) {
        case vendor::FrameType::Ping:
        case vendor::FrameType::Status:
            return false;
        case vendor::FrameType::Quote: {
            auto fields = vendor::decode_quote(frame.data);
            if (!fields.hasPrevClose) {
                if (auto previous = store_.getQuote(frame.instrument)) {
                    fields.quote.prevClose = previous->prevClose;
                }
            }
            note = store_.updateQuote(frame.instrument, std::move(fields.quote));
            break;
        }
        case vendor::FrameType::Depth:
            note = store_.updateDepth(frame.instrument, vendor::decode_depth(frame.data));
            break;
        case vendor::FrameType::Trade:
            note = store_.updateTrades(frame.instrument, vendor::decode_trades(frame.data));
            break;
        case vendor::FrameType::Candle: {
            auto [period, bar] = vendor::decode_candle(frame.data);
            note = store_.updateCandle(frame.instrument, period, bar);
            break;
        }
        }

        if (!note) {
            return false;
        }
        applied_.fetch_add(1, std::memory_order_relaxed);
        bus_.publish(*note);
        return true;
    }
    catch (const domain::DecodeError& ex) {
        decodeErrors_.fetch_add(1, std::memory_order_relaxed);
        tw::common::metrics::Registry::instance().incrementCounter("push_decode_errors_total");
        std::size_t suppressed = 0;
        if (decodeErrorLimiter().allow(&suppressed)) {
            LOG_WARN(kLogCategory, "skipping undecodable push frame: %s (suppressed=%zu)", ex.what(), suppressed);
        }
        return false;
    }
}

void PushIngestor::observeState_(domain::StreamState state) {
    const auto previous = state_.exchange(state, std::memory_order_acq_rel);
    if (previous == state) {
        return;
    }
    if (callbacks_.onStatus) {
        try {
            callbacks_.onStatus(state);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "status callback threw: %s", ex.what());
        }
    }
}

void PushIngestor::reportFatal_(const std::string& reason) {
    if (fatalReported_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(reasonMutex_);
        fatalReason_ = reason;
    }
    LOG_ERROR(kLogCategory, "push stream lost for good: %s", reason.c_str());
    observeState_(domain::StreamState::Closed);
    if (callbacks_.onFatal) {
        try {
            callbacks_.onFatal(reason);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "fatal callback threw: %s", ex.what());
        }
    }
}

}  // namespace app
