#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/PushIngestor.h"
#include "core/EventBus.h"
#include "core/MarketStateStore.h"

using domain::InstrumentId;
using domain::StreamRead;
using domain::StreamState;

namespace {

bool waitForCondition(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Replays queued frames, then reports the connection as gone.
class ScriptedStream : public domain::IPushStream {
public:
    explicit ScriptedStream(std::vector<std::string> frames, std::string closeReason = "peer gone")
        : frames_(frames.begin(), frames.end()), closeReason_(std::move(closeReason)) {}

    void start() override { state_.store(StreamState::Open); }
    void stop() override { stops_.fetch_add(1); }

    StreamRead next(std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        StreamRead read;
        if (!frames_.empty()) {
            read.kind = StreamRead::Kind::Frame;
            read.payload = std::move(frames_.front());
            frames_.pop_front();
            return read;
        }
        state_.store(StreamState::Closed);
        read.kind = StreamRead::Kind::Closed;
        read.payload = closeReason_;
        return read;
    }

    void subscribe(const std::vector<InstrumentId>&, const std::vector<domain::ChangeCategory>&) override {}
    void unsubscribe(const std::vector<InstrumentId>&, const std::vector<domain::ChangeCategory>&) override {}

    StreamState state() const override { return state_.load(); }

    int stops() const { return stops_.load(); }

private:
    std::mutex mutex_;
    std::deque<std::string> frames_;
    std::string closeReason_;
    std::atomic<StreamState> state_{StreamState::Connecting};
    std::atomic<int> stops_{0};
};

}  // namespace

int main() {
    const InstrumentId tencent("700.HK");

    {
        ScriptedStream stream({});
        core::MarketStateStore store;
        core::EventBus bus;
        std::vector<domain::ChangeNotification> seen;
        auto sub = bus.subscribe([&](const domain::ChangeNotification& n) { seen.push_back(n); });
        app::PushIngestor ingestor(stream, store, bus, {});

        if (!ingestor.handleFrame(
                R"({"type":"quote","symbol":"700.HK","data":{"last_done":321.5,"prev_close":300,"volume":1200,"timestamp":1000}})")) {
            std::cerr << "First quote should be applied\n";
            return 1;
        }
        if (!ingestor.handleFrame(R"({"type":"quote","symbol":"700.HK","data":{"last_done":322.0,"timestamp":2000}})")) {
            std::cerr << "Quote without prev_close should still be applied\n";
            return 1;
        }
        auto quote = store.getQuote(tencent);
        if (!quote || quote->lastPrice != 322.0 || quote->prevClose != 300.0) {
            std::cerr << "Previous close should carry forward from the stored quote\n";
            return 1;
        }

        if (ingestor.handleFrame(R"({"type":"quote","symbol":"700.HK","data":{"last_done":1.0,"timestamp":1500}})")) {
            std::cerr << "Older quote must be skipped\n";
            return 1;
        }
        if (store.getQuote(tencent)->lastPrice != 322.0) {
            std::cerr << "Older quote must not overwrite the newer one\n";
            return 1;
        }

        if (ingestor.handleFrame(R"({"type":"ping"})")) {
            std::cerr << "Ping frames are control frames and must be skipped\n";
            return 1;
        }
        if (ingestor.handleFrame("not json") || ingestor.handleFrame(R"({"type":"mystery","symbol":"700.HK","data":{}})")
            || ingestor.handleFrame(R"({"type":"quote","symbol":"700.HK","data":{"timestamp":3000}})")) {
            std::cerr << "Undecodable frames must be skipped\n";
            return 1;
        }
        if (ingestor.decodeErrors() != 3) {
            std::cerr << "Expected three decode errors, got " << ingestor.decodeErrors() << '\n';
            return 1;
        }

        if (!ingestor.handleFrame(
                R"({"type":"depth","symbol":"700.HK","data":{"asks":[{"position":1,"price":322.2,"volume":500,"order_num":3}],"bids":[{"position":1,"price":321.8,"volume":800,"order_num":5}],"timestamp":2100}})")) {
            std::cerr << "Depth frame should be applied\n";
            return 1;
        }
        if (!ingestor.handleFrame(
                R"({"type":"trade","symbol":"700.HK","data":{"trades":[{"price":322.0,"volume":100,"timestamp":2200,"direction":"up"},{"price":321.9,"volume":200,"timestamp":2150,"direction":"down"}]}})")) {
            std::cerr << "Trade frame should be applied\n";
            return 1;
        }
        if (!ingestor.handleFrame(
                R"({"type":"candle","symbol":"700.HK","data":{"period":"1m","timestamp":60000,"open":321,"high":323,"low":320.5,"close":322,"volume":9000}})")) {
            std::cerr << "Candle frame should be applied\n";
            return 1;
        }

        auto snapshot = store.get(tencent);
        if (!snapshot || !snapshot->depth || snapshot->depth->asks.size() != 1 || !snapshot->trades
            || snapshot->trades->trades.size() != 2 || !snapshot->candles || snapshot->candles->bars.size() != 1) {
            std::cerr << "Depth, trades and candles should all be stored\n";
            return 1;
        }
        if (snapshot->trades->trades.front().timestamp != 2150) {
            std::cerr << "Trades in one frame should be applied oldest first\n";
            return 1;
        }

        if (ingestor.applied() != 5 || seen.size() != 5) {
            std::cerr << "Expected five applied frames and five notifications, got " << ingestor.applied() << "/"
                      << seen.size() << '\n';
            return 1;
        }
        const std::vector<domain::ChangeCategory> expected = {
            domain::ChangeCategory::Quote, domain::ChangeCategory::Quote, domain::ChangeCategory::Depth,
            domain::ChangeCategory::Trades, domain::ChangeCategory::Candle};
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (seen[i].category != expected[i] || seen[i].instrument != tencent) {
                std::cerr << "Notification " << i << " has the wrong category or instrument\n";
                return 1;
            }
            if (i > 0 && seen[i].sequence <= seen[i - 1].sequence) {
                std::cerr << "Notification sequences must increase\n";
                return 1;
            }
        }
    }

    {
        ScriptedStream stream({
            R"({"type":"quote","symbol":"AAPL.US","data":{"last_done":190.1,"prev_close":188,"timestamp":10}})",
            R"({"type":"status","symbol":"","data":{}})",
            "garbage",
            R"({"type":"quote","symbol":"AAPL.US","data":{"last_done":190.4,"timestamp":20}})",
        });
        core::MarketStateStore store;
        core::EventBus bus;
        std::atomic<int> published{0};
        auto sub = bus.subscribe([&](const domain::ChangeNotification&) { published.fetch_add(1); });

        std::atomic<int> fatalCalls{0};
        std::mutex reasonMutex;
        std::string reason;
        std::vector<StreamState> states;
        std::mutex statesMutex;

        app::PushIngestor::Callbacks callbacks;
        callbacks.onFatal = [&](const std::string& why) {
            {
                std::lock_guard<std::mutex> lock(reasonMutex);
                reason = why;
            }
            fatalCalls.fetch_add(1);
        };
        callbacks.onStatus = [&](StreamState state) {
            std::lock_guard<std::mutex> lock(statesMutex);
            states.push_back(state);
        };

        app::PushIngestor ingestor(stream, store, bus, callbacks, std::chrono::milliseconds(10));
        ingestor.start();

        if (!waitForCondition([&]() { return fatalCalls.load() > 0; })) {
            std::cerr << "Stream loss should be reported as fatal\n";
            return 1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ingestor.stop();

        if (fatalCalls.load() != 1) {
            std::cerr << "Fatal callback must run exactly once, ran " << fatalCalls.load() << '\n';
            return 1;
        }
        {
            std::lock_guard<std::mutex> lock(reasonMutex);
            if (reason != "peer gone" || ingestor.fatalReason() != "peer gone") {
                std::cerr << "Fatal reason should come from the stream, got '" << reason << "'\n";
                return 1;
            }
        }
        if (ingestor.state() != StreamState::Closed) {
            std::cerr << "Ingestor should end in the Closed state\n";
            return 1;
        }
        {
            std::lock_guard<std::mutex> lock(statesMutex);
            if (states.empty() || states.front() != StreamState::Open || states.back() != StreamState::Closed) {
                std::cerr << "Status callback should see Open then Closed\n";
                return 1;
            }
        }
        if (published.load() != 2 || ingestor.applied() != 2 || ingestor.decodeErrors() != 1) {
            std::cerr << "Expected two applied quotes and one decode error\n";
            return 1;
        }
        if (ingestor.lastFrameMs() <= 0) {
            std::cerr << "Receiving frames should record the last frame time\n";
            return 1;
        }
        auto quote = store.getQuote(InstrumentId("AAPL.US"));
        if (!quote || quote->lastPrice != 190.4 || quote->prevClose != 188.0) {
            std::cerr << "Streamed quotes should reach the store with carried previous close\n";
            return 1;
        }
        if (stream.stops() < 1) {
            std::cerr << "Stopping the ingestor should stop the stream\n";
            return 1;
        }
    }

    std::cout << "PushIngestor tests passed\n";
    return 0;
}
