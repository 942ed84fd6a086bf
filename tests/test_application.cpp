#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/Application.h"

using domain::InstrumentId;

namespace fs = std::filesystem;

namespace {

domain::TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

struct GatewayCalls {
    std::atomic<int> quotes{0};
    std::atomic<int> candles{0};
    std::atomic<int> portfolio{0};
};

class FakeGateway : public domain::IQuoteGateway {
public:
    explicit FakeGateway(std::shared_ptr<GatewayCalls> calls) : calls_(std::move(calls)) {}

    std::vector<std::pair<InstrumentId, domain::Quote>> fetchQuotes(const std::vector<InstrumentId>& instruments) override {
        calls_->quotes.fetch_add(1);
        std::vector<std::pair<InstrumentId, domain::Quote>> quotes;
        for (const auto& id : instruments) {
            domain::Quote quote;
            quote.lastPrice = 321.5;
            quote.prevClose = 300.0;
            quote.volume = 1000;
            quote.timestamp = nowMs();
            quotes.emplace_back(id, quote);
        }
        return quotes;
    }

    domain::CandleFragment fetchCandles(const InstrumentId&, domain::ChartPeriod period, std::size_t) override {
        calls_->candles.fetch_add(1);
        domain::CandleFragment fragment;
        fragment.period = period;
        for (int i = 1; i <= 3; ++i) {
            domain::Candle bar;
            bar.openTime = i * 86400000LL;
            bar.open = 300.0;
            bar.high = 330.0;
            bar.low = 290.0;
            bar.close = 320.0;
            bar.volume = 1000;
            bar.closed = true;
            fragment.bars.push_back(bar);
        }
        return fragment;
    }

    domain::Portfolio fetchPortfolio() override {
        calls_->portfolio.fetch_add(1);
        domain::Portfolio portfolio;
        portfolio.currency = "HKD";
        portfolio.totalCash = 1000.0;
        domain::Position position;
        position.instrument = InstrumentId("700.HK");
        position.quantity = 100;
        position.costPrice = 280.0;
        portfolio.positions.push_back(position);
        return portfolio;
    }

private:
    std::shared_ptr<GatewayCalls> calls_;
};

// Stays open and silent unless told to drop the connection.
class QuietStream : public domain::IPushStream {
public:
    explicit QuietStream(bool dropImmediately = false) : drop_(dropImmediately) {}

    void start() override { state_.store(domain::StreamState::Open); }
    void stop() override {}

    domain::StreamRead next(std::chrono::milliseconds timeout) override {
        domain::StreamRead read;
        if (drop_) {
            state_.store(domain::StreamState::Closed);
            read.kind = domain::StreamRead::Kind::Closed;
            read.payload = "reconnects exhausted";
            return read;
        }
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(10)));
        return read;
    }

    void subscribe(const std::vector<InstrumentId>&, const std::vector<domain::ChangeCategory>&) override {}
    void unsubscribe(const std::vector<InstrumentId>&, const std::vector<domain::ChangeCategory>&) override {}

    domain::StreamState state() const override { return state_.load(); }

private:
    const bool drop_;
    std::atomic<domain::StreamState> state_{domain::StreamState::Connecting};
};

class CountingSink : public ui::IRenderSink {
public:
    explicit CountingSink(std::shared_ptr<std::atomic<int>> frames) : frames_(std::move(frames)) {}

    void render(const core::DirtyRegionSet&, const ui::RenderContext&) override { frames_->fetch_add(1); }

private:
    std::shared_ptr<std::atomic<int>> frames_;
};

// Fails the first frame that carries an alert and records the alerts of later frames.
class FlakyAlertSink : public ui::IRenderSink {
public:
    struct Seen {
        std::atomic<int> failures{0};
        std::atomic<int> alertFramesAfterFailure{0};
        std::atomic<std::uint64_t> ruleId{0};
    };

    explicit FlakyAlertSink(std::shared_ptr<Seen> seen) : seen_(std::move(seen)) {}

    void render(const core::DirtyRegionSet&, const ui::RenderContext& context) override {
        if (context.alerts.empty()) {
            return;
        }
        if (seen_->failures.load() == 0) {
            seen_->failures.fetch_add(1);
            throw std::runtime_error("terminal write failed");
        }
        seen_->ruleId.store(context.alerts.front().ruleId);
        seen_->alertFramesAfterFailure.fetch_add(1);
    }

private:
    std::shared_ptr<Seen> seen_;
};

// Read end of a pipe preloaded with console lines; the write end is closed.
int scriptedInput(const std::string& lines) {
    int fds[2];
    if (::pipe(fds) != 0) {
        return -1;
    }
    const auto written = ::write(fds[1], lines.data(), lines.size());
    ::close(fds[1]);
    if (written != static_cast<ssize_t>(lines.size())) {
        ::close(fds[0]);
        return -1;
    }
    return fds[0];
}

config::Config testConfig(const fs::path& dataDir) {
    config::Config cfg;
    cfg.watchlist = {"AAPL.US"};
    cfg.indexes = {};
    cfg.dataDir = dataDir.string();
    cfg.renderIntervalMs = 5;
    cfg.workspaceSaveTimeoutMs = 2000;
    cfg.rateLimitPerSecond = 100;
    cfg.rateLimitBurst = 100;
    return cfg;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
    const fs::path dataDir = fs::temp_directory_path() / ("tickwatch_app_" + std::to_string(::getpid()));
    fs::remove_all(dataDir);

    {
        auto calls = std::make_shared<GatewayCalls>();
        auto frames = std::make_shared<std::atomic<int>>(0);
        const int inputFd = scriptedInput("alert add 700.HK price_above 320\ns 700.HK\no\nnonsense\np\n");
        if (inputFd < 0) {
            std::cerr << "Unable to create the input pipe\n";
            return 1;
        }

        app::Application::Dependencies deps;
        deps.gateway = std::make_unique<FakeGateway>(calls);
        deps.stream = std::make_unique<QuietStream>();
        deps.sink = std::make_unique<CountingSink>(frames);
        deps.inputFd = inputFd;

        app::Application application(testConfig(dataDir), std::move(deps));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        const int code = application.run([&]() {
            const bool done = application.alerts().fired() >= 1 && calls->candles.load() > 0
                && calls->portfolio.load() > 0 && application.navigation().view == app::View::Portfolio;
            return done || std::chrono::steady_clock::now() > deadline;
        });
        ::close(inputFd);

        if (code != 0) {
            std::cerr << "Normal shutdown should exit with 0, got " << code << '\n';
            return 1;
        }
        const auto& nav = application.navigation();
        if (nav.view != app::View::Portfolio || !nav.detail || nav.detail->str() != "700.HK") {
            std::cerr << "Console commands should drive navigation\n";
            return 1;
        }
        if (application.alerts().rules().size() != 1 || application.alerts().fired() != 1) {
            std::cerr << "Alert rule should be created and fire once on the detail quote\n";
            return 1;
        }
        if (calls->quotes.load() < 1 || calls->candles.load() < 1 || calls->portfolio.load() < 1) {
            std::cerr << "Quotes, candles and the portfolio should be fetched\n";
            return 1;
        }
        auto snapshot = application.store().get(InstrumentId("700.HK"));
        if (!snapshot || !snapshot->quote || !snapshot->candles || snapshot->candles->bars.size() != 3) {
            std::cerr << "REST results should land in the store\n";
            return 1;
        }
        if (frames->load() < 1) {
            std::cerr << "At least one frame should have been rendered\n";
            return 1;
        }
        const auto workspace = readFile(dataDir / "workspace.json");
        if (workspace.find("\"last_state\": \"portfolio\"") == std::string::npos
            || workspace.find("700.HK") == std::string::npos) {
            std::cerr << "Workspace should be saved at shutdown:\n" << workspace;
            return 1;
        }
        if (!fs::exists(dataDir / "alerts.json") || !fs::exists(dataDir / "alerts.log.jsonl")) {
            std::cerr << "Alert rules and the event log should be on disk\n";
            return 1;
        }
    }

    {
        auto calls = std::make_shared<GatewayCalls>();
        auto frames = std::make_shared<std::atomic<int>>(0);
        const int inputFd = scriptedInput("q\n");

        app::Application::Dependencies deps;
        deps.gateway = std::make_unique<FakeGateway>(calls);
        deps.stream = std::make_unique<QuietStream>();
        deps.sink = std::make_unique<CountingSink>(frames);
        deps.inputFd = inputFd;

        app::Application application(testConfig(dataDir), std::move(deps));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        const int code = application.run([&]() { return std::chrono::steady_clock::now() > deadline; });
        ::close(inputFd);

        if (code != 0) {
            std::cerr << "Quit should exit with 0\n";
            return 1;
        }
        const auto& nav = application.navigation();
        if (nav.view != app::View::Portfolio || !nav.detail || nav.detail->str() != "700.HK") {
            std::cerr << "Navigation should be restored from the saved workspace\n";
            return 1;
        }
        if (application.alerts().rules().size() != 1) {
            std::cerr << "Alert rules should be reloaded from disk\n";
            return 1;
        }
    }

    {
        auto calls = std::make_shared<GatewayCalls>();
        auto frames = std::make_shared<std::atomic<int>>(0);
        const int inputFd = scriptedInput("");

        app::Application::Dependencies deps;
        deps.gateway = std::make_unique<FakeGateway>(calls);
        deps.stream = std::make_unique<QuietStream>(true);
        deps.sink = std::make_unique<CountingSink>(frames);
        deps.inputFd = inputFd;

        auto cfg = testConfig(dataDir);
        cfg.exitOnStreamLoss = true;
        app::Application application(cfg, std::move(deps));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        const int code = application.run([&]() { return std::chrono::steady_clock::now() > deadline; });
        ::close(inputFd);

        if (code != 1) {
            std::cerr << "Losing the stream with exitOnStreamLoss should exit with 1, got " << code << '\n';
            return 1;
        }
    }

    {
        auto calls = std::make_shared<GatewayCalls>();
        auto seen = std::make_shared<FlakyAlertSink::Seen>();
        const int inputFd = scriptedInput("alert add 700.HK price_above 320\ns 700.HK\n");

        app::Application::Dependencies deps;
        deps.gateway = std::make_unique<FakeGateway>(calls);
        deps.stream = std::make_unique<QuietStream>();
        deps.sink = std::make_unique<FlakyAlertSink>(seen);
        deps.inputFd = inputFd;

        app::Application application(testConfig(dataDir / "flaky"), std::move(deps));
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        application.run([&]() {
            return seen->alertFramesAfterFailure.load() > 0 || std::chrono::steady_clock::now() > deadline;
        });
        ::close(inputFd);

        if (seen->failures.load() != 1 || seen->alertFramesAfterFailure.load() < 1) {
            std::cerr << "An alert on a failed frame should be shown on the next frame\n";
            return 1;
        }
        if (application.alerts().rules().empty() || seen->ruleId.load() != application.alerts().rules().front().id) {
            std::cerr << "The retried frame should carry the fired rule\n";
            return 1;
        }
    }

    std::error_code ec;
    fs::remove_all(dataDir, ec);

    std::cout << "Application tests passed\n";
    return 0;
}
