#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "app/AlertEngine.h"
#include "app/ApiContext.h"
#include "app/EventDispatcher.h"
#include "app/InputCommands.h"
#include "app/Navigation.h"
#include "app/PushIngestor.h"
#include "app/RenderScheduler.h"
#include "app/WorkspaceStore.h"
#include "config/Config.h"
#include "core/EventBus.h"
#include "core/MarketStateStore.h"
#include "core/RateGovernor.h"
#include "domain/Ports.hpp"
#include "ui/ConsoleInput.h"
#include "ui/RenderSink.h"

namespace app {

// Owns every long-lived component and runs the dispatcher on the calling thread.
class Application {
public:
    // Replacements for the vendor adapters and the terminal, for tests.
    struct Dependencies {
        std::unique_ptr<domain::IQuoteGateway> gateway;
        std::unique_ptr<domain::IPushStream> stream;
        std::unique_ptr<ui::IRenderSink> sink;
        int inputFd = 0;
    };

    // Checked on every tick; returning true starts the shutdown.
    using StopPredicate = std::function<bool()>;

    explicit Application(const config::Config& config);
    Application(const config::Config& config, Dependencies dependencies);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Blocks until quit, the stop predicate or stream loss with exitOnStreamLoss, then shuts
    // everything down. Returns the process exit code.
    int run(StopPredicate stopRequested = {});

    const NavigationState& navigation() const { return navigation_; }
    AlertEngine& alerts() { return alerts_; }
    const core::MarketStateStore& store() const { return store_; }

private:
    void startup_();
    void shutdown_();

    void onInput_(const std::string& line);
    void onFatal_(const std::string& reason);
    void onData_(const std::vector<domain::ChangeNotification>& batch);
    void onTick_(EventDispatcher::Clock::time_point now);

    void execute_(const InputCommand& command);
    void applyNavigation_(const nav::Command& command);
    void say_(std::string message);

    // REST and subscription work runs on the pool; the dispatcher thread never blocks on it.
    void seedQuotes_();
    void refreshPortfolio_();
    void loadCandles_(domain::InstrumentId instrument, domain::ChartPeriod period);
    void followDetail_(const std::optional<domain::InstrumentId>& previous,
                       const std::optional<domain::InstrumentId>& next);
    void post_(const char* what, std::function<void()> job);

    ui::RenderContext buildContext_();
    std::vector<domain::InstrumentId> quoteInstruments_() const;

    const config::Config config_;

    core::MarketStateStore store_;
    core::EventBus bus_;
    WorkspaceStore workspace_;
    AlertEngine alerts_;
    core::RateGovernor governor_;
    std::unique_ptr<domain::IQuoteGateway> gateway_;
    std::unique_ptr<domain::IPushStream> stream_;
    ApiContext api_;
    std::unique_ptr<ui::IRenderSink> sink_;
    RenderScheduler scheduler_;
    EventDispatcher dispatcher_;
    PushIngestor ingestor_;
    ui::ConsoleInputReader input_;
    boost::asio::thread_pool restPool_;

    core::EventBus::Subscription alertSubscription_;
    core::EventBus::Subscription dispatchSubscription_;

    // Dispatcher thread only.
    NavigationState navigation_;
    StopPredicate stopRequested_;
    EventDispatcher::Clock::time_point lastStatusRefresh_{};
    bool started_{false};
    bool shutDown_{false};
    std::deque<AlertEvent> recentAlerts_;
    std::vector<AlertEvent> freshAlerts_;

    // Shared with the pool.
    mutable std::mutex viewMutex_;
    std::optional<domain::Portfolio> portfolio_;
    std::vector<std::string> messages_;

    std::atomic<int> exitCode_{0};
};

}  // namespace app
