#include "app/Application.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>

#include "adapters/vendor/VendorPushStream.hpp"
#include "adapters/vendor/VendorRestClient.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.h"
#include "logging/Log.h"
#include "ui/ConsoleRenderSink.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::UI;
constexpr std::size_t kRecentAlerts = 20;
constexpr auto kStatusRefresh = std::chrono::seconds(1);

const std::vector<domain::ChangeCategory> kQuoteTopics{domain::ChangeCategory::Quote};
const std::vector<domain::ChangeCategory> kDetailTopics{domain::ChangeCategory::Depth,
                                                        domain::ChangeCategory::Trades,
                                                        domain::ChangeCategory::Candle};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::vector<domain::InstrumentId> toIds(const std::vector<std::string>& symbols) {
    std::vector<domain::InstrumentId> ids;
    ids.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        ids.emplace_back(symbol);
    }
    return ids;
}

domain::TimestampMs wallNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

core::RateGovernor::Config governorConfig(const config::Config& config) {
    core::RateGovernor::Config cfg;
    cfg.tokensPerSecond = static_cast<double>(config.rateLimitPerSecond);
    cfg.burst = static_cast<double>(config.rateLimitBurst);
    return cfg;
}

AlertEngine::Options alertOptions(const config::Config& config) {
    const std::filesystem::path dataDir(config.dataDir);
    AlertEngine::Options options;
    options.rulesFile = dataDir / "alerts.json";
    options.eventLog = dataDir / "alerts.log.jsonl";
    options.defaultCooldown = std::chrono::seconds(config.alertCooldownSec);
    return options;
}

std::unique_ptr<domain::IQuoteGateway> makeGateway(const config::Config& config) {
    adapters::vendor::VendorRestClient::Options options;
    options.host = config.restHost;
    options.accessToken = config.accessToken;
    options.caFile = config.caFile;
    options.timeoutSec = config.httpTimeoutSec;
    return std::make_unique<adapters::vendor::VendorRestClient>(std::move(options));
}

std::unique_ptr<domain::IPushStream> makeStream(const config::Config& config, core::RateGovernor& governor) {
    adapters::vendor::VendorPushStream::Options options;
    options.host = config.wsHost;
    options.port = config.wsPort;
    options.path = config.wsPath;
    options.accessToken = config.accessToken;
    options.caFile = config.caFile;
    options.maxReconnects = config.streamMaxReconnects;
    options.replayPermit = [&governor]() { governor.acquire(); };
    return std::make_unique<adapters::vendor::VendorPushStream>(std::move(options));
}

std::string describeRule(const AlertRule& rule) {
    std::ostringstream oss;
    oss << '#' << rule.id << ' ' << rule.instrument.str() << ' ' << alert_kind_label(rule.kind) << ' '
        << rule.threshold << " cooldown " << rule.cooldownSeconds << "s" << (rule.enabled ? "" : " (off)");
    return oss.str();
}

}  // namespace

Application::Application(const config::Config& config) : Application(config, Dependencies{}) {}

Application::Application(const config::Config& config, Dependencies dependencies)
    : config_(config),
      workspace_(std::filesystem::path(config.dataDir) / "workspace.json"),
      alerts_(store_, alertOptions(config)),
      governor_(governorConfig(config)),
      gateway_(dependencies.gateway ? std::move(dependencies.gateway) : makeGateway(config)),
      stream_(dependencies.stream ? std::move(dependencies.stream) : makeStream(config, governor_)),
      api_(governor_, *gateway_, *stream_),
      sink_(dependencies.sink ? std::move(dependencies.sink) : std::make_unique<ui::ConsoleRenderSink>(std::cout)),
      scheduler_(*sink_, [this]() { return buildContext_(); }, std::chrono::milliseconds(config.renderIntervalMs)),
      dispatcher_(EventDispatcher::Config{256, std::chrono::milliseconds(config.renderIntervalMs)},
                  EventDispatcher::Handlers{
                      [this](const std::string& line) { onInput_(line); },
                      [this](const std::string& reason) { onFatal_(reason); },
                      [this](const std::vector<domain::ChangeNotification>& batch) { onData_(batch); },
                      [this](EventDispatcher::Clock::time_point now) { onTick_(now); },
                  }),
      ingestor_(*stream_,
                store_,
                bus_,
                PushIngestor::Callbacks{
                    [this](const std::string& reason) { dispatcher_.postFatal(reason); },
                    [this](domain::StreamState) { scheduler_.markDirty({core::Region::StatusBar}); },
                }),
      input_([this](std::string line) { dispatcher_.postInput(std::move(line)); },
             {},
             dependencies.inputFd),
      restPool_(static_cast<std::size_t>(std::max(1, config.restWorkers))) {}

Application::~Application() {
    if (started_ && !shutDown_) {
        try {
            shutdown_();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(kLogCategory, "shutdown failed: %s", ex.what());
        }
    }
}

int Application::run(StopPredicate stopRequested) {
    stopRequested_ = std::move(stopRequested);
    startup_();
    dispatcher_.run();
    shutdown_();
    return exitCode_.load();
}

void Application::startup_() {
    LOG_INFO(kLogCategory,
             "starting: watchlist=%zu indexes=%zu data_dir=%s render_interval=%dms",
             config_.watchlist.size(),
             config_.indexes.size(),
             config_.dataDir.c_str(),
             config_.renderIntervalMs);

    if (auto snapshot = workspace_.load()) {
        navigation_ = snapshot->navigation;
        LOG_INFO(kLogCategory, "workspace restored: view=%s", view_label(navigation_.view));
    }
    else if (!config_.watchlist.empty()) {
        navigation_.selected = domain::InstrumentId(config_.watchlist.front());
    }

    const auto ruleCount = alerts_.load();
    LOG_INFO(kLogCategory, "alert rules loaded: %zu", ruleCount);

    alertSubscription_ = bus_.subscribe([this](const domain::ChangeNotification& note) { alerts_.onChange(note); });
    dispatchSubscription_ =
        bus_.subscribe([this](const domain::ChangeNotification& note) { dispatcher_.postData(note); });

    ingestor_.start();
    started_ = true;

    seedQuotes_();
    if (navigation_.detail) {
        followDetail_(std::nullopt, navigation_.detail);
        loadCandles_(*navigation_.detail, navigation_.period);
    }
    if (navigation_.view == View::Portfolio) {
        refreshPortfolio_();
    }

    input_.start();
    scheduler_.onInput();
}

void Application::shutdown_() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;
    LOG_INFO(kLogCategory, "shutting down");

    input_.stop();
    ingestor_.stop();
    dispatcher_.stop();

    governor_.shutdown();
    restPool_.join();
    alertSubscription_.reset();
    dispatchSubscription_.reset();

    WorkspaceSnapshot snapshot;
    snapshot.navigation = navigation_;
    if (!workspace_.save(snapshot, std::chrono::milliseconds(config_.workspaceSaveTimeoutMs))) {
        LOG_WARN(kLogCategory, "workspace was not saved within %d ms", config_.workspaceSaveTimeoutMs);
    }
    if (!alerts_.flush()) {
        LOG_WARN(kLogCategory, "alert rules could not be flushed");
    }

    const auto stats = scheduler_.stats();
    LOG_INFO(kLogCategory,
             "render stats: renders=%llu skips=%llu skip=%.1f%% alerts_fired=%llu frames_applied=%llu",
             static_cast<unsigned long long>(stats.renders),
             static_cast<unsigned long long>(stats.skips),
             stats.skipPercent,
             static_cast<unsigned long long>(alerts_.fired()),
             static_cast<unsigned long long>(ingestor_.applied()));
    for (const auto& line : tw::common::metrics::Registry::instance().describe()) {
        LOG_INFO(kLogCategory, "metrics %s", line.c_str());
    }
    logging::Log::flush();
}

void Application::onInput_(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(viewMutex_);
        messages_.clear();
    }
    try {
        if (auto command = parse_input(line)) {
            execute_(*command);
        }
    }
    catch (const std::invalid_argument& ex) {
        say_(ex.what());
    }
    catch (const std::exception& ex) {
        LOG_WARN(kLogCategory, "command '%s' failed: %s", line.c_str(), ex.what());
        say_(std::string{"failed: "} + ex.what());
    }
    scheduler_.onInput();
}

void Application::execute_(const InputCommand& command) {
    std::visit(Overloaded{
                   [&](const nav::Command& navCommand) { applyNavigation_(navCommand); },
                   [&](const cmd::Quit&) {
                       LOG_INFO(kLogCategory, "quit requested");
                       dispatcher_.stop();
                   },
                   [&](const cmd::Help&) { say_(input_help()); },
                   [&](const cmd::Refresh&) {
                       seedQuotes_();
                       refreshPortfolio_();
                       if (navigation_.detail) {
                           loadCandles_(*navigation_.detail, navigation_.period);
                       }
                   },
                   [&](const cmd::AlertAdd& add) {
                       const auto rule = alerts_.createRule(add.rule);
                       say_("added " + describeRule(rule));
                   },
                   [&](const cmd::AlertRemove& remove) {
                       say_(alerts_.deleteRule(remove.id) ? "removed rule #" + std::to_string(remove.id)
                                                          : "no rule #" + std::to_string(remove.id));
                   },
                   [&](const cmd::AlertToggle& toggle) {
                       if (!alerts_.setEnabled(toggle.id, toggle.enabled)) {
                           say_("no rule #" + std::to_string(toggle.id));
                           return;
                       }
                       say_(std::string{toggle.enabled ? "enabled" : "disabled"} + " rule #"
                            + std::to_string(toggle.id));
                   },
                   [&](const cmd::AlertList&) {
                       const auto rules = alerts_.rules();
                       if (rules.empty()) {
                           say_("no alert rules");
                           return;
                       }
                       for (const auto& rule : rules) {
                           say_(describeRule(rule));
                       }
                   },
               },
               command);
}

void Application::applyNavigation_(const nav::Command& command) {
    const NavigationState previous = navigation_;
    navigation_ = apply(previous, command);
    if (navigation_ == previous) {
        return;
    }
    if (navigation_.detail != previous.detail) {
        followDetail_(previous.detail, navigation_.detail);
    }
    if (navigation_.detail && (navigation_.detail != previous.detail || navigation_.period != previous.period)) {
        loadCandles_(*navigation_.detail, navigation_.period);
    }
    if (navigation_.view == View::Portfolio && previous.view != View::Portfolio) {
        refreshPortfolio_();
    }
}

void Application::onFatal_(const std::string& reason) {
    say_("push stream lost: " + reason);
    scheduler_.markDirty({core::Region::StatusBar, core::Region::Popup});
    if (config_.exitOnStreamLoss) {
        LOG_ERROR(kLogCategory, "push stream lost (%s); exiting", reason.c_str());
        exitCode_.store(1);
        dispatcher_.stop();
        return;
    }
    LOG_ERROR(kLogCategory, "push stream lost (%s); showing last known data", reason.c_str());
}

void Application::onData_(const std::vector<domain::ChangeNotification>& batch) {
    for (const auto& note : batch) {
        scheduler_.onChange(note);
    }
}

void Application::onTick_(EventDispatcher::Clock::time_point now) {
    if (stopRequested_ && stopRequested_()) {
        LOG_INFO(kLogCategory, "stop requested");
        dispatcher_.stop();
        return;
    }

    auto fired = alerts_.drainPending();
    if (!fired.empty()) {
        for (auto& event : fired) {
            recentAlerts_.push_back(event);
            if (recentAlerts_.size() > kRecentAlerts) {
                recentAlerts_.pop_front();
            }
            freshAlerts_.push_back(std::move(event));
        }
        scheduler_.markDirty({core::Region::Popup});
    }

    if (now - lastStatusRefresh_ >= kStatusRefresh) {
        lastStatusRefresh_ = now;
        scheduler_.markDirty({core::Region::StatusBar});
    }

    // A failed frame keeps the fresh alerts for the retry.
    if (scheduler_.tick(now)) {
        freshAlerts_.clear();
    }
}

void Application::say_(std::string message) {
    {
        std::lock_guard<std::mutex> lock(viewMutex_);
        messages_.push_back(std::move(message));
    }
    scheduler_.markDirty({core::Region::Popup});
}

void Application::post_(const char* what, std::function<void()> job) {
    boost::asio::post(restPool_, [this, what, job = std::move(job)]() {
        try {
            job();
        }
        catch (const domain::GovernorStopped&) {
            LOG_DEBUG(kLogCategory, "%s abandoned at shutdown", what);
        }
        catch (const std::exception& ex) {
            LOG_WARN(kLogCategory, "%s failed: %s", what, ex.what());
            say_(std::string{what} + " failed: " + ex.what());
        }
    });
}

std::vector<domain::InstrumentId> Application::quoteInstruments_() const {
    auto ids = toIds(config_.watchlist);
    for (auto& id : toIds(config_.indexes)) {
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(std::move(id));
        }
    }
    return ids;
}

void Application::seedQuotes_() {
    auto ids = quoteInstruments_();
    if (ids.empty()) {
        return;
    }
    post_("quote seed", [this, ids]() {
        const auto quotes = api_.fetchQuotes(ids);
        std::size_t applied = 0;
        for (const auto& [id, quote] : quotes) {
            if (auto note = store_.updateQuote(id, quote)) {
                bus_.publish(*note);
                ++applied;
            }
        }
        LOG_INFO(kLogCategory, "seeded %zu of %zu quotes", applied, ids.size());
        api_.subscribe(ids, kQuoteTopics);
    });
}

void Application::refreshPortfolio_() {
    post_("portfolio", [this]() {
        auto portfolio = api_.fetchPortfolio();
        std::vector<domain::InstrumentId> ids;
        for (const auto& position : portfolio.positions) {
            ids.push_back(position.instrument);
        }
        {
            std::lock_guard<std::mutex> lock(viewMutex_);
            portfolio_ = std::move(portfolio);
        }
        scheduler_.markDirty({core::Region::Portfolio});
        if (!ids.empty()) {
            for (const auto& [id, quote] : api_.fetchQuotes(ids)) {
                if (auto note = store_.updateQuote(id, quote)) {
                    bus_.publish(*note);
                }
            }
        }
    });
}

void Application::loadCandles_(domain::InstrumentId instrument, domain::ChartPeriod period) {
    post_("candles", [this, instrument = std::move(instrument), period]() {
        auto fragment = api_.fetchCandles(instrument, period, domain::CandleFragment::kMaxBars);
        if (auto note = store_.replaceCandles(instrument, std::move(fragment))) {
            bus_.publish(*note);
        }
    });
}

void Application::followDetail_(const std::optional<domain::InstrumentId>& previous,
                                const std::optional<domain::InstrumentId>& next) {
    const auto quoted = quoteInstruments_();
    auto tracked = [&](const domain::InstrumentId& id) {
        return std::find(quoted.begin(), quoted.end(), id) != quoted.end();
    };
    post_("detail subscription", [this, previous, next, previousQuoted = previous && tracked(*previous),
                                  nextQuoted = next && tracked(*next)]() {
        if (previous) {
            auto topics = kDetailTopics;
            if (!previousQuoted) {
                topics.push_back(domain::ChangeCategory::Quote);
            }
            api_.unsubscribe({*previous}, topics);
        }
        if (next) {
            auto topics = kDetailTopics;
            if (!nextQuoted) {
                topics.push_back(domain::ChangeCategory::Quote);
                for (const auto& [id, quote] : api_.fetchQuotes({*next})) {
                    if (auto note = store_.updateQuote(id, quote)) {
                        bus_.publish(*note);
                    }
                }
            }
            api_.subscribe({*next}, topics);
        }
    });
}

ui::RenderContext Application::buildContext_() {
    ui::RenderContext context;
    context.store = &store_;
    context.navigation = navigation_;
    context.watchlist = toIds(config_.watchlist);
    context.indexes = toIds(config_.indexes);
    if (navigation_.logPanelVisible) {
        context.alerts.assign(recentAlerts_.rbegin(), recentAlerts_.rend());
    }
    else {
        context.alerts = freshAlerts_;
    }
    {
        std::lock_guard<std::mutex> lock(viewMutex_);
        context.portfolio = portfolio_;
        context.messages = messages_;
    }
    context.stream.state = ingestor_.state();
    context.stream.lastFrameMs = ingestor_.lastFrameMs();
    context.stream.fatalReason = ingestor_.fatalReason();
    context.nowMs = wallNowMs();
    return context;
}

}  // namespace app
