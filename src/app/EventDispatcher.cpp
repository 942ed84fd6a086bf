#include "app/EventDispatcher.h"

#include <algorithm>
#include <exception>

#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::UI;

}  // namespace

const char* dispatcher_source_label(EventDispatcher::Source source) {
    switch (source) {
    case EventDispatcher::Source::UserInput:
        return "input";
    case EventDispatcher::Source::FatalSignal:
        return "fatal";
    case EventDispatcher::Source::DataUpdate:
        return "data";
    case EventDispatcher::Source::Tick:
        return "tick";
    }
    return "unknown";
}

std::size_t EventDispatcher::PendingKeyHash::operator()(
    const std::pair<domain::InstrumentId, domain::ChangeCategory>& key) const noexcept {
    return std::hash<domain::InstrumentId>{}(key.first) * 31U + static_cast<std::size_t>(key.second);
}

EventDispatcher::EventDispatcher(Config config, Handlers handlers)
    : config_(std::move(config)),
      handlers_(std::move(handlers)),
      nextTick_(Clock::now()) {}

void EventDispatcher::postInput(std::string line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        if (config_.inputCapacity > 0 && input_.size() >= config_.inputCapacity) {
            input_.pop_front();
            ++droppedInput_;
            LOG_WARN(kLogCategory, "input queue full (%zu), dropped oldest command", config_.inputCapacity);
            tw::common::metrics::Registry::instance().incrementCounter("input_dropped_total");
        }
        input_.push_back(std::move(line));
    }
    cv_.notify_one();
}

void EventDispatcher::postFatal(std::string reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        fatal_.push_back(std::move(reason));
    }
    cv_.notify_one();
}

void EventDispatcher::postData(const domain::ChangeNotification& note) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        auto key = std::make_pair(note.instrument, note.category);
        auto it = dataKeys_.find(key);
        if (it != dataKeys_.end()) {
            data_[it->second].sequence = std::max(data_[it->second].sequence, note.sequence);
            return;
        }
        dataKeys_.emplace(std::move(key), data_.size());
        data_.push_back(note);
    }
    cv_.notify_one();
}

std::optional<EventDispatcher::Source> EventDispatcher::selectLocked_(Clock::time_point now) const {
    if (!input_.empty()) {
        return Source::UserInput;
    }
    if (!fatal_.empty()) {
        return Source::FatalSignal;
    }
    const bool tickDue = now >= nextTick_;
    if (!data_.empty() && !(tickDue && lastServedData_)) {
        return Source::DataUpdate;
    }
    if (tickDue) {
        return Source::Tick;
    }
    return std::nullopt;
}

void EventDispatcher::serve_(Source source, std::unique_lock<std::mutex>& lock, Clock::time_point now) {
    try {
        switch (source) {
        case Source::UserInput: {
            auto line = std::move(input_.front());
            input_.pop_front();
            lock.unlock();
            if (handlers_.onInput) {
                handlers_.onInput(line);
            }
            break;
        }
        case Source::FatalSignal: {
            auto reason = std::move(fatal_.front());
            fatal_.pop_front();
            lock.unlock();
            if (handlers_.onFatal) {
                handlers_.onFatal(reason);
            }
            break;
        }
        case Source::DataUpdate: {
            std::vector<domain::ChangeNotification> batch;
            batch.swap(data_);
            dataKeys_.clear();
            lastServedData_ = true;
            lock.unlock();
            if (handlers_.onData) {
                handlers_.onData(batch);
            }
            break;
        }
        case Source::Tick: {
            nextTick_ += config_.tickInterval;
            if (nextTick_ <= now) {
                nextTick_ = now + config_.tickInterval;
            }
            lastServedData_ = false;
            lock.unlock();
            if (handlers_.onTick) {
                handlers_.onTick(now);
            }
            break;
        }
        }
    }
    catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "%s handler failed: %s", dispatcher_source_label(source), ex.what());
    }
}

std::optional<EventDispatcher::Source> EventDispatcher::runOnce(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = Clock::now() + timeout;
    while (!stopped_) {
        const auto now = Clock::now();
        if (auto source = selectLocked_(now)) {
            serve_(*source, lock, now);
            return source;
        }
        if (now >= deadline) {
            return std::nullopt;
        }
        cv_.wait_until(lock, std::min(deadline, nextTick_));
    }
    return std::nullopt;
}

void EventDispatcher::run() {
    LOG_INFO(kLogCategory, "dispatcher running (tick=%lld ms, input capacity=%zu)",
             static_cast<long long>(config_.tickInterval.count()), config_.inputCapacity);
    while (!stopped()) {
        runOnce(config_.tickInterval);
    }
    LOG_INFO(kLogCategory, "dispatcher stopped (dropped input=%llu)", static_cast<unsigned long long>(droppedInput()));
}

void EventDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool EventDispatcher::stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

std::size_t EventDispatcher::pendingData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

std::size_t EventDispatcher::pendingInput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return input_.size();
}

std::uint64_t EventDispatcher::droppedInput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return droppedInput_;
}

}  // namespace app
