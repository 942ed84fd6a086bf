#include "core/EventBus.h"

#include <exception>
#include <utility>

#include "logging/Log.h"

namespace core {

EventBus::Subscription::Subscription(Subscription&& other) noexcept
    : bus_(std::exchange(other.bus_, nullptr)), token_(std::exchange(other.token_, 0)) {}

EventBus::Subscription& EventBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = std::exchange(other.bus_, nullptr);
        token_ = std::exchange(other.token_, 0);
    }
    return *this;
}

void EventBus::Subscription::reset() {
    if (auto* bus = std::exchange(bus_, nullptr)) {
        bus->detach_(token_);
    }
    token_ = 0;
}

EventBus::Subscription EventBus::subscribe(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<ListenerMap>(*listeners_);
    const Token token = nextToken_++;
    next->emplace(token, std::move(callback));
    listeners_ = std::move(next);
    return Subscription(this, token);
}

void EventBus::detach_(Token token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listeners_->count(token) == 0) {
        return;
    }
    auto next = std::make_shared<ListenerMap>(*listeners_);
    next->erase(token);
    listeners_ = std::move(next);
}

void EventBus::publish(const domain::ChangeNotification& note) {
    std::shared_ptr<const ListenerMap> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = listeners_;
    }
    published_.fetch_add(1, std::memory_order_relaxed);

    for (const auto& [token, callback] : *current) {
        if (!callback) {
            continue;
        }
        try {
            callback(note);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::DATA, "listener #%llu threw on %s %s: %s",
                      static_cast<unsigned long long>(token), note.instrument.str().c_str(),
                      domain::change_category_label(note.category), ex.what());
        }
    }
}

std::size_t EventBus::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_->size();
}

}  // namespace core
