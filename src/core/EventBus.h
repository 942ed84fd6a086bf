#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "domain/Types.h"

namespace core {

// Fan-out of store change notifications to in-process listeners. Delivery happens on the
// publishing thread, in subscription order; a listener that throws is logged and skipped.
class EventBus {
public:
    using ChangeCallback = std::function<void(const domain::ChangeNotification&)>;
    using Token = std::uint64_t;

    // Move-only handle; destroying or resetting it detaches the listener.
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();
        bool active() const noexcept { return bus_ != nullptr; }

    private:
        friend class EventBus;
        Subscription(EventBus* bus, Token token) : bus_(bus), token_(token) {}

        EventBus* bus_{nullptr};
        Token token_{0};
    };

    Subscription subscribe(ChangeCallback callback);
    void publish(const domain::ChangeNotification& note);

    std::uint64_t published() const { return published_.load(std::memory_order_relaxed); }
    std::size_t listenerCount() const;

private:
    using ListenerMap = std::map<Token, ChangeCallback>;

    void detach_(Token token);

    mutable std::mutex mutex_;
    // Replaced wholesale on every change so publish can iterate without holding the lock.
    std::shared_ptr<const ListenerMap> listeners_{std::make_shared<ListenerMap>()};
    Token nextToken_{1};
    std::atomic<std::uint64_t> published_{0};
};

}  // namespace core
