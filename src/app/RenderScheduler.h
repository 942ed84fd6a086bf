#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "core/DirtyRegions.h"
#include "domain/Types.h"
#include "ui/RenderSink.h"

namespace app {

// Turns change notifications into at most one frame per interval.
//
// Notifications only mark regions dirty. tick() renders the union of everything marked since
// the previous frame once the interval has passed, so a burst inside one interval costs a
// single frame and a quiet interval costs none.
class RenderScheduler {
public:
    using Clock = std::chrono::steady_clock;
    // Builds the frame context; called once per render, outside the scheduler lock.
    using ContextSource = std::function<ui::RenderContext()>;

    enum class State { Idle, Dirty, Rendering };

    RenderScheduler(ui::IRenderSink& sink, ContextSource source, std::chrono::milliseconds minInterval);

    void onChange(const domain::ChangeNotification& note);
    void onInput();
    void markDirty(const core::DirtyRegionSet& regions);

    // Returns true when a frame was rendered.
    bool tick(Clock::time_point now);

    State state() const;
    core::DirtyRegionSet pending() const;
    ui::RenderStats stats() const;

private:
    static ui::RenderStats statsOf_(std::uint64_t renders, std::uint64_t skips);

    ui::IRenderSink& sink_;
    ContextSource source_;
    const std::chrono::milliseconds minInterval_;

    mutable std::mutex mutex_;
    State state_{State::Idle};
    core::DirtyRegionSet dirty_;
    std::optional<Clock::time_point> lastRender_;
    std::uint64_t renders_{0};
    std::uint64_t skips_{0};
};

}  // namespace app
