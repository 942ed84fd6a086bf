#include "app/RenderScheduler.h"

#include <exception>
#include <utility>

#include "common/Metrics.hpp"
#include "core/LogUtils.h"
#include "logging/Log.h"

namespace app {
namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::RENDER;

core::LogRateLimiter& sinkErrorLimiter() {
    static core::LogRateLimiter limiter(std::chrono::seconds(5));
    return limiter;
}

}  // namespace

RenderScheduler::RenderScheduler(ui::IRenderSink& sink, ContextSource source, std::chrono::milliseconds minInterval)
    : sink_(sink),
      source_(std::move(source)),
      minInterval_(minInterval.count() < 1 ? std::chrono::milliseconds(1) : minInterval) {}

void RenderScheduler::onChange(const domain::ChangeNotification& note) {
    markDirty(core::regions_for(note.category));
}

void RenderScheduler::onInput() {
    markDirty(core::DirtyRegionSet::all());
}

void RenderScheduler::markDirty(const core::DirtyRegionSet& regions) {
    if (regions.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    dirty_.unite(regions);
    if (state_ == State::Idle) {
        state_ = State::Dirty;
    }
}

bool RenderScheduler::tick(Clock::time_point now) {
    core::DirtyRegionSet frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Idle) {
            ++skips_;
            return false;
        }
        if (state_ == State::Rendering) {
            return false;
        }
        if (lastRender_ && now - *lastRender_ < minInterval_) {
            return false;
        }
        frame = dirty_;
        dirty_.clear();
        state_ = State::Rendering;
    }

    bool rendered = false;
    try {
        auto context = source_ ? source_() : ui::RenderContext{};
        context.stats = stats();
        sink_.render(frame, context);
        rendered = true;
    }
    catch (const std::exception& ex) {
        std::size_t suppressed = 0;
        if (sinkErrorLimiter().allow(&suppressed)) {
            LOG_ERROR(kLogCategory, "render of [%s] failed: %s (suppressed=%zu)", frame.describe().c_str(), ex.what(),
                      suppressed);
        }
        tw::common::metrics::Registry::instance().incrementCounter("render_errors_total");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    lastRender_ = now;
    if (rendered) {
        ++renders_;
        LOG_TRACE(kLogCategory, "frame %llu regions=%s", static_cast<unsigned long long>(renders_),
                  frame.describe().c_str());
    }
    else {
        dirty_.unite(frame);
    }
    state_ = dirty_.empty() ? State::Idle : State::Dirty;
    return rendered;
}

RenderScheduler::State RenderScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

core::DirtyRegionSet RenderScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

ui::RenderStats RenderScheduler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statsOf_(renders_, skips_);
}

ui::RenderStats RenderScheduler::statsOf_(std::uint64_t renders, std::uint64_t skips) {
    ui::RenderStats stats;
    stats.renders = renders;
    stats.skips = skips;
    const auto total = renders + skips;
    stats.skipPercent = total == 0 ? 0.0 : static_cast<double>(skips) * 100.0 / static_cast<double>(total);
    return stats;
}

}  // namespace app
