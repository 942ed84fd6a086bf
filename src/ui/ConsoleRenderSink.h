#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include "core/DirtyRegions.h"
#include "ui/RenderSink.h"

namespace ui {

// Plain text rendering of the terminal screen.
//
// Each region keeps the text it produced last; a frame rebuilds only the dirty regions and then
// writes the whole screen, so unchanged regions cost nothing but the copy.
class ConsoleRenderSink : public IRenderSink {
public:
    struct Options {
        bool ansi = true;          // clear the screen before each frame
        std::size_t chartBars = 20;
        std::size_t depthLevels = 5;
        std::size_t tradeRows = 10;
    };

    explicit ConsoleRenderSink(std::ostream& out);
    ConsoleRenderSink(std::ostream& out, Options options);

    void render(const core::DirtyRegionSet& regions, const RenderContext& context) override;

    std::uint64_t frames() const;
    // Text last produced for one region; empty before its first render.
    std::string section(core::Region region) const;

private:
    std::string build_(core::Region region, const RenderContext& context) const;
    std::string buildWatchList_(const RenderContext& context) const;
    std::string buildIndexes_(const RenderContext& context) const;
    std::string buildQuote_(const RenderContext& context) const;
    std::string buildDepth_(const RenderContext& context) const;
    std::string buildTrades_(const RenderContext& context) const;
    std::string buildChart_(const RenderContext& context) const;
    std::string buildPortfolio_(const RenderContext& context) const;
    std::string buildNavigation_(const RenderContext& context) const;
    std::string buildStatusBar_(const RenderContext& context) const;
    std::string buildPopup_(const RenderContext& context) const;
    std::string compose_(const RenderContext& context) const;

    std::ostream& out_;
    const Options options_;

    mutable std::mutex mutex_;
    std::array<std::string, core::DirtyRegionSet::kRegionCount> sections_;
    std::uint64_t frames_{0};
};

}  // namespace ui
