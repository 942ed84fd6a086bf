#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "app/AlertRules.h"
#include "app/Navigation.h"
#include "core/DirtyRegions.h"
#include "domain/Types.h"

namespace core {
class MarketStateStore;
}

namespace ui {

struct StreamStatus {
    domain::StreamState state{domain::StreamState::Connecting};
    domain::TimestampMs lastFrameMs{0};
    std::string fatalReason;
};

struct RenderStats {
    std::uint64_t renders{0};
    std::uint64_t skips{0};
    double skipPercent{0.0};
};

// Read-only view handed to the sink for one frame.
struct RenderContext {
    const core::MarketStateStore* store{nullptr};
    app::NavigationState navigation;
    std::vector<domain::InstrumentId> watchlist;
    std::vector<domain::InstrumentId> indexes;
    std::optional<domain::Portfolio> portfolio;
    std::vector<app::AlertEvent> alerts;  // new since the last frame, or the recent log when shown
    std::vector<std::string> messages;    // help, rule listings, command errors
    StreamStatus stream;
    RenderStats stats;
    domain::TimestampMs nowMs{0};
};

class IRenderSink {
public:
    virtual ~IRenderSink() = default;

    // Draws the given regions. May throw; the scheduler keeps the regions for the next frame.
    virtual void render(const core::DirtyRegionSet& regions, const RenderContext& context) = 0;
};

}  // namespace ui
