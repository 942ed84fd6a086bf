#pragma once

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <string>

#include "domain/Types.h"

namespace core {

enum class Region : std::size_t {
    WatchList,
    Detail,
    Portfolio,
    Indexes,
    Quote,
    Depth,
    Chart,
    Trades,
    Navigation,
    StatusBar,
    Popup,
    Count_
};

inline const char* region_label(Region region) {
    switch (region) {
    case Region::WatchList:
        return "watchlist";
    case Region::Detail:
        return "detail";
    case Region::Portfolio:
        return "portfolio";
    case Region::Indexes:
        return "indexes";
    case Region::Quote:
        return "quote";
    case Region::Depth:
        return "depth";
    case Region::Chart:
        return "chart";
    case Region::Trades:
        return "trades";
    case Region::Navigation:
        return "navigation";
    case Region::StatusBar:
        return "status";
    case Region::Popup:
        return "popup";
    case Region::Count_:
        break;
    }
    return "unknown";
}

// Set over the closed Region enumeration. Only union and clear mutate it.
class DirtyRegionSet {
public:
    static constexpr std::size_t kRegionCount = static_cast<std::size_t>(Region::Count_);

    DirtyRegionSet() = default;
    DirtyRegionSet(std::initializer_list<Region> regions) {
        for (auto region : regions) {
            bits_.set(static_cast<std::size_t>(region));
        }
    }

    static DirtyRegionSet all() {
        DirtyRegionSet set;
        set.bits_.set();
        return set;
    }

    DirtyRegionSet& unite(const DirtyRegionSet& other) {
        bits_ |= other.bits_;
        return *this;
    }

    void clear() { bits_.reset(); }

    bool contains(Region region) const { return bits_.test(static_cast<std::size_t>(region)); }
    bool empty() const { return bits_.none(); }
    std::size_t count() const { return bits_.count(); }

    bool operator==(const DirtyRegionSet& other) const { return bits_ == other.bits_; }
    bool operator!=(const DirtyRegionSet& other) const { return bits_ != other.bits_; }

    std::string describe() const {
        std::string text;
        for (std::size_t i = 0; i < kRegionCount; ++i) {
            if (!bits_.test(i)) {
                continue;
            }
            if (!text.empty()) {
                text.push_back(',');
            }
            text.append(region_label(static_cast<Region>(i)));
        }
        return text.empty() ? std::string{"-"} : text;
    }

private:
    std::bitset<kRegionCount> bits_;
};

// Regions showing data of the given category, including the aggregated views.
inline DirtyRegionSet regions_for(domain::ChangeCategory category) {
    switch (category) {
    case domain::ChangeCategory::Quote:
        return {Region::Quote, Region::WatchList, Region::Detail, Region::Indexes, Region::StatusBar};
    case domain::ChangeCategory::Depth:
        return {Region::Depth, Region::Detail};
    case domain::ChangeCategory::Trades:
        return {Region::Trades, Region::Detail};
    case domain::ChangeCategory::Candle:
        return {Region::Chart, Region::Detail};
    }
    return {};
}

}  // namespace core
