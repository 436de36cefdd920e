#pragma once

#include "bar_series.hpp"
#include <vector>
#include <string>

enum class SwingKind {
    High,
    Low
};

struct SwingPoint {
    size_t index;
    double price;
    SwingKind kind;
};

struct SwingSet {
    std::vector<SwingPoint> highs;  // index order, oldest first
    std::vector<SwingPoint> lows;
};

class SwingLocator {
public:
    // A bar is a swing high (low) when its high (low) equals the max (min)
    // over [i - lookback, i + lookback]. Ties all qualify. Only interior
    // bars are eligible, so series of <= 2 * lookback bars yield nothing.
    static SwingSet locate(const BarSeries& bars, size_t lookback);
    
    // "HH"/"LH"/"EQH" from the last two swing highs, "Range" with fewer than two
    static std::string describe_highs(const SwingSet& swings);
    // "HL"/"LL"/"EQL" from the last two swing lows
    static std::string describe_lows(const SwingSet& swings);
};
