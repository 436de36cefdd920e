#include "swing_locator.hpp"
#include <algorithm>

SwingSet SwingLocator::locate(const BarSeries& bars, size_t lookback) {
    SwingSet result;
    const size_t n = bars.size();
    
    for (size_t i = lookback; i + lookback < n; i++) {
        double window_high = bars[i - lookback].high;
        double window_low = bars[i - lookback].low;
        for (size_t j = i - lookback; j <= i + lookback; j++) {
            window_high = std::max(window_high, bars[j].high);
            window_low = std::min(window_low, bars[j].low);
        }
        
        if (bars[i].high == window_high) {
            result.highs.push_back({i, bars[i].high, SwingKind::High});
        }
        if (bars[i].low == window_low) {
            result.lows.push_back({i, bars[i].low, SwingKind::Low});
        }
    }
    
    return result;
}

std::string SwingLocator::describe_highs(const SwingSet& swings) {
    if (swings.highs.size() < 2) return "Range";
    const auto& earlier = swings.highs[swings.highs.size() - 2];
    const auto& later = swings.highs.back();
    if (later.price > earlier.price) return "HH";
    if (later.price < earlier.price) return "LH";
    return "EQH";
}

std::string SwingLocator::describe_lows(const SwingSet& swings) {
    if (swings.lows.size() < 2) return "Range";
    const auto& earlier = swings.lows[swings.lows.size() - 2];
    const auto& later = swings.lows.back();
    if (later.price > earlier.price) return "HL";
    if (later.price < earlier.price) return "LL";
    return "EQL";
}
