#pragma once

#include "bar_series.hpp"
#include "trade_types.hpp"

struct TrendAssessment {
    Trend trend;
    double sma_fast;  // NaN with fewer than 50 bars
    double sma_slow;  // NaN with fewer than 200 bars
};

class TrendClassifier {
public:
    static constexpr size_t kFastPeriod = 50;
    static constexpr size_t kSlowPeriod = 200;
    
    // Close below both SMAs = Bearish, above both = Bullish, else Ranging
    static TrendAssessment classify(const BarSeries& bars);
    
    // Whether the trend works against a trade in `direction`
    static bool opposes(Trend trend, Direction direction);
    static bool aligned(Trend trend, Direction direction);
};
