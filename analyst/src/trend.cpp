#include "trend.hpp"
#include "indicators.hpp"
#include <limits>

TrendAssessment TrendClassifier::classify(const BarSeries& bars) {
    TrendAssessment result{Trend::Ranging,
                           std::numeric_limits<double>::quiet_NaN(),
                           std::numeric_limits<double>::quiet_NaN()};
    if (bars.empty()) return result;
    
    auto closes = bars.closes();
    result.sma_fast = indicators::sma(closes, kFastPeriod).back();
    result.sma_slow = indicators::sma(closes, kSlowPeriod).back();
    
    // NaN comparisons are false, so short series fall through to Ranging
    const double close = bars.current().close;
    if (close < result.sma_fast && close < result.sma_slow) {
        result.trend = Trend::Bearish;
    } else if (close > result.sma_fast && close > result.sma_slow) {
        result.trend = Trend::Bullish;
    }
    
    return result;
}

bool TrendClassifier::opposes(Trend trend, Direction direction) {
    return (direction == Direction::Short && trend == Trend::Bullish) ||
           (direction == Direction::Long && trend == Trend::Bearish);
}

bool TrendClassifier::aligned(Trend trend, Direction direction) {
    return (direction == Direction::Short && trend == Trend::Bearish) ||
           (direction == Direction::Long && trend == Trend::Bullish);
}
