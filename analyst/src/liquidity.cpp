#include "liquidity.hpp"
#include <algorithm>

LiquidityEvaluator::LiquidityEvaluator(double exhaustion_multiplier, size_t sweep_lookback)
    : exhaustion_multiplier_(exhaustion_multiplier)
    , sweep_lookback_(sweep_lookback)
{}

LiquidityCheck LiquidityEvaluator::evaluate(const BarSeries& bars, Direction direction) const {
    LiquidityCheck result;
    if (bars.size() < 2) return result;
    
    const Bar& current = bars.current();
    const Bar& previous = bars.previous();
    
    result.swept = detect_sweep(bars, direction, result.swept_level);
    if (result.swept) {
        result.event_type = direction == Direction::Short ? "Local High Sweep"
                                                          : "Local Low Sweep";
    }
    
    result.body = current.body();
    result.wick = direction == Direction::Short ? current.upper_wick()
                                                : current.lower_wick();
    result.exhaustion = result.wick >= result.body * exhaustion_multiplier_;
    result.divergence = detect_divergence(current, previous, direction);
    
    return result;
}

bool LiquidityEvaluator::detect_sweep(const BarSeries& bars, Direction direction,
                                      double& level) const {
    // Prior window excludes the current bar
    const size_t last = bars.size() - 1;
    const size_t start = last > sweep_lookback_ ? last - sweep_lookback_ : 0;
    if (start >= last) return false;
    
    const Bar& current = bars.current();
    if (direction == Direction::Short) {
        level = bars[start].high;
        for (size_t i = start; i < last; i++) {
            level = std::max(level, bars[i].high);
        }
        return current.high > level;
    }
    
    level = bars[start].low;
    for (size_t i = start; i < last; i++) {
        level = std::min(level, bars[i].low);
    }
    return current.low < level;
}

bool LiquidityEvaluator::detect_divergence(const Bar& current, const Bar& previous,
                                           Direction direction) {
    // NaN RSI never qualifies
    if (direction == Direction::Short) {
        return current.high > previous.high && current.rsi < previous.rsi;
    }
    return current.low < previous.low && current.rsi > previous.rsi;
}
