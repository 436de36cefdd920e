#pragma once

#include "bar_series.hpp"
#include "trade_types.hpp"
#include <string>

struct LiquidityCheck {
    bool swept = false;
    std::string event_type;   // "Local High Sweep", "Local Low Sweep" or empty
    double swept_level = 0.0; // prior extreme taken out by the current bar
    
    double wick = 0.0;        // wick on the sweep side
    double body = 0.0;
    bool exhaustion = false;
    bool divergence = false;
    
    bool confirmed() const { return divergence || exhaustion; }
};

class LiquidityEvaluator {
public:
    explicit LiquidityEvaluator(double exhaustion_multiplier = 1.0,
                                size_t sweep_lookback = 10);
    
    // Short evaluates highs, long evaluates lows, always on the last bar
    LiquidityCheck evaluate(const BarSeries& bars, Direction direction) const;
    
    double exhaustion_multiplier() const { return exhaustion_multiplier_; }
    
private:
    double exhaustion_multiplier_;
    size_t sweep_lookback_;
    
    bool detect_sweep(const BarSeries& bars, Direction direction, double& level) const;
    static bool detect_divergence(const Bar& current, const Bar& previous, Direction direction);
};
