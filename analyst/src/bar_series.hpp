#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <limits>

// OHLCV candle with precomputed indicator columns. Indicator values are
// NaN until their rolling window is filled.
struct Bar {
    int64_t ts_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    
    double rsi = std::numeric_limits<double>::quiet_NaN();
    double atr = std::numeric_limits<double>::quiet_NaN();
    double vwap = std::numeric_limits<double>::quiet_NaN();
    
    double range() const { return high - low; }
    double body() const;
    double upper_wick() const;
    double lower_wick() const;
    bool is_bullish() const { return close > open; }
    bool is_bearish() const { return close < open; }
};

// Ordered (oldest first) bar series for one analysis run.
class BarSeries {
public:
    BarSeries() = default;
    explicit BarSeries(std::vector<Bar> bars);
    
    void append(const Bar& bar);
    
    // Fill rsi/atr/vwap from raw OHLCV
    void recompute_indicators(size_t rsi_period = 14, size_t atr_period = 14);
    
    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& operator[](size_t i) const { return bars_[i]; }
    const std::vector<Bar>& bars() const { return bars_; }
    
    // Last bar; throws std::out_of_range when empty
    const Bar& current() const;
    // Second-to-last bar; throws std::out_of_range with fewer than 2 bars
    const Bar& previous() const;
    
    std::vector<double> closes() const;
    
    // Index of the first bar in the trailing window of `count` bars
    size_t tail_start(size_t count) const;
    
private:
    std::vector<Bar> bars_;
};
