#pragma once

#include "bar_series.hpp"
#include <vector>

// Rolling-window indicators. Output has the input's length; positions before
// the window fills are NaN.
namespace indicators {
    std::vector<double> sma(const std::vector<double>& values, size_t period);
    
    // Simple-mean RSI: 100 - 100 / (1 + mean_gain / mean_loss)
    std::vector<double> rsi(const std::vector<double>& closes, size_t period = 14);
    
    // Rolling mean of true range
    std::vector<double> atr(const std::vector<Bar>& bars, size_t period = 14);
    
    // Cumulative typical-price VWAP
    std::vector<double> vwap(const std::vector<Bar>& bars);
}
