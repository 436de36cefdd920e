#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace indicators {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

std::vector<double> sma(const std::vector<double>& values, size_t period) {
    std::vector<double> out(values.size(), kNaN);
    if (period == 0) return out;
    
    double sum = 0.0;
    size_t nan_count = 0;
    for (size_t i = 0; i < values.size(); i++) {
        if (std::isnan(values[i])) nan_count++; else sum += values[i];
        
        if (i >= period) {
            if (std::isnan(values[i - period])) nan_count--; else sum -= values[i - period];
        }
        
        if (i + 1 >= period && nan_count == 0) {
            out[i] = sum / static_cast<double>(period);
        }
    }
    return out;
}

std::vector<double> rsi(const std::vector<double>& closes, size_t period) {
    std::vector<double> gains(closes.size(), 0.0);
    std::vector<double> losses(closes.size(), 0.0);
    
    // First bar has no delta, so any window covering it is undefined
    if (!closes.empty()) {
        gains[0] = kNaN;
        losses[0] = kNaN;
    }
    for (size_t i = 1; i < closes.size(); i++) {
        double delta = closes[i] - closes[i - 1];
        if (delta > 0) gains[i] = delta;
        if (delta < 0) losses[i] = -delta;
    }
    
    auto avg_gain = sma(gains, period);
    auto avg_loss = sma(losses, period);
    
    std::vector<double> out(closes.size(), kNaN);
    for (size_t i = 0; i < closes.size(); i++) {
        if (std::isnan(avg_gain[i]) || std::isnan(avg_loss[i])) continue;
        if (avg_loss[i] == 0.0) {
            // Flat window is undefined; all-gain window saturates
            out[i] = avg_gain[i] == 0.0 ? kNaN : 100.0;
            continue;
        }
        double rs = avg_gain[i] / avg_loss[i];
        out[i] = 100.0 - 100.0 / (1.0 + rs);
    }
    return out;
}

std::vector<double> atr(const std::vector<Bar>& bars, size_t period) {
    std::vector<double> tr(bars.size(), kNaN);
    for (size_t i = 0; i < bars.size(); i++) {
        double value = bars[i].high - bars[i].low;
        if (i > 0) {
            double prev_close = bars[i - 1].close;
            value = std::max({value,
                              std::abs(bars[i].high - prev_close),
                              std::abs(bars[i].low - prev_close)});
        }
        tr[i] = value;
    }
    return sma(tr, period);
}

std::vector<double> vwap(const std::vector<Bar>& bars) {
    std::vector<double> out(bars.size(), kNaN);
    double pv = 0.0;
    double vol = 0.0;
    for (size_t i = 0; i < bars.size(); i++) {
        double typical = (bars[i].high + bars[i].low + bars[i].close) / 3.0;
        pv += typical * bars[i].volume;
        vol += bars[i].volume;
        if (vol > 0.0) {
            out[i] = pv / vol;
        }
    }
    return out;
}

} // namespace indicators
