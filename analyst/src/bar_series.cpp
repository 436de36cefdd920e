#include "bar_series.hpp"
#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

double Bar::body() const {
    return std::abs(close - open);
}

double Bar::upper_wick() const {
    return high - std::max(open, close);
}

double Bar::lower_wick() const {
    return std::min(open, close) - low;
}

BarSeries::BarSeries(std::vector<Bar> bars) : bars_(std::move(bars)) {}

void BarSeries::append(const Bar& bar) {
    bars_.push_back(bar);
}

void BarSeries::recompute_indicators(size_t rsi_period, size_t atr_period) {
    auto rsi = indicators::rsi(closes(), rsi_period);
    auto atr = indicators::atr(bars_, atr_period);
    auto vwap = indicators::vwap(bars_);
    
    for (size_t i = 0; i < bars_.size(); i++) {
        bars_[i].rsi = rsi[i];
        bars_[i].atr = atr[i];
        bars_[i].vwap = vwap[i];
    }
}

const Bar& BarSeries::current() const {
    if (bars_.empty()) {
        throw std::out_of_range("BarSeries is empty");
    }
    return bars_.back();
}

const Bar& BarSeries::previous() const {
    if (bars_.size() < 2) {
        throw std::out_of_range("BarSeries has no previous bar");
    }
    return bars_[bars_.size() - 2];
}

std::vector<double> BarSeries::closes() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) {
        out.push_back(b.close);
    }
    return out;
}

size_t BarSeries::tail_start(size_t count) const {
    return bars_.size() > count ? bars_.size() - count : 0;
}
