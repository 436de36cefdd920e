#pragma once

#include "bar_series.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Price-bar source backed by the Yahoo Finance chart endpoint
class MarketDataClient {
public:
    static constexpr int kMaxAttempts = 3;
    
    MarketDataClient(const std::string& base_url, int timeout_ms = 10000);
    
    // Bars with RSI/ATR/VWAP recomputed. Throws std::runtime_error when all
    // attempts come back empty.
    BarSeries fetch_bars(const std::string& symbol,
                         const std::string& period = "5d",
                         const std::string& interval = "15m") const;
    
    // Chart payload -> bars; rows with a null OHLC value are skipped
    static BarSeries parse_chart(const nlohmann::json& payload);
    
private:
    std::string base_url_;
    int timeout_ms_;
};
