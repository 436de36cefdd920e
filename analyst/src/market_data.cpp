#include "market_data.hpp"
#include "http_client.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>

MarketDataClient::MarketDataClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
{}

BarSeries MarketDataClient::fetch_bars(const std::string& symbol,
                                       const std::string& period,
                                       const std::string& interval) const {
    spdlog::info("Fetching data for {}...", symbol);
    
    HttpClient http(timeout_ms_);
    std::string url = base_url_ + "/v8/finance/chart/" + symbol +
                      "?range=" + period + "&interval=" + interval;
    
    for (int attempt = 1; attempt <= kMaxAttempts; attempt++) {
        auto payload = http.get_json(url);
        if (payload) {
            BarSeries bars = parse_chart(*payload);
            if (!bars.empty()) {
                bars.recompute_indicators();
                spdlog::info("{}: {} bars", symbol, bars.size());
                return bars;
            }
        }
        
        spdlog::warn("Attempt {}/{} for {} returned no bars", attempt, kMaxAttempts, symbol);
        if (attempt < kMaxAttempts) {
            std::this_thread::sleep_for(std::chrono::seconds(2));
        }
    }
    
    throw std::runtime_error("Failed to fetch data for " + symbol + " after " +
                             std::to_string(kMaxAttempts) + " attempts");
}

BarSeries MarketDataClient::parse_chart(const nlohmann::json& payload) {
    BarSeries bars;
    
    try {
        const auto& results = payload.at("chart").at("result");
        if (!results.is_array() || results.empty()) return bars;
        
        const auto& result = results[0];
        if (!result.contains("timestamp")) return bars;
        
        const auto& timestamps = result["timestamp"];
        const auto& quote = result.at("indicators").at("quote").at(0);
        const auto& open = quote.at("open");
        const auto& high = quote.at("high");
        const auto& low = quote.at("low");
        const auto& close = quote.at("close");
        const auto& volume = quote.at("volume");
        
        for (size_t i = 0; i < timestamps.size(); i++) {
            if (i >= open.size() || i >= high.size() || i >= low.size() || i >= close.size()) break;
            if (open[i].is_null() || high[i].is_null() || low[i].is_null() || close[i].is_null()) {
                continue;
            }
            
            Bar bar;
            bar.ts_ms = timestamps[i].get<int64_t>() * 1000;
            bar.open = open[i].get<double>();
            bar.high = high[i].get<double>();
            bar.low = low[i].get<double>();
            bar.close = close[i].get<double>();
            bar.volume = (i < volume.size() && !volume[i].is_null()) ? volume[i].get<double>() : 0.0;
            bars.append(bar);
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Malformed chart payload: {}", e.what());
        return BarSeries();
    }
    
    return bars;
}
