#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

enum class Direction {
    Short,
    Long
};

enum class DirectionMode {
    Short,
    Long,
    Both
};

enum class Trend {
    Bearish,
    Bullish,
    Ranging
};

std::string to_string(Direction direction);
std::string to_string(DirectionMode mode);
std::string to_string(Trend trend);

// Throws std::invalid_argument on an unknown name
DirectionMode parse_direction_mode(const std::string& name);

// Structural feature snapshot assembled by the decision pipeline. Filled as
// far as the pipeline got, so rejected analyses can still be audited.
struct TradeSetup {
    std::string instrument;
    std::string session = "Unknown";
    std::optional<Direction> direction;
    
    // HTF context
    std::string htf_trend;
    std::string htf_structure;
    double key_level = 0.0;
    
    // Liquidity & exhaustion
    std::string liquidity_event_type;
    bool has_large_wick = false;
    int consecutive_counter_candles = 0;
    double atr_value = 0.0;
    
    // Confirmation
    bool rsi_divergence = false;
    double vwap_distance = 0.0;
    bool volume_spike = false;
    double spread_value = 0.0;
    
    double news_event_proximity_minutes = 9999.0;
    
    // SMC
    std::string zone;
    double premium_position = 0.0;
    bool in_premium_zone = false;
    int bearish_ob_count = 0;
    int bullish_ob_count = 0;
    int fvg_count = 0;
    bool has_bearish_mss = false;
    bool has_bullish_mss = false;
};

struct TradePlan {
    Direction direction;
    double entry_zone_start;
    double entry_zone_end;
    double stop_loss;
    double tp1;
    double tp2;
    double estimated_rr;
    double probability_score;
    std::string scorer;
};

void to_json(nlohmann::json& j, const TradeSetup& setup);
void to_json(nlohmann::json& j, const TradePlan& plan);
