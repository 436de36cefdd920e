#include "trade_types.hpp"
#include <cmath>
#include <stdexcept>

std::string to_string(Direction direction) {
    return direction == Direction::Short ? "SHORT" : "LONG";
}

std::string to_string(DirectionMode mode) {
    switch (mode) {
        case DirectionMode::Short: return "SHORT";
        case DirectionMode::Long: return "LONG";
        case DirectionMode::Both: return "BOTH";
    }
    return "BOTH";
}

std::string to_string(Trend trend) {
    switch (trend) {
        case Trend::Bearish: return "Bearish";
        case Trend::Bullish: return "Bullish";
        case Trend::Ranging: return "Ranging";
    }
    return "Ranging";
}

DirectionMode parse_direction_mode(const std::string& name) {
    if (name == "SHORT") return DirectionMode::Short;
    if (name == "LONG") return DirectionMode::Long;
    if (name == "BOTH") return DirectionMode::Both;
    throw std::invalid_argument("Unknown direction mode: " + name);
}

namespace {
// NaN is not valid JSON; undefined indicator values are stored as null
nlohmann::json number_or_null(double value) {
    return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json(nullptr);
}
}

void to_json(nlohmann::json& j, const TradeSetup& setup) {
    j = {
        {"instrument", setup.instrument},
        {"session", setup.session},
        {"direction", setup.direction ? to_string(*setup.direction) : ""},
        {"htf_trend", setup.htf_trend},
        {"htf_structure", setup.htf_structure},
        {"key_level", setup.key_level},
        {"liquidity_event_type", setup.liquidity_event_type},
        {"has_large_wick", setup.has_large_wick},
        {"consecutive_counter_candles", setup.consecutive_counter_candles},
        {"atr_value", number_or_null(setup.atr_value)},
        {"rsi_divergence", setup.rsi_divergence},
        {"vwap_distance", number_or_null(setup.vwap_distance)},
        {"volume_spike", setup.volume_spike},
        {"spread_value", setup.spread_value},
        {"news_event_proximity_minutes", setup.news_event_proximity_minutes},
        {"zone", setup.zone},
        {"premium_position", setup.premium_position},
        {"in_premium_zone", setup.in_premium_zone},
        {"bearish_ob_count", setup.bearish_ob_count},
        {"bullish_ob_count", setup.bullish_ob_count},
        {"fvg_count", setup.fvg_count},
        {"has_bearish_mss", setup.has_bearish_mss},
        {"has_bullish_mss", setup.has_bullish_mss}
    };
}

void to_json(nlohmann::json& j, const TradePlan& plan) {
    j = {
        {"direction", to_string(plan.direction)},
        {"entry_zone_start", plan.entry_zone_start},
        {"entry_zone_end", plan.entry_zone_end},
        {"stop_loss", plan.stop_loss},
        {"tp1", plan.tp1},
        {"tp2", plan.tp2},
        {"estimated_rr", plan.estimated_rr},
        {"probability_score", plan.probability_score},
        {"scorer", plan.scorer}
    };
}
