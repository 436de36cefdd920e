#include "smc_detector.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstddef>

bool PremiumDiscountZone::in_premium() const {
    return zone.find("Premium") != std::string::npos;
}

std::string MarketStructureShift::label() const {
    return type == MssType::Bearish ? "Bearish MSS" : "Bullish MSS";
}

bool SmcAnalysis::has_bearish_mss() const {
    return market_structure_shift && market_structure_shift->type == MssType::Bearish;
}

bool SmcAnalysis::has_bullish_mss() const {
    return market_structure_shift && market_structure_shift->type == MssType::Bullish;
}

SmcDetector::SmcDetector(const BarSeries& bars, size_t swing_lookback)
    : bars_(bars)
    , swing_lookback_(swing_lookback)
{}

std::vector<OrderBlock> SmcDetector::detect_order_blocks(Polarity kind) const {
    std::vector<OrderBlock> blocks;
    
    for (size_t i = swing_lookback_; i + 1 < bars_.size(); i++) {
        const Bar& current = bars_[i];
        const Bar& next = bars_[i + 1];
        
        if (kind == Polarity::Bearish) {
            // Bullish candle, then a bearish candle closing below its low
            if (current.is_bullish() && next.close < current.low && next.is_bearish()) {
                blocks.push_back({Polarity::Bearish, i, current.high, current.low,
                                  std::abs(next.close - current.low)});
            }
        } else {
            if (current.is_bearish() && next.close > current.high && next.is_bullish()) {
                blocks.push_back({Polarity::Bullish, i, current.high, current.low,
                                  std::abs(next.close - current.high)});
            }
        }
    }
    
    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const OrderBlock& a, const OrderBlock& b) {
                         return a.strength > b.strength;
                     });
    
    if (blocks.size() > kMaxOrderBlocks) {
        blocks.resize(kMaxOrderBlocks);
    }
    return blocks;
}

std::vector<FairValueGap> SmcDetector::detect_fvgs() const {
    std::vector<FairValueGap> gaps;
    
    for (size_t i = 2; i < bars_.size(); i++) {
        const Bar& before = bars_[i - 2];
        const Bar& current = bars_[i];
        
        if (before.low > current.high) {
            gaps.push_back({Polarity::Bearish, i, before.low, current.high,
                            before.low - current.high});
        } else if (before.high < current.low) {
            gaps.push_back({Polarity::Bullish, i, current.low, before.high,
                            current.low - before.high});
        }
    }
    
    if (gaps.size() > kMaxFairValueGaps) {
        gaps.erase(gaps.begin(), gaps.end() - static_cast<std::ptrdiff_t>(kMaxFairValueGaps));
    }
    return gaps;
}

PremiumDiscountZone SmcDetector::calculate_zone() const {
    PremiumDiscountZone result;
    
    if (bars_.empty()) {
        result.zone = "Equilibrium";
        result.strength = "NEUTRAL ZONE";
        return result;
    }
    
    size_t start = bars_.tail_start(kZoneWindow);
    double high = bars_[start].high;
    double low = bars_[start].low;
    for (size_t i = start; i < bars_.size(); i++) {
        high = std::max(high, bars_[i].high);
        low = std::min(low, bars_[i].low);
    }
    
    const double range = high - low;
    result.current_price = bars_.current().close;
    result.range_high = high;
    result.range_low = low;
    // Flat window sits at equilibrium
    result.position = range > 0 ? (result.current_price - low) / range : 0.5;
    result.position = std::clamp(result.position, 0.0, 1.0);
    
    result.levels = {
        {"1.0 (High)", 1.0, high},
        {"0.786", 0.786, high - range * 0.214},
        {"0.618 (Golden)", 0.618, high - range * 0.382},
        {"0.5 (Equilibrium)", 0.5, high - range * 0.5},
        {"0.382", 0.382, high - range * 0.618},
        {"0.236", 0.236, high - range * 0.764},
        {"0.0 (Low)", 0.0, low},
    };
    
    if (result.position > 0.618) {
        result.zone = "Premium";
        result.strength = "STRONG SHORT ZONE";
    } else if (result.position > 0.5) {
        result.zone = "Premium (Weak)";
        result.strength = "MODERATE SHORT ZONE";
    } else if (result.position > 0.382) {
        result.zone = "Equilibrium";
        result.strength = "NEUTRAL ZONE";
    } else {
        result.zone = "Discount";
        result.strength = "LONG ZONE";
    }
    
    return result;
}

std::optional<MarketStructureShift> SmcDetector::detect_mss() const {
    return detect_mss(bars_, SwingLocator::locate(bars_, swing_lookback_));
}

std::optional<MarketStructureShift> SmcDetector::detect_mss(const BarSeries& bars,
                                                             const SwingSet& swings) {
    if (bars.empty()) return std::nullopt;
    const double close = bars.current().close;
    
    // Bearish: higher low formed, then close broke below it
    if (swings.lows.size() >= 2) {
        const auto& earlier = swings.lows[swings.lows.size() - 2];
        const auto& later = swings.lows.back();
        if (later.price > earlier.price && close < later.price) {
            return MarketStructureShift{MssType::Bearish, later.price,
                                        "Trend reversal to downside"};
        }
    }
    
    // Bullish: lower high formed, then close broke above it
    if (swings.highs.size() >= 2) {
        const auto& earlier = swings.highs[swings.highs.size() - 2];
        const auto& later = swings.highs.back();
        if (later.price < earlier.price && close > later.price) {
            return MarketStructureShift{MssType::Bullish, later.price,
                                        "Trend reversal to upside"};
        }
    }
    
    return std::nullopt;
}

SmcAnalysis SmcDetector::analyze_all() const {
    SmcAnalysis smc;
    smc.bearish_order_blocks = detect_order_blocks(Polarity::Bearish);
    smc.bullish_order_blocks = detect_order_blocks(Polarity::Bullish);
    smc.fair_value_gaps = detect_fvgs();
    smc.premium_discount = calculate_zone();
    smc.swings = SwingLocator::locate(bars_, swing_lookback_);
    smc.market_structure_shift = detect_mss(bars_, smc.swings);
    return smc;
}

std::string to_string(Polarity kind) {
    return kind == Polarity::Bullish ? "Bullish" : "Bearish";
}

std::string format_smc_summary(const SmcAnalysis& smc) {
    const auto& zone = smc.premium_discount;
    
    std::string summary = fmt::format(
        "SMC Analysis:\n"
        "- Zone: {} ({:.1f}%)\n"
        "- {}\n"
        "- OB Found: {} Bearish, {} Bullish\n"
        "- FVGs: {} Active",
        zone.zone, zone.position * 100.0, zone.strength,
        smc.bearish_order_blocks.size(), smc.bullish_order_blocks.size(),
        smc.fair_value_gaps.size());
    
    if (smc.market_structure_shift) {
        summary += fmt::format("\n- MSS: {} - {}",
                               smc.market_structure_shift->label(),
                               smc.market_structure_shift->implication);
    }
    
    return summary;
}

void to_json(nlohmann::json& j, const OrderBlock& ob) {
    j = {
        {"type", to_string(ob.kind) + " OB"},
        {"index", ob.anchor_index},
        {"top", ob.top},
        {"bottom", ob.bottom},
        {"strength", ob.strength}
    };
}

void to_json(nlohmann::json& j, const FairValueGap& fvg) {
    j = {
        {"type", to_string(fvg.kind) + " FVG"},
        {"index", fvg.index},
        {"top", fvg.top},
        {"bottom", fvg.bottom},
        {"size", fvg.size}
    };
}

void to_json(nlohmann::json& j, const PremiumDiscountZone& zone) {
    nlohmann::json levels = nlohmann::json::object();
    for (const auto& level : zone.levels) {
        levels[level.label] = level.price;
    }
    
    j = {
        {"current_price", zone.current_price},
        {"position", zone.position},
        {"zone", zone.zone},
        {"strength", zone.strength},
        {"levels", levels}
    };
}

void to_json(nlohmann::json& j, const MarketStructureShift& mss) {
    j = {
        {"type", mss.label()},
        {"broken_level", mss.broken_level},
        {"implication", mss.implication}
    };
}

void to_json(nlohmann::json& j, const SmcAnalysis& smc) {
    j = {
        {"order_blocks", {
            {"bearish", smc.bearish_order_blocks},
            {"bullish", smc.bullish_order_blocks}
        }},
        {"fair_value_gaps", smc.fair_value_gaps},
        {"premium_discount", smc.premium_discount},
        {"market_structure_shift", nullptr}
    };
    if (smc.market_structure_shift) {
        j["market_structure_shift"] = *smc.market_structure_shift;
    }
}
