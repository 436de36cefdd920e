#pragma once

#include "bar_series.hpp"
#include "swing_locator.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

enum class Polarity {
    Bullish,
    Bearish
};

// Last candle of one polarity before a displacement candle that closes
// beyond its opposite extreme
struct OrderBlock {
    Polarity kind;
    size_t anchor_index;
    double top;
    double bottom;
    double strength;  // displacement past the anchor's extreme
};

// Three-bar imbalance between bar[i-2] and bar[i]
struct FairValueGap {
    Polarity kind;
    size_t index;
    double top;
    double bottom;
    double size;
};

struct FibLevel {
    std::string label;
    double ratio;
    double price;
};

struct PremiumDiscountZone {
    double current_price = 0.0;
    double range_high = 0.0;
    double range_low = 0.0;
    double position = 0.5;  // 0 = range low, 1 = range high
    std::string zone;       // "Premium", "Premium (Weak)", "Equilibrium", "Discount"
    std::string strength;
    std::vector<FibLevel> levels;
    
    bool in_premium() const;
};

enum class MssType {
    Bearish,
    Bullish
};

struct MarketStructureShift {
    MssType type;
    double broken_level;
    std::string implication;
    
    std::string label() const;
};

struct SmcAnalysis {
    std::vector<OrderBlock> bearish_order_blocks;
    std::vector<OrderBlock> bullish_order_blocks;
    std::vector<FairValueGap> fair_value_gaps;
    PremiumDiscountZone premium_discount;
    std::optional<MarketStructureShift> market_structure_shift;
    SwingSet swings;
    
    bool has_bearish_mss() const;
    bool has_bullish_mss() const;
};

class SmcDetector {
public:
    static constexpr size_t kMaxOrderBlocks = 3;
    static constexpr size_t kMaxFairValueGaps = 5;
    static constexpr size_t kZoneWindow = 50;
    
    explicit SmcDetector(const BarSeries& bars, size_t swing_lookback = 5);
    
    // Up to 3 blocks, strongest first; equal strengths keep scan order
    std::vector<OrderBlock> detect_order_blocks(Polarity kind) const;
    
    // Last 5 gaps in scan order (most recent last)
    std::vector<FairValueGap> detect_fvgs() const;
    
    PremiumDiscountZone calculate_zone() const;
    
    std::optional<MarketStructureShift> detect_mss() const;
    
    // Bearish shift is checked first and wins when both patterns are present.
    static std::optional<MarketStructureShift> detect_mss(const BarSeries& bars,
                                                         const SwingSet& swings);
    
    SmcAnalysis analyze_all() const;
    
private:
    const BarSeries& bars_;
    size_t swing_lookback_;
};

std::string to_string(Polarity kind);
std::string format_smc_summary(const SmcAnalysis& smc);

void to_json(nlohmann::json& j, const OrderBlock& ob);
void to_json(nlohmann::json& j, const FairValueGap& fvg);
void to_json(nlohmann::json& j, const PremiumDiscountZone& zone);
void to_json(nlohmann::json& j, const MarketStructureShift& mss);
void to_json(nlohmann::json& j, const SmcAnalysis& smc);
