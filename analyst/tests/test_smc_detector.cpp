#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/smc_detector.hpp"
#include "test_bars.hpp"

using Catch::Approx;

namespace {

Bar filler() {
    return make_bar(100.0, 100.5, 99.5, 100.0);
}

// Bullish candle followed by a bearish one closing `depth` below its low
void push_bearish_block(std::vector<Bar>& bars, double depth) {
    bars.push_back(make_bar(100.0, 101.5, 99.5, 101.0));
    bars.push_back(make_bar(101.0, 101.0, 99.4 - depth, 99.5 - depth));
}

} // namespace

TEST_CASE("Order blocks keep the three strongest", "[smc]") {
    std::vector<Bar> bars = {filler()};
    for (double depth : {1.0, 2.0, 3.0, 4.0}) {
        push_bearish_block(bars, depth);
        bars.push_back(filler());
    }
    BarSeries series(bars);
    SmcDetector detector(series, 1);
    
    auto bearish = detector.detect_order_blocks(Polarity::Bearish);
    REQUIRE(bearish.size() == SmcDetector::kMaxOrderBlocks);
    REQUIRE(bearish[0].anchor_index == 10);
    REQUIRE(bearish[0].strength == Approx(4.0));
    REQUIRE(bearish[1].anchor_index == 7);
    REQUIRE(bearish[2].anchor_index == 4);
    REQUIRE(bearish[0].top == 101.5);
    REQUIRE(bearish[0].bottom == 99.5);
    
    REQUIRE(detector.detect_order_blocks(Polarity::Bullish).empty());
}

TEST_CASE("Fair value gaps keep the most recent five", "[smc]") {
    std::vector<Bar> bars;
    for (int k = 0; k < 9; k++) {
        double high = 100.0 - 10.0 * k;
        bars.push_back(make_bar(high - 1.0, high, high - 5.0, high - 4.0));
    }
    BarSeries series(bars);
    SmcDetector detector(series);
    
    auto gaps = detector.detect_fvgs();
    REQUIRE(gaps.size() == SmcDetector::kMaxFairValueGaps);
    REQUIRE(gaps.front().index == 4);
    REQUIRE(gaps.back().index == 8);
    for (const auto& gap : gaps) {
        REQUIRE(gap.kind == Polarity::Bearish);
        REQUIRE(gap.size == Approx(15.0));
    }
}

TEST_CASE("Premium/discount zone", "[smc]") {
    SECTION("Close at 70% of the range is premium") {
        BarSeries series = premium_sweep_series();
        PremiumDiscountZone zone = SmcDetector(series).calculate_zone();
        
        REQUIRE(zone.range_high == 110.0);
        REQUIRE(zone.range_low == 100.0);
        REQUIRE(zone.position == Approx(0.7));
        REQUIRE(zone.zone == "Premium");
        REQUIRE(zone.strength == "STRONG SHORT ZONE");
        REQUIRE(zone.in_premium());
        REQUIRE(zone.levels.size() == 7);
        REQUIRE(zone.levels[2].label == "0.618 (Golden)");
        REQUIRE(zone.levels[2].price == Approx(106.18));
    }
    
    SECTION("Close at 30% of the range is discount") {
        BarSeries series = discount_sweep_series();
        PremiumDiscountZone zone = SmcDetector(series).calculate_zone();
        
        REQUIRE(zone.zone == "Discount");
        REQUIRE(zone.strength == "LONG ZONE");
        REQUIRE_FALSE(zone.in_premium());
    }
    
    SECTION("Flat window sits at equilibrium") {
        std::vector<Bar> bars(10, make_bar(100.0, 100.0, 100.0, 100.0));
        BarSeries series(bars);
        PremiumDiscountZone zone = SmcDetector(series).calculate_zone();
        
        REQUIRE(zone.position == 0.5);
        REQUIRE(zone.zone == "Equilibrium");
    }
    
    SECTION("Position stays within [0, 1]") {
        BarSeries series = premium_sweep_series();
        PremiumDiscountZone zone = SmcDetector(series).calculate_zone();
        REQUIRE(zone.position >= 0.0);
        REQUIRE(zone.position <= 1.0);
    }
    
    SECTION("Only the last 50 bars define the range") {
        auto bars = ranging_base();
        bars[0].high = 200.0;
        bars.push_back(make_bar(106.0, 107.5, 105.5, 107.0));
        BarSeries series(bars);
        
        REQUIRE(SmcDetector(series).calculate_zone().range_high == 110.0);
    }
}

TEST_CASE("Market structure shift", "[smc]") {
    BarSeries series(std::vector<Bar>{make_bar(112.0, 113.0, 111.5, 112.0)});
    
    SECTION("Bearish shift wins when both patterns are present") {
        SwingSet swings;
        swings.lows = {{1, 111.0, SwingKind::Low}, {5, 115.0, SwingKind::Low}};
        swings.highs = {{2, 120.0, SwingKind::High}, {6, 110.0, SwingKind::High}};
        
        auto mss = SmcDetector::detect_mss(series, swings);
        REQUIRE(mss.has_value());
        REQUIRE(mss->type == MssType::Bearish);
        REQUIRE(mss->broken_level == 115.0);
        REQUIRE(mss->implication == "Trend reversal to downside");
        REQUIRE(mss->label() == "Bearish MSS");
    }
    
    SECTION("Close above a lower high is bullish") {
        SwingSet swings;
        swings.highs = {{2, 120.0, SwingKind::High}, {6, 110.0, SwingKind::High}};
        
        auto mss = SmcDetector::detect_mss(series, swings);
        REQUIRE(mss.has_value());
        REQUIRE(mss->type == MssType::Bullish);
        REQUIRE(mss->implication == "Trend reversal to upside");
    }
    
    SECTION("Fewer than two swings means no shift") {
        SwingSet swings;
        swings.lows = {{5, 115.0, SwingKind::Low}};
        REQUIRE_FALSE(SmcDetector::detect_mss(series, swings).has_value());
    }
}

TEST_CASE("Full SMC analysis", "[smc]") {
    BarSeries series = premium_sweep_series();
    SmcAnalysis smc = SmcDetector(series, 5).analyze_all();
    
    REQUIRE(smc.bearish_order_blocks.empty());
    REQUIRE(smc.bullish_order_blocks.empty());
    REQUIRE(smc.fair_value_gaps.size() == 1);
    REQUIRE(smc.fair_value_gaps[0].kind == Polarity::Bullish);
    REQUIRE_FALSE(smc.market_structure_shift.has_value());
    
    std::string summary = format_smc_summary(smc);
    REQUIRE(summary.find("Zone: Premium (70.0%)") != std::string::npos);
    REQUIRE(summary.find("FVGs: 1 Active") != std::string::npos);
    
    nlohmann::json j = smc;
    REQUIRE(j["premium_discount"]["zone"] == "Premium");
    REQUIRE(j["market_structure_shift"].is_null());
    REQUIRE(j["fair_value_gaps"][0]["type"] == "Bullish FVG");
}
