#include <catch2/catch_test_macros.hpp>
#include "../src/swing_locator.hpp"
#include "test_bars.hpp"

TEST_CASE("Swing points", "[swings]") {
    SECTION("Single peak is the only swing high") {
        std::vector<Bar> bars;
        for (double h : {1.0, 2.0, 3.0, 5.0, 3.0, 2.0, 1.0}) {
            bars.push_back(make_bar(h - 0.5, h, h - 1.0, h - 0.5));
        }
        
        SwingSet swings = SwingLocator::locate(BarSeries(bars), 2);
        REQUIRE(swings.highs.size() == 1);
        REQUIRE(swings.highs[0].index == 3);
        REQUIRE(swings.highs[0].price == 5.0);
        REQUIRE(swings.highs[0].kind == SwingKind::High);
        REQUIRE(swings.lows.empty());
    }
    
    SECTION("Series shorter than the window has no swings") {
        std::vector<Bar> bars(4, make_bar(1.0, 2.0, 0.0, 1.0));
        SwingSet swings = SwingLocator::locate(BarSeries(bars), 2);
        REQUIRE(swings.highs.empty());
        REQUIRE(swings.lows.empty());
    }
    
    SECTION("Ties all qualify") {
        std::vector<Bar> bars(5, make_bar(1.0, 2.0, 0.0, 1.0));
        SwingSet swings = SwingLocator::locate(BarSeries(bars), 1);
        REQUIRE(swings.highs.size() == 3);
        REQUIRE(swings.lows.size() == 3);
    }
}

TEST_CASE("Swing structure labels", "[swings]") {
    SwingSet swings;
    REQUIRE(SwingLocator::describe_highs(swings) == "Range");
    REQUIRE(SwingLocator::describe_lows(swings) == "Range");
    
    swings.highs = {{5, 110.0, SwingKind::High}, {15, 108.0, SwingKind::High}};
    swings.lows = {{8, 100.0, SwingKind::Low}, {18, 102.0, SwingKind::Low}};
    REQUIRE(SwingLocator::describe_highs(swings) == "LH");
    REQUIRE(SwingLocator::describe_lows(swings) == "HL");
    
    swings.highs.push_back({25, 112.0, SwingKind::High});
    swings.lows.push_back({28, 102.0, SwingKind::Low});
    REQUIRE(SwingLocator::describe_highs(swings) == "HH");
    REQUIRE(SwingLocator::describe_lows(swings) == "EQL");
}
