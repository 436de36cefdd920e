#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/indicators.hpp"
#include "test_bars.hpp"
#include <cmath>

using Catch::Approx;

TEST_CASE("Simple moving average", "[indicators]") {
    auto out = indicators::sma({1.0, 2.0, 3.0, 4.0}, 2);
    
    REQUIRE(out.size() == 4);
    REQUIRE(std::isnan(out[0]));
    REQUIRE(out[1] == Approx(1.5));
    REQUIRE(out[2] == Approx(2.5));
    REQUIRE(out[3] == Approx(3.5));
    
    SECTION("Window longer than input stays NaN") {
        auto short_out = indicators::sma({1.0, 2.0}, 5);
        REQUIRE(std::isnan(short_out[0]));
        REQUIRE(std::isnan(short_out[1]));
    }
}

TEST_CASE("RSI", "[indicators]") {
    SECTION("All-gain window saturates at 100") {
        std::vector<double> closes;
        for (int i = 0; i < 15; i++) closes.push_back(100.0 + i);
        
        auto out = indicators::rsi(closes, 14);
        // Fourteen deltas are needed, so the first value is on the fifteenth close
        REQUIRE(std::isnan(out[13]));
        REQUIRE(out[14] == Approx(100.0));
    }
    
    SECTION("Flat window is undefined") {
        std::vector<double> closes(20, 100.0);
        auto out = indicators::rsi(closes, 14);
        REQUIRE(std::isnan(out.back()));
    }
    
    SECTION("Equal gains and losses give 50") {
        auto out = indicators::rsi({10.0, 11.0, 10.0, 11.0, 10.0}, 2);
        REQUIRE(std::isnan(out[1]));
        REQUIRE(out[2] == Approx(50.0));
        REQUIRE(out[4] == Approx(50.0));
    }
}

TEST_CASE("ATR uses true range", "[indicators]") {
    std::vector<Bar> bars = {
        make_bar(1.2, 2.0, 1.0, 1.5),
        make_bar(2.6, 3.0, 2.5, 2.8),
    };
    
    auto out = indicators::atr(bars, 2);
    REQUIRE(std::isnan(out[0]));
    // Second bar gaps up: true range is 3.0 - 1.5
    REQUIRE(out[1] == Approx((1.0 + 1.5) / 2.0));
}

TEST_CASE("VWAP is NaN until volume trades", "[indicators]") {
    Bar quiet = make_bar(1.0, 1.0, 1.0, 1.0);
    Bar active = make_bar(2.0, 3.0, 1.0, 2.0);
    active.volume = 10.0;
    
    auto out = indicators::vwap({quiet, active});
    REQUIRE(std::isnan(out[0]));
    REQUIRE(out[1] == Approx(2.0));
}

TEST_CASE("BarSeries recomputes indicator columns", "[indicators]") {
    std::vector<Bar> raw;
    for (int i = 0; i < 20; i++) {
        Bar bar = make_bar(100.0 + i, 101.0 + i, 99.0 + i, 100.5 + i);
        bar.volume = 100.0;
        raw.push_back(bar);
    }
    BarSeries series(raw);
    series.recompute_indicators();
    
    REQUIRE(series.current().rsi == Approx(100.0));
    REQUIRE_FALSE(std::isnan(series.current().atr));
    REQUIRE_FALSE(std::isnan(series.current().vwap));
    REQUIRE(std::isnan(series[0].atr));
}
