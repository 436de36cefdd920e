#include <catch2/catch_test_macros.hpp>
#include "../src/market_data.hpp"

TEST_CASE("Chart payload to bars", "[market_data]") {
    nlohmann::json payload = {
        {"chart", {
            {"result", nlohmann::json::array({
                {
                    {"timestamp", {1704461400, 1704462300, 1704463200}},
                    {"indicators", {
                        {"quote", nlohmann::json::array({
                            {
                                {"open", {2045.0, nullptr, 2047.0}},
                                {"high", {2046.0, 2047.5, 2048.0}},
                                {"low", {2044.0, 2045.0, 2046.5}},
                                {"close", {2045.5, 2047.0, 2047.8}},
                                {"volume", {1200, 900, nullptr}}
                            }
                        })}
                    }}
                }
            })},
            {"error", nullptr}
        }}
    };
    
    BarSeries bars = MarketDataClient::parse_chart(payload);
    
    // Row with a null open is skipped
    REQUIRE(bars.size() == 2);
    REQUIRE(bars[0].ts_ms == 1704461400000LL);
    REQUIRE(bars[0].open == 2045.0);
    REQUIRE(bars[0].volume == 1200.0);
    REQUIRE(bars[1].close == 2047.8);
    REQUIRE(bars[1].volume == 0.0);
}

TEST_CASE("Empty or malformed chart payload", "[market_data]") {
    nlohmann::json no_result = {{"chart", {{"result", nullptr}, {"error", "Not Found"}}}};
    REQUIRE(MarketDataClient::parse_chart(no_result).empty());
    
    REQUIRE(MarketDataClient::parse_chart(nlohmann::json::object()).empty());
}
