#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace {

nlohmann::json risk_json() {
    return {
        {"risk_rules_locked", {
            {"max_trades_per_day", 2},
            {"consecutive_loss_stop_count", 2},
            {"max_daily_drawdown_percent", 3.0},
            {"min_risk_reward_ratio", 1.5}
        }},
        {"filters", {
            {"max_spread_pips", 0.5},
            {"min_probability_threshold", 30}
        }},
        {"trading_hours", {
            {"london_start_utc", "07:00"},
            {"london_end_utc", "10:00"},
            {"new_york_start_utc", "12:00"},
            {"new_york_end_utc", "15:00"}
        }}
    };
}

} // namespace

TEST_CASE("Trading config", "[config]") {
    nlohmann::json j = {
        {"active_instruments", {
            {{"display_name", "XAU/USD"}, {"yahoo_symbol", "GC=F"}, {"asset_class", "forex"},
             {"enabled", true}, {"typical_spread", 0.3}},
            {{"display_name", "BTC/USD"}, {"yahoo_symbol", "BTC-USD"}, {"asset_class", "crypto"},
             {"enabled", false}}
        }},
        {"analysis_settings", {
            {"forex", {{"direction", "SHORT"}, {"exhaustion_multiplier", 1.5}}}
        }},
        {"risk_settings", {{"account_balance", 25000.0}, {"max_alerts_per_run", 2}}}
    };
    
    TradingConfig cfg = TradingConfig::from_json(j);
    
    REQUIRE(cfg.instruments().size() == 2);
    auto enabled = cfg.enabled_instruments();
    REQUIRE(enabled.size() == 1);
    REQUIRE(enabled[0].display_name == "XAU/USD");
    REQUIRE(enabled[0].typical_spread == 0.3);
    
    auto btc = cfg.find_instrument("BTC/USD");
    REQUIRE(btc.has_value());
    REQUIRE(btc->typical_spread == 0.1);
    REQUIRE_FALSE(cfg.find_instrument("EUR/USD").has_value());
    
    SECTION("Per-class settings override defaults") {
        AssetSettings forex = cfg.settings_for("forex");
        REQUIRE(forex.direction == DirectionMode::Short);
        REQUIRE(forex.exhaustion_multiplier == 1.5);
        REQUIRE(forex.swing_lookback == 5);
        std::vector<std::string> expected = {"Premium", "Premium (Weak)"};
        REQUIRE(forex.short_zones == expected);
    }
    
    SECTION("Crypto defaults accept equilibrium") {
        AssetSettings crypto = cfg.settings_for("crypto");
        REQUIRE(crypto.direction == DirectionMode::Both);
        std::vector<std::string> expected = {"Discount", "Equilibrium"};
        REQUIRE(crypto.zones_for(Direction::Long) == expected);
    }
    
    SECTION("Risk settings") {
        REQUIRE(cfg.risk_settings().account_balance == 25000.0);
        REQUIRE(cfg.risk_settings().max_alerts_per_run == 2);
        REQUIRE(cfg.risk_settings().risk_per_instrument_percent == 1.0);
    }
}

TEST_CASE("Trading config rejects bad input", "[config]") {
    REQUIRE_THROWS_AS(TradingConfig::from_json(nlohmann::json::object()), std::runtime_error);
    REQUIRE_THROWS_AS(TradingConfig::from_json({{"active_instruments", nlohmann::json::array()}}),
                      std::runtime_error);
    REQUIRE_THROWS_AS(TradingConfig::load("/nonexistent/trading_config.json"), std::runtime_error);
    
    nlohmann::json bad_direction = {
        {"active_instruments", {{{"display_name", "XAU/USD"}, {"yahoo_symbol", "GC=F"}}}},
        {"analysis_settings", {{"forex", {{"direction", "SIDEWAYS"}}}}}
    };
    TradingConfig cfg = TradingConfig::from_json(bad_direction);
    REQUIRE_THROWS_AS(cfg.settings_for("forex"), std::runtime_error);
}

TEST_CASE("Risk limits", "[config]") {
    RiskLimits limits = RiskLimits::from_json(risk_json());
    REQUIRE(limits.max_trades_per_day == 2);
    REQUIRE(limits.min_probability == 30.0);
    REQUIRE(limits.new_york_end_utc == "15:00");
    
    SECTION("Every key is mandatory") {
        nlohmann::json j = risk_json();
        j["filters"].erase("max_spread_pips");
        
        try {
            RiskLimits::from_json(j);
            FAIL("expected missing key to throw");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()) == "Missing risk config key: filters.max_spread_pips");
        }
    }
    
    SECTION("Missing section") {
        nlohmann::json j = risk_json();
        j.erase("trading_hours");
        REQUIRE_THROWS_AS(RiskLimits::from_json(j), std::runtime_error);
    }
}

TEST_CASE("Direction modes", "[config]") {
    REQUIRE(parse_direction_mode("SHORT") == DirectionMode::Short);
    REQUIRE(parse_direction_mode("BOTH") == DirectionMode::Both);
    REQUIRE_THROWS_AS(parse_direction_mode("UP"), std::invalid_argument);
}

TEST_CASE("Environment defaults", "[config]") {
    unsetenv("MODEL_PATH");
    unsetenv("ANALYST_MODE");
    
    Config cfg = Config::from_env();
    REQUIRE(cfg.mode == "live");
    // No model ships with the analyst; scoring stays rule-based until one is exported
    REQUIRE(cfg.model_path.empty());
}

TEST_CASE("Outcome mode", "[config]") {
    Config cfg;
    cfg.mode = "outcome";
    cfg.session = "AUTO";
    cfg.pg_dsn = "postgresql://localhost/smc";
    cfg.outcome_plan_id = 42;
    cfg.outcome_result = "LOSS";
    cfg.outcome_pnl_percent = -1.0;
    cfg.outcome_r_multiple = -1.0;
    
    SECTION("Valid result builds an outcome") {
        REQUIRE_NOTHROW(cfg.validate());
        TradeOutcome o = cfg.outcome();
        REQUIRE(o.plan_id == 42);
        REQUIRE(o.outcome == "LOSS");
        REQUIRE(o.pnl_percent == -1.0);
    }
    
    SECTION("Unknown result is rejected") {
        cfg.outcome_result = "SCRATCH";
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }
    
    SECTION("Plan id is required") {
        cfg.outcome_plan_id = 0;
        REQUIRE_THROWS_AS(cfg.outcome(), std::runtime_error);
    }
}
