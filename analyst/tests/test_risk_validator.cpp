#include <catch2/catch_test_macros.hpp>
#include "../src/risk_validator.hpp"

namespace {

RiskLimits test_limits() {
    RiskLimits limits;
    limits.max_trades_per_day = 2;
    limits.consecutive_loss_stop_count = 2;
    limits.max_daily_drawdown_percent = 3.0;
    limits.min_risk_reward_ratio = 1.5;
    limits.max_spread = 0.5;
    limits.min_probability = 30.0;
    limits.london_start_utc = "07:00";
    limits.london_end_utc = "10:00";
    limits.new_york_start_utc = "12:00";
    limits.new_york_end_utc = "15:00";
    return limits;
}

} // namespace

TEST_CASE("Session windows", "[risk]") {
    RiskValidator validator(test_limits());
    
    REQUIRE(validator.session_for("08:30") == Session::London);
    REQUIRE(validator.session_for("07:00") == Session::London);
    REQUIRE(validator.session_for("10:00") == Session::London);
    REQUIRE(validator.session_for("13:15") == Session::NewYork);
    REQUIRE(validator.session_for("17:30") == Session::None);
    REQUIRE(validator.session_for("06:59") == Session::None);
    
    SECTION("Epoch time is read as UTC") {
        // 2024-01-01 08:30:00 UTC
        REQUIRE(validator.session_for(static_cast<std::time_t>(1704097800)) == Session::London);
    }
    
    REQUIRE(to_string(Session::NewYork) == "NEW_YORK");
    REQUIRE(to_string(Session::None) == "NONE");
}

TEST_CASE("Daily limits", "[risk]") {
    RiskValidator validator(test_limits());
    
    SECTION("Fresh day may trade") {
        RiskDecision d = validator.can_trade(RiskState{});
        REQUIRE(d.allowed);
        REQUIRE(d.reason == "OK");
    }
    
    SECTION("Trade cap is checked first") {
        RiskState state{2, 5, 10.0};
        RiskDecision d = validator.can_trade(state);
        REQUIRE_FALSE(d.allowed);
        REQUIRE(d.reason == "Max daily trades reached");
    }
    
    SECTION("Loss streak before drawdown") {
        RiskState state{0, 2, 10.0};
        REQUIRE(validator.can_trade(state).reason == "Stopped due to consecutive losses");
    }
    
    SECTION("Drawdown") {
        RiskState state{0, 0, 3.0};
        REQUIRE(validator.can_trade(state).reason == "Max daily drawdown reached");
    }
    
    SECTION("State updates") {
        RiskState state = RiskValidator::record_trade(RiskState{});
        REQUIRE(state.daily_trades == 1);
        
        state = RiskValidator::record_outcome(state, true, -1.0);
        state = RiskValidator::record_outcome(state, true, -0.5);
        REQUIRE(state.consecutive_losses == 2);
        REQUIRE(state.daily_drawdown_pct == 1.5);
        
        state = RiskValidator::record_outcome(state, false, 2.0);
        REQUIRE(state.consecutive_losses == 0);
        REQUIRE(state.daily_drawdown_pct == 1.5);
    }
}

TEST_CASE("Daily state rebuilt from persisted history", "[risk]") {
    RiskValidator validator(test_limits());
    
    auto result = [](const std::string& outcome, double pnl) {
        TradeOutcome o;
        o.outcome = outcome;
        o.pnl_percent = pnl;
        return o;
    };
    
    SECTION("Two losses in a row stop the next run") {
        RiskState state = RiskValidator::replay_day(1, {result("LOSS", -1.0), result("LOSS", -0.5)});
        REQUIRE(state.daily_trades == 1);
        REQUIRE(state.consecutive_losses == 2);
        REQUIRE(state.daily_drawdown_pct == 1.5);
        REQUIRE(validator.can_trade(state).reason == "Stopped due to consecutive losses");
    }
    
    SECTION("A later win clears the streak but not the drawdown") {
        RiskState state = RiskValidator::replay_day(1, {result("LOSS", -1.0), result("WIN", 2.0)});
        REQUIRE(state.consecutive_losses == 0);
        REQUIRE(state.daily_drawdown_pct == 1.0);
        REQUIRE(validator.can_trade(state).allowed);
    }
    
    SECTION("Plans already issued today count toward the cap") {
        RiskState state = RiskValidator::replay_day(2, {});
        REQUIRE(validator.can_trade(state).reason == "Max daily trades reached");
    }
}

TEST_CASE("Setup validation", "[risk]") {
    RiskValidator validator(test_limits());
    
    RiskDecision rr = validator.validate_setup(1.0, 0.6, 10.0);
    REQUIRE_FALSE(rr.allowed);
    REQUIRE(rr.reason == "R:R 1.00 < 1.5");
    
    RiskDecision spread = validator.validate_setup(2.0, 0.6, 10.0);
    REQUIRE_FALSE(spread.allowed);
    REQUIRE(spread.reason == "Spread 0.6 > 0.5");
    
    RiskDecision prob = validator.validate_setup(2.0, 0.1, 20.0);
    REQUIRE_FALSE(prob.allowed);
    REQUIRE(prob.reason == "Probability 20.0% < 30%");
    
    RiskDecision ok = validator.validate_setup(2.0, 0.1, 35.0);
    REQUIRE(ok.allowed);
    REQUIRE(ok.reason == "Valid");
}
