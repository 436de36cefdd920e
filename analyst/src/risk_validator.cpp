#include "risk_validator.hpp"
#include "util.hpp"
#include <fmt/format.h>

std::string to_string(Session session) {
    switch (session) {
        case Session::London: return "LONDON";
        case Session::NewYork: return "NEW_YORK";
        case Session::None: return "NONE";
    }
    return "NONE";
}

RiskValidator::RiskValidator(RiskLimits limits) : limits_(std::move(limits)) {}

Session RiskValidator::session_for(std::time_t utc_time) const {
    return session_for(util::utc_hhmm(utc_time));
}

Session RiskValidator::session_for(const std::string& utc_hhmm) const {
    // Zero-padded HH:MM compares correctly as strings
    if (limits_.london_start_utc <= utc_hhmm && utc_hhmm <= limits_.london_end_utc) {
        return Session::London;
    }
    if (limits_.new_york_start_utc <= utc_hhmm && utc_hhmm <= limits_.new_york_end_utc) {
        return Session::NewYork;
    }
    return Session::None;
}

RiskDecision RiskValidator::can_trade(const RiskState& state) const {
    if (state.daily_trades >= limits_.max_trades_per_day) {
        return {false, "Max daily trades reached"};
    }
    if (state.consecutive_losses >= limits_.consecutive_loss_stop_count) {
        return {false, "Stopped due to consecutive losses"};
    }
    if (state.daily_drawdown_pct >= limits_.max_daily_drawdown_percent) {
        return {false, "Max daily drawdown reached"};
    }
    return {true, "OK"};
}

RiskDecision RiskValidator::validate_setup(double rr_ratio, double spread, double prob_score) const {
    if (rr_ratio < limits_.min_risk_reward_ratio) {
        return {false, fmt::format("R:R {:.2f} < {}", rr_ratio, limits_.min_risk_reward_ratio)};
    }
    if (spread > limits_.max_spread) {
        return {false, fmt::format("Spread {} > {}", spread, limits_.max_spread)};
    }
    if (prob_score < limits_.min_probability) {
        return {false, fmt::format("Probability {:.1f}% < {}%", prob_score, limits_.min_probability)};
    }
    return {true, "Valid"};
}

RiskState RiskValidator::record_trade(RiskState state) {
    state.daily_trades++;
    return state;
}

RiskState RiskValidator::record_outcome(RiskState state, bool was_loss, double pnl_pct) {
    state.consecutive_losses = was_loss ? state.consecutive_losses + 1 : 0;
    if (pnl_pct < 0) {
        state.daily_drawdown_pct += -pnl_pct;
    }
    return state;
}

RiskState RiskValidator::replay_day(int plans_today, const std::vector<TradeOutcome>& outcomes_today) {
    RiskState state;
    for (int i = 0; i < plans_today; ++i) {
        state = record_trade(state);
    }
    for (const auto& o : outcomes_today) {
        state = record_outcome(state, o.outcome == "LOSS", o.pnl_percent);
    }
    return state;
}
