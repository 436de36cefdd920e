#pragma once

#include "config.hpp"
#include "learning_review.hpp"
#include <ctime>
#include <string>
#include <vector>

enum class Session {
    London,
    NewYork,
    None
};

std::string to_string(Session session);

// Daily counters owned by the caller and threaded through each analysis
struct RiskState {
    int daily_trades = 0;
    int consecutive_losses = 0;
    double daily_drawdown_pct = 0.0;
};

struct RiskDecision {
    bool allowed;
    std::string reason;
};

class RiskValidator {
public:
    explicit RiskValidator(RiskLimits limits);
    
    // London is checked before New York where the windows overlap
    Session session_for(std::time_t utc_time) const;
    Session session_for(const std::string& utc_hhmm) const;
    
    // Trade cap, loss streak, drawdown, in that order
    RiskDecision can_trade(const RiskState& state) const;
    
    // R:R floor, spread cap, probability floor, in that order
    RiskDecision validate_setup(double rr_ratio, double spread, double prob_score) const;
    
    static RiskState record_trade(RiskState state);
    static RiskState record_outcome(RiskState state, bool was_loss, double pnl_pct);
    
    // Today's counters rebuilt from persisted history, outcomes oldest first
    static RiskState replay_day(int plans_today, const std::vector<TradeOutcome>& outcomes_today);
    
    const RiskLimits& limits() const { return limits_; }
    
private:
    RiskLimits limits_;
};
