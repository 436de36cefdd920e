#pragma once

#include "config.hpp"
#include "trade_types.hpp"
#include <ctime>
#include <string>

struct MailSettings {
    std::string user;
    std::string password;
    std::string recipient;
    std::string smtp_url;
    double account_balance = 10000.0;
    double risk_percent = 0.5;
    
    bool enabled() const { return !user.empty() && !password.empty(); }
    
    static MailSettings from_config(const Config& cfg, const RiskSettings& risk);
};

struct PositionSizing {
    double risk_amount;
    double sl_distance;
    double lot_size;
    int suggested_leverage;
};

struct FormattedMail {
    std::string subject;
    std::string html;
};

// Trade alerts over SMTP. Execution stays manual.
class AlertMailer {
public:
    explicit AlertMailer(MailSettings settings);
    
    // Lot size assumes 10 units per point; 0 when the stop distance is 0.
    // Leverage is lot size x10 clamped to [10, 100].
    static PositionSizing size_position(const TradePlan& plan, double account_balance,
                                       double risk_percent);
    
    // One decimal finer than the instrument's spread, between 2 and 6
    static int price_decimals(double spread);
    
    FormattedMail format_alert(const TradePlan& plan, const TradeSetup& setup,
                               std::time_t now) const;
    
    // False when disabled or on any SMTP failure (logged)
    bool send(const TradePlan& plan, const TradeSetup& setup);
    
private:
    MailSettings settings_;
    
    static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userp);
};
