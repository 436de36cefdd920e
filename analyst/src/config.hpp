#pragma once

#include "trade_types.hpp"
#include "learning_review.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <cstdint>
#include <nlohmann/json.hpp>

struct Config {
    // Run
    std::string mode;        // "startup", "live", "review", "outcome"
    std::string session;     // "LONDON", "NEW_YORK", "AUTO"
    std::string symbol;      // optional single-instrument filter
    
    // Config files
    std::string trading_config_path;
    std::string risk_config_path;
    std::string model_path;
    
    // Postgres
    std::string pg_dsn;
    
    // Collaborators
    std::string market_data_url;
    std::string news_url;
    int http_timeout_ms;
    
    // Email
    std::string email_user;
    std::string email_password;
    std::string email_recipient;
    std::string smtp_url;
    
    // Outcome mode: result of a previously alerted plan
    int64_t outcome_plan_id = 0;
    std::string outcome_result;
    double outcome_entry_price = 0.0;
    double outcome_exit_price = 0.0;
    double outcome_r_multiple = 0.0;
    double outcome_pnl_percent = 0.0;
    std::string outcome_comments;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
    // Throws std::runtime_error unless the plan id is positive and the
    // result is WIN, LOSS or BREAK_EVEN
    TradeOutcome outcome() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};

// Per-asset-class analysis settings
struct AssetSettings {
    std::vector<std::string> short_zones;
    std::vector<std::string> long_zones;
    DirectionMode direction = DirectionMode::Both;
    double exhaustion_multiplier = 1.0;
    size_t swing_lookback = 5;
    size_t sweep_lookback = 10;
    double entry_zone_width = 1.0;
    bool reject_counter_trend = false;
    
    // Crypto accepts Equilibrium on both sides
    static AssetSettings defaults_for(const std::string& asset_class);
    // Keys absent from `j` keep the class defaults
    static AssetSettings from_json(const nlohmann::json& j, const std::string& asset_class);
    
    const std::vector<std::string>& zones_for(Direction direction) const;
};

struct Instrument {
    std::string display_name;
    std::string yahoo_symbol;
    std::string asset_class;
    bool enabled = false;
    double typical_spread = 0.1;
};

struct RiskSettings {
    double risk_per_instrument_percent = 1.0;
    double account_balance = 10000.0;
    int max_alerts_per_run = 5;
};

class TradingConfig {
public:
    // Throws std::runtime_error on a missing file, malformed JSON or an
    // empty instrument list
    static TradingConfig load(const std::string& path);
    static TradingConfig from_json(const nlohmann::json& j);
    
    std::vector<Instrument> enabled_instruments() const;
    std::optional<Instrument> find_instrument(const std::string& display_name) const;
    AssetSettings settings_for(const std::string& asset_class) const;
    const RiskSettings& risk_settings() const { return risk_settings_; }
    const std::vector<Instrument>& instruments() const { return instruments_; }
    
private:
    std::vector<Instrument> instruments_;
    nlohmann::json analysis_settings_;
    RiskSettings risk_settings_;
};

// Prop-firm risk rules. Every threshold is mandatory.
struct RiskLimits {
    int max_trades_per_day;
    int consecutive_loss_stop_count;
    double max_daily_drawdown_percent;
    double min_risk_reward_ratio;
    double max_spread;
    double min_probability;
    
    // "HH:MM" UTC, inclusive
    std::string london_start_utc;
    std::string london_end_utc;
    std::string new_york_start_utc;
    std::string new_york_end_utc;
    
    static RiskLimits load(const std::string& path);
    // Throws std::runtime_error naming the first missing key
    static RiskLimits from_json(const nlohmann::json& j);
};
