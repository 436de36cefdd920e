#include "config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;
    
    cfg.mode = get_env("ANALYST_MODE", "live");
    cfg.session = get_env("ANALYST_SESSION", "AUTO");
    cfg.symbol = get_env("ANALYST_SYMBOL");
    
    cfg.trading_config_path = get_env("TRADING_CONFIG", "config/trading_config.json");
    cfg.risk_config_path = get_env("RISK_CONFIG", "config/prop_firm_config.json");
    cfg.model_path = get_env("MODEL_PATH", "");
    
    cfg.pg_dsn = get_env("PG_DSN");
    
    cfg.market_data_url = get_env("MARKET_DATA_URL", "https://query1.finance.yahoo.com");
    cfg.news_url = get_env("NEWS_URL", "https://nfs.faireconomy.media/ff_calendar_thisweek.json");
    cfg.http_timeout_ms = get_env_int("HTTP_TIMEOUT_MS", 10000);
    
    cfg.email_user = get_env("EMAIL_USER");
    cfg.email_password = get_env("EMAIL_PASSWORD");
    cfg.email_recipient = get_env("EMAIL_RECIPIENT", cfg.email_user);
    cfg.smtp_url = get_env("SMTP_URL", "smtp://smtp.gmail.com:587");
    
    cfg.outcome_plan_id = get_env_int("OUTCOME_PLAN_ID", 0);
    cfg.outcome_result = get_env("OUTCOME_RESULT");
    cfg.outcome_entry_price = get_env_double("OUTCOME_ENTRY_PRICE", 0.0);
    cfg.outcome_exit_price = get_env_double("OUTCOME_EXIT_PRICE", 0.0);
    cfg.outcome_r_multiple = get_env_double("OUTCOME_R_MULTIPLE", 0.0);
    cfg.outcome_pnl_percent = get_env_double("OUTCOME_PNL_PERCENT", 0.0);
    cfg.outcome_comments = get_env("OUTCOME_COMMENTS");
    
    cfg.service_name = get_env("SERVICE_NAME", "smc_analyst");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (mode != "startup" && mode != "live" && mode != "review" && mode != "outcome") {
        throw std::runtime_error("ANALYST_MODE must be startup, live, review or outcome");
    }
    if (session != "AUTO" && session != "LONDON" && session != "NEW_YORK") {
        throw std::runtime_error("ANALYST_SESSION must be LONDON, NEW_YORK or AUTO");
    }
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (mode == "outcome") {
        outcome();
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Mode: {} (session {})", mode, session);
    spdlog::info("  Trading config: {}", trading_config_path);
    spdlog::info("  Risk config: {}", risk_config_path);
    spdlog::info("  Email alerts: {}", email_user.empty() ? "disabled" : "enabled");
}

TradeOutcome Config::outcome() const {
    if (outcome_plan_id <= 0) {
        throw std::runtime_error("OUTCOME_PLAN_ID must name a trade plan");
    }
    if (outcome_result != "WIN" && outcome_result != "LOSS" && outcome_result != "BREAK_EVEN") {
        throw std::runtime_error("OUTCOME_RESULT must be WIN, LOSS or BREAK_EVEN");
    }
    
    TradeOutcome o;
    o.plan_id = outcome_plan_id;
    o.outcome = outcome_result;
    o.entry_price = outcome_entry_price;
    o.exit_price = outcome_exit_price;
    o.realized_r_multiple = outcome_r_multiple;
    o.pnl_percent = outcome_pnl_percent;
    o.comments = outcome_comments;
    return o;
}

namespace {

nlohmann::json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string(what) + " not found: " + path);
    }
    try {
        nlohmann::json j;
        in >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string(what) + " is not valid JSON: " + e.what());
    }
}

const nlohmann::json& require(const nlohmann::json& j, const char* section, const char* key) {
    if (!j.contains(section) || !j[section].contains(key)) {
        throw std::runtime_error(std::string("Missing risk config key: ") + section + "." + key);
    }
    return j[section][key];
}

} // namespace

AssetSettings AssetSettings::defaults_for(const std::string& asset_class) {
    AssetSettings s;
    if (asset_class == "crypto") {
        s.short_zones = {"Premium", "Premium (Weak)", "Equilibrium"};
        s.long_zones = {"Discount", "Equilibrium"};
    } else {
        s.short_zones = {"Premium", "Premium (Weak)"};
        s.long_zones = {"Discount"};
    }
    return s;
}

AssetSettings AssetSettings::from_json(const nlohmann::json& j, const std::string& asset_class) {
    AssetSettings s = defaults_for(asset_class);
    if (!j.is_object()) return s;
    
    try {
        if (j.contains("short_zones")) s.short_zones = j["short_zones"].get<std::vector<std::string>>();
        if (j.contains("long_zones")) s.long_zones = j["long_zones"].get<std::vector<std::string>>();
        if (j.contains("direction")) s.direction = parse_direction_mode(j["direction"].get<std::string>());
        s.exhaustion_multiplier = j.value("exhaustion_multiplier", s.exhaustion_multiplier);
        s.swing_lookback = j.value("swing_lookback", s.swing_lookback);
        s.sweep_lookback = j.value("sweep_lookback", s.sweep_lookback);
        s.entry_zone_width = j.value("entry_zone_width", s.entry_zone_width);
        s.reject_counter_trend = j.value("reject_counter_trend", s.reject_counter_trend);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid analysis_settings." + asset_class + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid analysis_settings." + asset_class + ": " + e.what());
    }
    
    return s;
}

const std::vector<std::string>& AssetSettings::zones_for(Direction direction) const {
    return direction == Direction::Short ? short_zones : long_zones;
}

TradingConfig TradingConfig::load(const std::string& path) {
    return from_json(read_json_file(path, "Trading config"));
}

TradingConfig TradingConfig::from_json(const nlohmann::json& j) {
    if (!j.contains("active_instruments") || !j["active_instruments"].is_array()) {
        throw std::runtime_error("Config must contain 'active_instruments'");
    }
    if (j["active_instruments"].empty()) {
        throw std::runtime_error("At least one instrument must be configured");
    }
    
    TradingConfig cfg;
    try {
        for (const auto& item : j["active_instruments"]) {
            Instrument inst;
            inst.display_name = item.at("display_name").get<std::string>();
            inst.yahoo_symbol = item.at("yahoo_symbol").get<std::string>();
            inst.asset_class = item.value("asset_class", "forex");
            inst.enabled = item.value("enabled", false);
            inst.typical_spread = item.value("typical_spread", inst.typical_spread);
            cfg.instruments_.push_back(inst);
        }
        
        cfg.analysis_settings_ = j.value("analysis_settings", nlohmann::json::object());
        
        if (j.contains("risk_settings")) {
            const auto& r = j["risk_settings"];
            cfg.risk_settings_.risk_per_instrument_percent =
                r.value("risk_per_instrument_percent", cfg.risk_settings_.risk_per_instrument_percent);
            cfg.risk_settings_.account_balance =
                r.value("account_balance", cfg.risk_settings_.account_balance);
            cfg.risk_settings_.max_alerts_per_run =
                r.value("max_alerts_per_run", cfg.risk_settings_.max_alerts_per_run);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid trading config: ") + e.what());
    }
    
    return cfg;
}

std::vector<Instrument> TradingConfig::enabled_instruments() const {
    std::vector<Instrument> out;
    for (const auto& inst : instruments_) {
        if (inst.enabled) out.push_back(inst);
    }
    return out;
}

std::optional<Instrument> TradingConfig::find_instrument(const std::string& display_name) const {
    for (const auto& inst : instruments_) {
        if (inst.display_name == display_name) return inst;
    }
    return std::nullopt;
}

AssetSettings TradingConfig::settings_for(const std::string& asset_class) const {
    if (analysis_settings_.contains(asset_class)) {
        return AssetSettings::from_json(analysis_settings_[asset_class], asset_class);
    }
    return AssetSettings::defaults_for(asset_class);
}

RiskLimits RiskLimits::load(const std::string& path) {
    return from_json(read_json_file(path, "Risk config"));
}

RiskLimits RiskLimits::from_json(const nlohmann::json& j) {
    RiskLimits limits;
    try {
        limits.max_trades_per_day = require(j, "risk_rules_locked", "max_trades_per_day").get<int>();
        limits.consecutive_loss_stop_count =
            require(j, "risk_rules_locked", "consecutive_loss_stop_count").get<int>();
        limits.max_daily_drawdown_percent =
            require(j, "risk_rules_locked", "max_daily_drawdown_percent").get<double>();
        limits.min_risk_reward_ratio =
            require(j, "risk_rules_locked", "min_risk_reward_ratio").get<double>();
        
        limits.max_spread = require(j, "filters", "max_spread_pips").get<double>();
        limits.min_probability = require(j, "filters", "min_probability_threshold").get<double>();
        
        limits.london_start_utc = require(j, "trading_hours", "london_start_utc").get<std::string>();
        limits.london_end_utc = require(j, "trading_hours", "london_end_utc").get<std::string>();
        limits.new_york_start_utc = require(j, "trading_hours", "new_york_start_utc").get<std::string>();
        limits.new_york_end_utc = require(j, "trading_hours", "new_york_end_utc").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid risk config: ") + e.what());
    }
    return limits;
}
