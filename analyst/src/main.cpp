#include "config.hpp"
#include "analysis_engine.hpp"
#include "risk_validator.hpp"
#include "probability.hpp"
#include "market_data.hpp"
#include "news_calendar.hpp"
#include "pg_store.hpp"
#include "learning_review.hpp"
#include "alert_mailer.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <ctime>
#include <iostream>
#include <vector>

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("smc_analyst", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

namespace {

struct ValidSetup {
    TradePlan plan;
    TradeSetup setup;
};

int run_startup(const Config& config) {
    PostgresStore store(config.pg_dsn);
    store.init_schema();
    spdlog::info("System ready");
    return 0;
}

int run_review(const Config& config) {
    PostgresStore store(config.pg_dsn);
    auto outcomes = store.recent_outcomes(200);
    
    LearningReport report = LearningReview::generate(outcomes);
    LearningReview::add_rejections(report, store.rejection_counts(200));
    std::cout << report.text << std::endl;
    
    store.save_learning_log(report);
    return 0;
}

int run_outcome(const Config& config) {
    PostgresStore store(config.pg_dsn);
    store.record_outcome(config.outcome());
    return 0;
}

// Midnight UTC of the day containing `now`
std::time_t utc_day_start(std::time_t now) {
    return now - now % 86400;
}

int run_live(const Config& config) {
    TradingConfig trading = TradingConfig::load(config.trading_config_path);
    RiskValidator validator(RiskLimits::load(config.risk_config_path));
    
    std::string session = config.session;
    if (session == "AUTO") {
        Session detected = validator.session_for(std::time(nullptr));
        if (detected == Session::None) {
            spdlog::warn("Market Closed (outside London/New York hours), analysis skipped");
            return 0;
        }
        session = to_string(detected);
        spdlog::info("Session auto-detected: {}", session);
    }
    
    PostgresStore store(config.pg_dsn);
    std::time_t today = utc_day_start(std::time(nullptr));
    RiskState state = RiskValidator::replay_day(store.plans_since(today), store.outcomes_since(today));
    spdlog::info("Daily state: {} trade(s), {} consecutive loss(es), {:.2f}% drawdown",
                 state.daily_trades, state.consecutive_losses, state.daily_drawdown_pct);
    
    RiskDecision gate = validator.can_trade(state);
    if (!gate.allowed) {
        spdlog::error("RISK STOP: {}", gate.reason);
        return 0;
    }
    
    std::vector<Instrument> instruments = trading.enabled_instruments();
    if (!config.symbol.empty()) {
        auto match = trading.find_instrument(config.symbol);
        if (!match || !match->enabled) {
            spdlog::error("Symbol '{}' not found in config", config.symbol);
            return 1;
        }
        instruments = {*match};
    }
    
    auto scorer = make_scorer(config.model_path);
    MarketDataClient market_data(config.market_data_url, config.http_timeout_ms);
    
    NewsCalendar calendar = NewsCalendar::fetch(config.news_url, config.http_timeout_ms);
    auto nearest = calendar.minutes_to_nearest(std::time(nullptr));
    
    spdlog::info("Starting analysis of {} instrument(s) for {} session",
                 instruments.size(), session);
    
    std::vector<ValidSetup> valid_setups;
    
    for (const auto& instrument : instruments) {
        spdlog::info("Analyzing {} ({})", instrument.display_name, instrument.asset_class);
        
        BarSeries bars;
        try {
            bars = market_data.fetch_bars(instrument.yahoo_symbol, "5d", "15m");
        } catch (const std::exception& e) {
            spdlog::error("Data fetch error for {}: {}", instrument.display_name, e.what());
            continue;
        }
        
        MarketAnalyst analyst(trading.settings_for(instrument.asset_class), validator, scorer);
        
        AnalysisContext ctx;
        ctx.instrument = instrument.display_name;
        ctx.session = session;
        ctx.spread = instrument.typical_spread;
        ctx.news.minutes = nearest.first;
        ctx.news.event_name = nearest.second;
        ctx.risk_state = state;
        
        AnalysisResult result = analyst.analyze(bars, ctx);
        
        int64_t snapshot_id = store.save_snapshot(result);
        
        if (result.is_valid()) {
            int64_t plan_id = store.save_trade_plan(snapshot_id, *result.plan);
            spdlog::info("VALID {} SETUP: {} (plan {})", to_string(result.plan->direction),
                         instrument.display_name, plan_id);
            
            state = RiskValidator::record_trade(state);
            valid_setups.push_back({*result.plan, result.setup});
        } else {
            spdlog::info("{} {}: {}", instrument.display_name, to_string(result.verdict),
                         result.reason);
        }
    }
    
    if (valid_setups.empty()) {
        spdlog::info("No valid setups found across {} instrument(s)", instruments.size());
        return 0;
    }
    
    AlertMailer mailer(MailSettings::from_config(config, trading.risk_settings()));
    int max_alerts = trading.risk_settings().max_alerts_per_run;
    int sent = 0;
    
    for (const auto& valid : valid_setups) {
        if (sent >= max_alerts) {
            spdlog::warn("Alert cap of {} reached, {} setup(s) not emailed",
                         max_alerts, valid_setups.size() - sent);
            break;
        }
        if (mailer.send(valid.plan, valid.setup)) {
            sent++;
        }
    }
    
    return 0;
}

} // namespace

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();
        
        spdlog::info("Starting {} in {} mode", config.service_name, config.mode);
        
        curl_global_init(CURL_GLOBAL_DEFAULT);
        
        int rc;
        if (config.mode == "startup") {
            rc = run_startup(config);
        } else if (config.mode == "review") {
            rc = run_review(config);
        } else if (config.mode == "outcome") {
            rc = run_outcome(config);
        } else {
            rc = run_live(config);
        }
        
        curl_global_cleanup();
        return rc;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
