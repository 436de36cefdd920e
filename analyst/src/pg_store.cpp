#include "pg_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        // State of the market at analysis time, kept for every verdict
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS market_snapshots (
                id BIGSERIAL PRIMARY KEY,
                ts TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                instrument TEXT NOT NULL,
                session TEXT NOT NULL,
                direction TEXT,
                verdict TEXT,
                reason TEXT,
                htf_trend TEXT,
                htf_structure TEXT,
                key_level DOUBLE PRECISION,
                liquidity_event_type TEXT,
                has_large_wick BOOLEAN,
                consecutive_counter_candles INT,
                atr_value DOUBLE PRECISION,
                rsi_divergence BOOLEAN,
                vwap_distance DOUBLE PRECISION,
                volume_spike BOOLEAN,
                spread_value DOUBLE PRECISION,
                news_event_proximity_minutes DOUBLE PRECISION,
                zone TEXT,
                premium_position DOUBLE PRECISION,
                in_premium_zone BOOLEAN,
                bearish_ob_count INT,
                bullish_ob_count INT,
                fvg_count INT,
                has_bearish_mss BOOLEAN,
                has_bullish_mss BOOLEAN
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS trade_plans (
                id BIGSERIAL PRIMARY KEY,
                snapshot_id BIGINT NOT NULL REFERENCES market_snapshots(id),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                direction TEXT NOT NULL CHECK (direction IN ('SHORT','LONG')),
                entry_zone_start DOUBLE PRECISION,
                entry_zone_end DOUBLE PRECISION,
                stop_loss DOUBLE PRECISION,
                tp1 DOUBLE PRECISION,
                tp2 DOUBLE PRECISION,
                estimated_rr DOUBLE PRECISION,
                probability_score DOUBLE PRECISION,
                scorer TEXT,
                status TEXT NOT NULL DEFAULT 'PENDING'
                    CHECK (status IN ('PENDING','EXECUTED','CANCELLED','IGNORED'))
            )
        )");
        
        // Results of validated setups; input for the learning review
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS trade_outcomes (
                id BIGSERIAL PRIMARY KEY,
                plan_id BIGINT NOT NULL REFERENCES trade_plans(id),
                entry_price DOUBLE PRECISION,
                exit_price DOUBLE PRECISION,
                outcome TEXT NOT NULL CHECK (outcome IN ('WIN','LOSS','BREAK_EVEN')),
                realized_r_multiple DOUBLE PRECISION,
                pnl_percent DOUBLE PRECISION,
                comments TEXT,
                recorded_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS learning_logs (
                id BIGSERIAL PRIMARY KEY,
                review_date TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                sample_size INT,
                high_performing_conditions TEXT,
                loss_prone_conditions TEXT,
                report TEXT
            )
        )");
        
        txn.exec("CREATE INDEX IF NOT EXISTS idx_snapshot_session ON market_snapshots(session)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_snapshot_verdict ON market_snapshots(verdict)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_outcome_r ON trade_outcomes(realized_r_multiple)");
        
        txn.commit();
        spdlog::info("Database schema initialized");
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

int64_t PostgresStore::save_snapshot(const AnalysisResult& analysis) {
    const TradeSetup& setup = analysis.setup;
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "INSERT INTO market_snapshots ("
            "instrument, session, direction, verdict, reason, htf_trend, htf_structure, key_level, "
            "liquidity_event_type, has_large_wick, consecutive_counter_candles, atr_value, "
            "rsi_divergence, vwap_distance, volume_spike, spread_value, "
            "news_event_proximity_minutes, zone, premium_position, in_premium_zone, "
            "bearish_ob_count, bullish_ob_count, fvg_count, has_bearish_mss, has_bullish_mss"
            ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, "
            "$15, $16, $17, $18, $19, $20, $21, $22, $23, $24, $25) RETURNING id",
            setup.instrument, setup.session,
            setup.direction ? to_string(*setup.direction) : std::string(),
            to_string(analysis.verdict), analysis.reason,
            setup.htf_trend, setup.htf_structure, setup.key_level,
            setup.liquidity_event_type, setup.has_large_wick, setup.consecutive_counter_candles,
            setup.atr_value, setup.rsi_divergence, setup.vwap_distance, setup.volume_spike,
            setup.spread_value, setup.news_event_proximity_minutes, setup.zone,
            setup.premium_position, setup.in_premium_zone, setup.bearish_ob_count,
            setup.bullish_ob_count, setup.fvg_count, setup.has_bearish_mss, setup.has_bullish_mss
        );
        
        txn.commit();
        return result[0][0].as<int64_t>();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save snapshot for {}: {}", setup.instrument, e.what());
        throw;
    }
}

int64_t PostgresStore::save_trade_plan(int64_t snapshot_id, const TradePlan& plan) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "INSERT INTO trade_plans (snapshot_id, direction, entry_zone_start, entry_zone_end, "
            "stop_loss, tp1, tp2, estimated_rr, probability_score, scorer) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10) RETURNING id",
            snapshot_id, to_string(plan.direction), plan.entry_zone_start, plan.entry_zone_end,
            plan.stop_loss, plan.tp1, plan.tp2, plan.estimated_rr, plan.probability_score,
            plan.scorer
        );
        
        txn.commit();
        return result[0][0].as<int64_t>();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save trade plan: {}", e.what());
        throw;
    }
}

void PostgresStore::record_outcome(const TradeOutcome& outcome) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec_params(
            "INSERT INTO trade_outcomes (plan_id, entry_price, exit_price, outcome, "
            "realized_r_multiple, pnl_percent, comments) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7)",
            outcome.plan_id, outcome.entry_price, outcome.exit_price, outcome.outcome,
            outcome.realized_r_multiple, outcome.pnl_percent, outcome.comments
        );
        txn.exec_params(
            "UPDATE trade_plans SET status = 'EXECUTED' WHERE id = $1",
            outcome.plan_id
        );
        
        txn.commit();
        spdlog::info("Recorded {} for plan {}", outcome.outcome, outcome.plan_id);
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to record outcome: {}", e.what());
        throw;
    }
}

std::vector<TradeOutcome> PostgresStore::recent_outcomes(int limit) {
    std::vector<TradeOutcome> outcomes;
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "SELECT o.plan_id, s.session, COALESCE(s.liquidity_event_type, ''), o.outcome, "
            "o.entry_price, o.exit_price, o.realized_r_multiple, o.pnl_percent, "
            "COALESCE(o.comments, '') "
            "FROM trade_outcomes o "
            "JOIN trade_plans p ON p.id = o.plan_id "
            "JOIN market_snapshots s ON s.id = p.snapshot_id "
            "ORDER BY o.recorded_at DESC LIMIT $1",
            limit
        );
        
        for (const auto& row : result) {
            TradeOutcome o;
            o.plan_id = row[0].as<int64_t>();
            o.session = row[1].as<std::string>();
            o.liquidity_event_type = row[2].as<std::string>();
            o.outcome = row[3].as<std::string>();
            o.entry_price = row[4].as<double>(0.0);
            o.exit_price = row[5].as<double>(0.0);
            o.realized_r_multiple = row[6].as<double>(0.0);
            o.pnl_percent = row[7].as<double>(0.0);
            o.comments = row[8].as<std::string>();
            outcomes.push_back(o);
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to load recent outcomes: {}", e.what());
        throw;
    }
    
    return outcomes;
}

int PostgresStore::plans_since(std::time_t since) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "SELECT COUNT(*) FROM trade_plans WHERE created_at >= to_timestamp($1)",
            static_cast<int64_t>(since)
        );
        
        txn.commit();
        return result[0][0].as<int>();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to count trade plans: {}", e.what());
        throw;
    }
}

std::vector<TradeOutcome> PostgresStore::outcomes_since(std::time_t since) {
    std::vector<TradeOutcome> outcomes;
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "SELECT plan_id, outcome, COALESCE(pnl_percent, 0), COALESCE(realized_r_multiple, 0) "
            "FROM trade_outcomes WHERE recorded_at >= to_timestamp($1) "
            "ORDER BY recorded_at ASC, id ASC",
            static_cast<int64_t>(since)
        );
        
        for (const auto& row : result) {
            TradeOutcome o;
            o.plan_id = row[0].as<int64_t>();
            o.outcome = row[1].as<std::string>();
            o.pnl_percent = row[2].as<double>();
            o.realized_r_multiple = row[3].as<double>();
            outcomes.push_back(o);
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to load today's outcomes: {}", e.what());
        throw;
    }
    
    return outcomes;
}

std::map<std::string, int> PostgresStore::rejection_counts(int limit) {
    std::map<std::string, int> counts;
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        auto result = txn.exec_params(
            "SELECT reason, COUNT(*) FROM ("
            "SELECT COALESCE(reason, '') AS reason FROM market_snapshots "
            "WHERE verdict = 'NO TRADE' ORDER BY id DESC LIMIT $1"
            ") recent GROUP BY reason",
            limit
        );
        
        for (const auto& row : result) {
            counts[row[0].as<std::string>()] = row[1].as<int>();
        }
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to load rejection reasons: {}", e.what());
        throw;
    }
    
    return counts;
}

void PostgresStore::save_learning_log(const LearningReport& report) {
    auto join = [](const std::vector<std::string>& items) {
        std::string out;
        for (const auto& item : items) {
            if (!out.empty()) out += ", ";
            out += item;
        }
        return out;
    };
    
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec_params(
            "INSERT INTO learning_logs (sample_size, high_performing_conditions, "
            "loss_prone_conditions, report) VALUES ($1, $2, $3, $4)",
            report.sample_size, join(report.high_performing_conditions),
            join(report.loss_prone_conditions), report.text
        );
        
        txn.commit();
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to save learning log: {}", e.what());
        throw;
    }
}
