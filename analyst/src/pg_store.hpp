#pragma once

#include "analysis_engine.hpp"
#include "learning_review.hpp"
#include "trade_types.hpp"
#include <string>
#include <vector>
#include <map>
#include <ctime>
#include <cstdint>
#include <pqxx/pqxx>

// Postgres persistence for snapshots, plans, outcomes and review logs
class PostgresStore {
public:
    explicit PostgresStore(const std::string& dsn);
    
    void init_schema();
    
    // Every verdict is stored, with its reason, so rejections stay auditable
    int64_t save_snapshot(const AnalysisResult& result);
    int64_t save_trade_plan(int64_t snapshot_id, const TradePlan& plan);
    void record_outcome(const TradeOutcome& outcome);
    
    // Newest first, joined with the originating snapshot
    std::vector<TradeOutcome> recent_outcomes(int limit);
    
    // Plans created and outcomes recorded at or after `since` (UTC epoch),
    // outcomes oldest first
    int plans_since(std::time_t since);
    std::vector<TradeOutcome> outcomes_since(std::time_t since);
    
    // NO TRADE reasons among the `limit` newest rejected snapshots
    std::map<std::string, int> rejection_counts(int limit);
    
    void save_learning_log(const LearningReport& report);
    
private:
    std::string dsn_;
    
    pqxx::connection make_connection();
};
