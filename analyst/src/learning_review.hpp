#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>

struct TradeOutcome {
    int64_t plan_id = 0;
    std::string session;
    std::string liquidity_event_type;
    std::string outcome;  // "WIN", "LOSS", "BREAK_EVEN"
    double entry_price = 0.0;
    double exit_price = 0.0;
    double realized_r_multiple = 0.0;
    double pnl_percent = 0.0;
    std::string comments;
};

struct GroupStats {
    int count = 0;
    int wins = 0;
    double r_sum = 0.0;
    
    double win_rate() const { return count ? static_cast<double>(wins) / count : 0.0; }
    double mean_r() const { return count ? r_sum / count : 0.0; }
};

struct LearningReport {
    int sample_size = 0;
    std::map<std::string, GroupStats> by_session;
    std::map<std::string, GroupStats> by_liquidity_event;
    std::vector<std::string> high_performing_conditions;
    std::vector<std::string> loss_prone_conditions;
    std::map<std::string, int> rejection_reasons;
    std::string text;
};

class LearningReview {
public:
    static constexpr const char* kSampleTooSmall = "NO STRUCTURAL CONCLUSIONS – SAMPLE TOO SMALL";
    
    static LearningReport generate(const std::vector<TradeOutcome>& outcomes);
    
    // Appends the most frequent NO TRADE reasons, most common first
    static void add_rejections(LearningReport& report, const std::map<std::string, int>& counts);
};
