#include "learning_review.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <utility>

LearningReport LearningReview::generate(const std::vector<TradeOutcome>& outcomes) {
    LearningReport report;
    report.sample_size = static_cast<int>(outcomes.size());
    
    if (outcomes.empty()) {
        report.text = kSampleTooSmall;
        return report;
    }
    
    for (const auto& o : outcomes) {
        const bool win = o.outcome == "WIN";
        
        auto& session = report.by_session[o.session.empty() ? "Unknown" : o.session];
        session.count++;
        session.wins += win ? 1 : 0;
        session.r_sum += o.realized_r_multiple;
        
        auto& liq = report.by_liquidity_event[o.liquidity_event_type.empty() ? "None" : o.liquidity_event_type];
        liq.count++;
        liq.wins += win ? 1 : 0;
        liq.r_sum += o.realized_r_multiple;
    }
    
    for (const auto& [name, stats] : report.by_liquidity_event) {
        if (stats.mean_r() > 0) report.high_performing_conditions.push_back(name);
        if (stats.mean_r() < 0) report.loss_prone_conditions.push_back(name);
    }
    
    std::string text = fmt::format(
        "SELF-LEARNING REVIEW\n"
        "================================\n"
        "Sample Size: {} trades\n\n"
        "REGIME ANALYSIS (win rate by session)\n"
        "---------------\n", report.sample_size);
    
    for (const auto& [name, stats] : report.by_session) {
        text += fmt::format("{:<12} {:>4} trades  {:>5.1f}% win\n",
                            name, stats.count, stats.win_rate() * 100.0);
    }
    
    text += "\nFILTER STRENGTH (avg R multiple)\n"
            "---------------------------------\n";
    for (const auto& [name, stats] : report.by_liquidity_event) {
        text += fmt::format("{:<20} {:>4} trades  {:>+6.2f}R\n",
                            name, stats.count, stats.mean_r());
    }
    
    text += "\nRECOMMENDATIONS\n---------------\n";
    if (report.loss_prone_conditions.empty()) {
        text += "No condition with negative expectancy\n";
    } else {
        for (const auto& name : report.loss_prone_conditions) {
            text += fmt::format("Avoid: {} (negative expectancy)\n", name);
        }
    }
    
    report.text = text;
    return report;
}

void LearningReview::add_rejections(LearningReport& report, const std::map<std::string, int>& counts) {
    report.rejection_reasons = counts;
    if (counts.empty()) return;
    
    std::vector<std::pair<std::string, int>> ranked(counts.begin(), counts.end());
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    
    std::string text = "\nREJECTION REASONS\n-----------------\n";
    for (const auto& [reason, count] : ranked) {
        text += fmt::format("{:>4}  {}\n", count, reason.empty() ? "Unspecified" : reason);
    }
    report.text += text;
}
