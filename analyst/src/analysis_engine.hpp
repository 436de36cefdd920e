#pragma once

#include "bar_series.hpp"
#include "config.hpp"
#include "liquidity.hpp"
#include "probability.hpp"
#include "risk_validator.hpp"
#include "smc_detector.hpp"
#include "trade_types.hpp"
#include "trend.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct NewsProximity {
    double minutes = 9999.0;  // absolute distance to the nearest high-impact event
    std::string event_name = "None";
};

// Per-call inputs supplied by the runner
struct AnalysisContext {
    std::string instrument;
    std::string session = "Unknown";
    double spread = 0.1;
    NewsProximity news;
    RiskState risk_state;
};

enum class Verdict {
    NoTrade,
    ValidSetup
};

std::string to_string(Verdict verdict);

struct AnalysisResult {
    Verdict verdict = Verdict::NoTrade;
    std::string reason;
    TradeSetup setup;
    std::optional<TradePlan> plan;
    std::optional<SmcAnalysis> smc;
    
    bool is_valid() const { return verdict == Verdict::ValidSetup; }
};

void to_json(nlohmann::json& j, const AnalysisResult& result);

// Decision pipeline: news gate, trend, then per-direction gate chain
// (zone, opposing MSS, sweep, confirmation, plan, probability, risk).
class MarketAnalyst {
public:
    static constexpr double kNewsBlackoutMinutes = 15.0;
    static constexpr double kStopBufferFraction = 0.1;
    static constexpr double kRewardMultiple = 2.0;
    static constexpr double kSecondTargetMultiple = 3.0;
    
    MarketAnalyst(AssetSettings settings,
                  RiskValidator validator,
                  std::shared_ptr<const ProbabilityScorer> scorer);
    
    // In BOTH mode the short branch runs first; the first valid branch wins.
    AnalysisResult analyze(const BarSeries& bars, const AnalysisContext& ctx) const;
    
    // Entry at the close, stop beyond the bar extreme by 10% of its range,
    // tp1 at 2R and tp2 at 3R. R:R is 0 when the stop distance is not positive.
    static TradePlan build_plan(const Bar& current, Direction direction, double entry_zone_width);
    
    const AssetSettings& settings() const { return settings_; }
    
private:
    AssetSettings settings_;
    RiskValidator validator_;
    std::shared_ptr<const ProbabilityScorer> scorer_;
    LiquidityEvaluator liquidity_;
    
    AnalysisResult evaluate_branch(Direction direction,
                                   const BarSeries& bars,
                                   const SmcAnalysis& smc,
                                   const TrendAssessment& trend,
                                   const AnalysisContext& ctx) const;
    
    static TradeSetup base_snapshot(const BarSeries& bars,
                                    const SmcAnalysis& smc,
                                    const TrendAssessment& trend,
                                    const AnalysisContext& ctx);
};
