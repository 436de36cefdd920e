#pragma once

#include "smc_detector.hpp"
#include "trade_types.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

// Setup-level inputs to the probability scorers
struct SetupFeatures {
    Direction direction = Direction::Short;
    Trend htf_trend = Trend::Ranging;
    bool liquidity_event = false;
    bool rsi_divergence = false;
    bool large_wick = false;
    double atr_value = 0.0;
    double vwap_distance = 0.0;
};

// Named numeric feature vector shared by every scorer. Zone depth and
// structure counts are measured in the trade direction.
std::map<std::string, double> extract_features(const SetupFeatures& setup,
                                               const SmcAnalysis& smc);

class ProbabilityScorer {
public:
    virtual ~ProbabilityScorer() = default;
    
    // Success probability in [0, 100]
    virtual double score(const SetupFeatures& setup, const SmcAnalysis& smc) const = 0;
    virtual std::string name() const = 0;
};

// Additive points: trend +30, sweep +25, divergence +10, wick +10,
// deep zone +15, matching OB +10, matching MSS +10, capped at 100
class RuleBasedScorer : public ProbabilityScorer {
public:
    double score(const SetupFeatures& setup, const SmcAnalysis& smc) const override;
    std::string name() const override { return "rule_based"; }
};

struct ModelTerm {
    std::string feature;
    double mean;
    double scale;
    double weight;
};

// Standardized logistic model trained offline and exported as JSON:
//   {"bias": b, "terms": [{"feature", "mean", "scale", "weight"}, ...]}
// Non-finite predictions fall back to the rule-based score.
class LogisticModelScorer : public ProbabilityScorer {
public:
    LogisticModelScorer(double bias, std::vector<ModelTerm> terms);
    
    // Throws std::runtime_error on unreadable or malformed model files
    static std::unique_ptr<LogisticModelScorer> load(const std::string& path);
    static std::unique_ptr<LogisticModelScorer> from_json(const nlohmann::json& model);
    
    double score(const SetupFeatures& setup, const SmcAnalysis& smc) const override;
    std::string name() const override { return "logistic_model"; }
    
private:
    double bias_;
    std::vector<ModelTerm> terms_;
    RuleBasedScorer fallback_;
};

// Model scorer when `model_path` loads, rule-based otherwise
std::shared_ptr<const ProbabilityScorer> make_scorer(const std::string& model_path);
