#include "probability.hpp"
#include "trend.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

std::map<std::string, double> extract_features(const SetupFeatures& setup,
                                               const SmcAnalysis& smc) {
    const bool is_short = setup.direction == Direction::Short;
    const auto& zone = smc.premium_discount;
    auto finite_or_zero = [](double v) { return std::isfinite(v) ? v : 0.0; };
    
    // Structure is counted relative to the trade: "matching" means it supports the direction
    const auto& matching_blocks = is_short ? smc.bearish_order_blocks : smc.bullish_order_blocks;
    const auto& opposing_blocks = is_short ? smc.bullish_order_blocks : smc.bearish_order_blocks;
    const bool matching_mss = is_short ? smc.has_bearish_mss() : smc.has_bullish_mss();
    const bool opposing_mss = is_short ? smc.has_bullish_mss() : smc.has_bearish_mss();
    const bool in_trade_zone = is_short ? zone.in_premium() : zone.zone == "Discount";
    
    return {
        {"is_short", is_short ? 1.0 : 0.0},
        {"trend_aligned", TrendClassifier::aligned(setup.htf_trend, setup.direction) ? 1.0 : 0.0},
        {"trend_ranging", setup.htf_trend == Trend::Ranging ? 1.0 : 0.0},
        {"has_liquidity_event", setup.liquidity_event ? 1.0 : 0.0},
        {"rsi_divergence", setup.rsi_divergence ? 1.0 : 0.0},
        {"large_wick", setup.large_wick ? 1.0 : 0.0},
        {"atr_value", finite_or_zero(setup.atr_value)},
        {"vwap_distance", finite_or_zero(setup.vwap_distance)},
        {"zone_depth", is_short ? zone.position : 1.0 - zone.position},
        {"in_trade_zone", in_trade_zone ? 1.0 : 0.0},
        {"matching_ob_count", static_cast<double>(matching_blocks.size())},
        {"opposing_ob_count", static_cast<double>(opposing_blocks.size())},
        {"fvg_count", static_cast<double>(smc.fair_value_gaps.size())},
        {"matching_mss", matching_mss ? 1.0 : 0.0},
        {"opposing_mss", opposing_mss ? 1.0 : 0.0},
    };
}

double RuleBasedScorer::score(const SetupFeatures& setup, const SmcAnalysis& smc) const {
    const bool is_short = setup.direction == Direction::Short;
    double prob = 0.0;
    
    if (TrendClassifier::aligned(setup.htf_trend, setup.direction)) prob += 30;
    if (setup.liquidity_event) prob += 25;
    if (setup.rsi_divergence) prob += 10;
    if (setup.large_wick) prob += 10;
    
    const double position = smc.premium_discount.position;
    if (is_short ? position > 0.7 : position < 0.3) prob += 15;
    
    const auto& blocks = is_short ? smc.bearish_order_blocks : smc.bullish_order_blocks;
    if (!blocks.empty()) prob += 10;
    
    if (is_short ? smc.has_bearish_mss() : smc.has_bullish_mss()) prob += 10;
    
    return std::min(prob, 100.0);
}

LogisticModelScorer::LogisticModelScorer(double bias, std::vector<ModelTerm> terms)
    : bias_(bias)
    , terms_(std::move(terms))
{}

std::unique_ptr<LogisticModelScorer> LogisticModelScorer::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Model file not found: " + path);
    }
    
    nlohmann::json model;
    try {
        in >> model;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed model file " + path + ": " + e.what());
    }
    return from_json(model);
}

std::unique_ptr<LogisticModelScorer> LogisticModelScorer::from_json(const nlohmann::json& model) {
    if (!model.contains("bias") || !model.contains("terms") || !model["terms"].is_array()) {
        throw std::runtime_error("Model requires 'bias' and 'terms'");
    }
    
    // Reject feature names the extractor does not produce
    auto known = extract_features(SetupFeatures{}, SmcAnalysis{});
    
    std::vector<ModelTerm> terms;
    try {
        for (const auto& t : model["terms"]) {
            ModelTerm term{t.at("feature").get<std::string>(),
                           t.value("mean", 0.0),
                           t.value("scale", 1.0),
                           t.at("weight").get<double>()};
            if (!known.count(term.feature)) {
                throw std::runtime_error("Unknown model feature: " + term.feature);
            }
            if (term.scale == 0.0) {
                throw std::runtime_error("Zero scale for feature: " + term.feature);
            }
            terms.push_back(term);
        }
        return std::make_unique<LogisticModelScorer>(model["bias"].get<double>(), std::move(terms));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed model term: ") + e.what());
    }
}

double LogisticModelScorer::score(const SetupFeatures& setup, const SmcAnalysis& smc) const {
    auto features = extract_features(setup, smc);
    
    double z = bias_;
    for (const auto& term : terms_) {
        z += term.weight * (features[term.feature] - term.mean) / term.scale;
    }
    
    double prob = 100.0 / (1.0 + std::exp(-z));
    if (!std::isfinite(prob)) {
        spdlog::warn("Model produced non-finite probability, using rule-based score");
        return fallback_.score(setup, smc);
    }
    return std::clamp(prob, 0.0, 100.0);
}

std::shared_ptr<const ProbabilityScorer> make_scorer(const std::string& model_path) {
    if (!model_path.empty()) {
        try {
            auto model = LogisticModelScorer::load(model_path);
            spdlog::info("Probability model loaded from {}", model_path);
            return std::shared_ptr<const ProbabilityScorer>(std::move(model));
        } catch (const std::exception& e) {
            spdlog::warn("{}. Running in rule-based mode", e.what());
        }
    }
    return std::make_shared<RuleBasedScorer>();
}
