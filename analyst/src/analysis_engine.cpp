#include "analysis_engine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace {

int count_counter_candles(const BarSeries& bars, Direction direction) {
    // Run of candles against the trade, ending at the bar before the current one
    int count = 0;
    for (size_t i = bars.size() - 1; i-- > 0;) {
        bool against = direction == Direction::Short ? bars[i].is_bullish()
                                                     : bars[i].is_bearish();
        if (!against) break;
        count++;
    }
    return count;
}

bool is_volume_spike(const BarSeries& bars) {
    constexpr size_t kWindow = 20;
    const size_t last = bars.size() - 1;
    const size_t start = last > kWindow ? last - kWindow : 0;
    if (start >= last) return false;
    
    double sum = 0.0;
    for (size_t i = start; i < last; i++) sum += bars[i].volume;
    double avg = sum / static_cast<double>(last - start);
    
    return avg > 0.0 && bars.current().volume > 2.0 * avg;
}

AnalysisResult no_trade(std::string reason, TradeSetup setup, std::optional<SmcAnalysis> smc) {
    AnalysisResult result;
    result.verdict = Verdict::NoTrade;
    result.reason = std::move(reason);
    result.setup = std::move(setup);
    result.smc = std::move(smc);
    return result;
}

} // namespace

std::string to_string(Verdict verdict) {
    return verdict == Verdict::ValidSetup ? "VALID SETUP" : "NO TRADE";
}

void to_json(nlohmann::json& j, const AnalysisResult& result) {
    j = {
        {"verdict", to_string(result.verdict)},
        {"reason", result.reason},
        {"data", result.setup},
        {"plan", nullptr},
        {"smc", nullptr}
    };
    if (result.plan) j["plan"] = *result.plan;
    if (result.smc) j["smc"] = *result.smc;
}

MarketAnalyst::MarketAnalyst(AssetSettings settings,
                             RiskValidator validator,
                             std::shared_ptr<const ProbabilityScorer> scorer)
    : settings_(std::move(settings))
    , validator_(std::move(validator))
    , scorer_(scorer ? std::move(scorer) : std::make_shared<RuleBasedScorer>())
    , liquidity_(settings_.exhaustion_multiplier, settings_.sweep_lookback)
{}

AnalysisResult MarketAnalyst::analyze(const BarSeries& bars, const AnalysisContext& ctx) const {
    TradeSetup partial;
    partial.instrument = ctx.instrument;
    partial.session = ctx.session;
    partial.news_event_proximity_minutes = ctx.news.minutes;
    partial.spread_value = ctx.spread;
    
    // News gate runs before any structure is looked at
    if (ctx.news.minutes <= kNewsBlackoutMinutes) {
        auto reason = fmt::format("High Impact News: {} in {:.0f} min",
                                  ctx.news.event_name, ctx.news.minutes);
        spdlog::info("[{}] NO TRADE: {}", ctx.instrument, reason);
        return no_trade(reason, partial, std::nullopt);
    }
    
    if (bars.size() < 2) {
        auto reason = fmt::format("Insufficient data ({} bars)", bars.size());
        spdlog::warn("[{}] NO TRADE: {}", ctx.instrument, reason);
        return no_trade(reason, partial, std::nullopt);
    }
    
    SmcDetector detector(bars, settings_.swing_lookback);
    SmcAnalysis smc = detector.analyze_all();
    TrendAssessment trend = TrendClassifier::classify(bars);
    
    spdlog::debug("[{}] trend={} zone={} ({:.3f})", ctx.instrument, to_string(trend.trend),
                  smc.premium_discount.zone, smc.premium_discount.position);
    
    if (settings_.direction == DirectionMode::Short) {
        return evaluate_branch(Direction::Short, bars, smc, trend, ctx);
    }
    if (settings_.direction == DirectionMode::Long) {
        return evaluate_branch(Direction::Long, bars, smc, trend, ctx);
    }
    
    AnalysisResult short_result = evaluate_branch(Direction::Short, bars, smc, trend, ctx);
    if (short_result.is_valid()) return short_result;
    
    AnalysisResult long_result = evaluate_branch(Direction::Long, bars, smc, trend, ctx);
    if (long_result.is_valid()) return long_result;
    
    long_result.reason = fmt::format("SHORT: {} | LONG: {}", short_result.reason, long_result.reason);
    return long_result;
}

TradeSetup MarketAnalyst::base_snapshot(const BarSeries& bars,
                                        const SmcAnalysis& smc,
                                        const TrendAssessment& trend,
                                        const AnalysisContext& ctx) {
    const Bar& current = bars.current();
    
    TradeSetup setup;
    setup.instrument = ctx.instrument;
    setup.session = ctx.session;
    setup.htf_trend = to_string(trend.trend);
    setup.atr_value = current.atr;
    setup.vwap_distance = std::abs(current.close - current.vwap);
    setup.volume_spike = is_volume_spike(bars);
    setup.spread_value = ctx.spread;
    setup.news_event_proximity_minutes = ctx.news.minutes;
    
    setup.zone = smc.premium_discount.zone;
    setup.premium_position = smc.premium_discount.position;
    setup.in_premium_zone = smc.premium_discount.in_premium();
    setup.bearish_ob_count = static_cast<int>(smc.bearish_order_blocks.size());
    setup.bullish_ob_count = static_cast<int>(smc.bullish_order_blocks.size());
    setup.fvg_count = static_cast<int>(smc.fair_value_gaps.size());
    setup.has_bearish_mss = smc.has_bearish_mss();
    setup.has_bullish_mss = smc.has_bullish_mss();
    
    return setup;
}

AnalysisResult MarketAnalyst::evaluate_branch(Direction direction,
                                              const BarSeries& bars,
                                              const SmcAnalysis& smc,
                                              const TrendAssessment& trend,
                                              const AnalysisContext& ctx) const {
    const bool is_short = direction == Direction::Short;
    const std::string side = to_string(direction);
    
    TradeSetup setup = base_snapshot(bars, smc, trend, ctx);
    setup.direction = direction;
    setup.htf_structure = is_short ? SwingLocator::describe_highs(smc.swings)
                                   : SwingLocator::describe_lows(smc.swings);
    setup.consecutive_counter_candles = count_counter_candles(bars, direction);
    
    auto reject = [&](const std::string& reason) {
        spdlog::debug("[{}] {} rejected: {}", ctx.instrument, side, reason);
        return no_trade(reason, setup, smc);
    };
    
    // 1. Zone membership
    const auto& zone = smc.premium_discount.zone;
    const auto& accepted = settings_.zones_for(direction);
    if (std::find(accepted.begin(), accepted.end(), zone) == accepted.end()) {
        return reject(fmt::format("Not in {} Zone (Current: {})",
                                  is_short ? "Premium" : "Discount", zone));
    }
    
    // 2. Opposing structure shift
    if (is_short && smc.has_bullish_mss()) {
        return reject("Bullish Market Structure Shift detected");
    }
    if (!is_short && smc.has_bearish_mss()) {
        return reject("Bearish Market Structure Shift detected");
    }
    
    if (settings_.reject_counter_trend && TrendClassifier::opposes(trend.trend, direction)) {
        return reject(is_short ? "Strong Bullish Momentum" : "Strong Bearish Momentum");
    }
    
    // 3. Liquidity sweep
    LiquidityCheck liq = liquidity_.evaluate(bars, direction);
    setup.key_level = liq.swept_level;
    setup.liquidity_event_type = liq.event_type;
    setup.has_large_wick = liq.exhaustion;
    setup.rsi_divergence = liq.divergence;
    
    if (!liq.swept) {
        return reject("No Liquidity Sweep");
    }
    
    // 4. Confirmation
    if (!liq.confirmed()) {
        return reject("No Confirmation (RSI/Wick)");
    }
    
    // 5. Provisional plan
    TradePlan plan = build_plan(bars.current(), direction, settings_.entry_zone_width);
    
    // 6. Probability
    SetupFeatures features;
    features.direction = direction;
    features.htf_trend = trend.trend;
    features.liquidity_event = liq.swept;
    features.rsi_divergence = liq.divergence;
    features.large_wick = liq.exhaustion;
    features.atr_value = setup.atr_value;
    features.vwap_distance = setup.vwap_distance;
    
    plan.probability_score = scorer_->score(features, smc);
    plan.scorer = scorer_->name();
    
    // 7. Risk
    RiskDecision gate = validator_.can_trade(ctx.risk_state);
    if (!gate.allowed) {
        return reject(gate.reason);
    }
    RiskDecision check = validator_.validate_setup(plan.estimated_rr, ctx.spread,
                                                   plan.probability_score);
    if (!check.allowed) {
        return reject(check.reason);
    }
    
    AnalysisResult result;
    result.verdict = Verdict::ValidSetup;
    result.reason = "All checks passed (SMC + Traditional)";
    result.setup = setup;
    result.plan = plan;
    result.smc = smc;
    
    spdlog::info("[{}] VALID {} SETUP entry={:.5f} sl={:.5f} tp1={:.5f} p={:.0f}%",
                 ctx.instrument, side, plan.entry_zone_start, plan.stop_loss,
                 plan.tp1, plan.probability_score);
    return result;
}

TradePlan MarketAnalyst::build_plan(const Bar& current, Direction direction,
                                    double entry_zone_width) {
    TradePlan plan{};
    plan.direction = direction;
    
    const double entry = current.close;
    const double buffer = current.range() * kStopBufferFraction;
    
    double risk;
    if (direction == Direction::Short) {
        plan.stop_loss = current.high + buffer;
        risk = plan.stop_loss - entry;
        plan.tp1 = entry - risk * kRewardMultiple;
        plan.tp2 = entry - risk * kSecondTargetMultiple;
        plan.entry_zone_end = entry + entry_zone_width;
        plan.estimated_rr = risk > 0 ? (entry - plan.tp1) / risk : 0.0;
    } else {
        plan.stop_loss = current.low - buffer;
        risk = entry - plan.stop_loss;
        plan.tp1 = entry + risk * kRewardMultiple;
        plan.tp2 = entry + risk * kSecondTargetMultiple;
        plan.entry_zone_end = entry - entry_zone_width;
        plan.estimated_rr = risk > 0 ? (plan.tp1 - entry) / risk : 0.0;
    }
    plan.entry_zone_start = entry;
    
    return plan;
}
