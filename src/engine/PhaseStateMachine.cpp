#include "engine/PhaseStateMachine.h"

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <stdexcept>

#include "analytics/CompositeScorer.h"
#include "analytics/RegimeOscillators.h"
#include "analytics/SupportLadder.h"
#include "analytics/TechnicalIndicators.h"
#include "engine/EmergencyExit.h"
#include "engine/Hysteresis.h"

namespace trendphase {
namespace engine {

using analytics::CompositeScorer;
using analytics::TechnicalIndicators;
using core::Phase;
using core::PhaseEventType;

namespace {

// 한 사이클 동안 공유되는 읽기 전용 문맥
struct Cycle {
    const PhaseInput& in;
    const PhaseParams& params;
    const core::IndicatorSnapshot& snap;
    const Candle& last;
    double px;
    std::string asset_key;
};

struct FakeoutVote {
    bool structural_failure = false;
    bool flow_reversal = false;
    bool conviction_collapse = false;
    double avwap = 0.0;
    double avwap_slope = 0.0;
    int below_avwap = 0;

    int votes() const {
        return (structural_failure ? 1 : 0) + (flow_reversal ? 1 : 0) + (conviction_collapse ? 1 : 0);
    }
};

core::EnginePayload basePayload(const Cycle& c, Phase state) {
    core::EnginePayload payload;
    payload.state = state;
    payload.ts_ms = c.in.as_of_ms;
    payload.levels = {
        {"ema20", c.snap.ema20},
        {"ema60", c.snap.ema60},
        {"ema144", c.snap.ema144},
        {"ema250", c.snap.ema250},
        {"ema333", c.snap.ema333}
    };
    return payload;
}

bool applyHysteresis(const Cycle& c, core::EngineMeta& meta, const std::string& flag, double value) {
    core::HysteresisState previous;
    auto it = meta.hysteresis.find(flag);
    if (it != meta.hysteresis.end()) {
        previous = it->second;
    }
    core::HysteresisState next = updateHysteresis(previous, value, c.params.hysteresis);
    meta.hysteresis[flag] = next;
    return next.active;
}

// S0: compression index + baseline 갱신 (S0 에 있는 동안 매 사이클)
core::EnginePayload s0Payload(const Cycle& c, core::EngineMeta& meta) {
    auto comp = CompositeScorer::computeCompression(c.snap, c.in.bars, c.params);
    meta.s0 = comp.baselines;

    core::EnginePayload payload = basePayload(c, Phase::S0);
    payload.flags["watch_only"] = true;
    payload.scores = {
        {"compression_index", comp.baselines.compression_index},
        {"atr_norm_slope", comp.atr_norm_slope},
        {"dsep_fast", c.snap.dsep_fast_5},
        {"dsep_mid", c.snap.dsep_mid_5}
    };
    payload.baselines = comp.baselines;
    // 0 이면 봉 부족으로 atr_mean_20 근사
    payload.diagnostics["atr_slope_regression"] = comp.regression_used ? 1.0 : 0.0;
    return payload;
}

core::SrContext srContextFromArtifacts(const Cycle& c, const core::BreakoutArtifacts& s1) {
    core::SrContext ctx;
    ctx.halo = CompositeScorer::halo(c.snap.atr, c.px, c.params);
    ctx.base_sr_level = s1.base_sr_level;
    ctx.flipped_sr_levels = s1.flipped_sr_levels;
    std::stable_sort(ctx.flipped_sr_levels.begin(), ctx.flipped_sr_levels.end(),
        [](const core::FlippedLevel& a, const core::FlippedLevel& b) { return a.level > b.level; });
    return ctx;
}

// bootstrap / S1 메타 없는 S3: geometry 상위 N개 (strength 기준), 가격 내림차순, base = 최저
core::SrContext srContextFromGeometry(const Cycle& c) {
    std::vector<core::SrLevel> ranked;
    for (const auto& lvl : c.in.levels) {
        if (lvl.price > 0.0) ranked.push_back(lvl);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const core::SrLevel& a, const core::SrLevel& b) { return a.strength > b.strength; });
    if (ranked.size() > static_cast<size_t>(std::max(c.params.bootstrap_top_levels, 0))) {
        ranked.resize(static_cast<size_t>(std::max(c.params.bootstrap_top_levels, 0)));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const core::SrLevel& a, const core::SrLevel& b) { return a.price > b.price; });

    core::SrContext ctx;
    ctx.halo = CompositeScorer::halo(c.snap.atr, c.px, c.params);
    int order = 1;
    for (const auto& lvl : ranked) {
        core::FlippedLevel f;
        f.id = lvl.id;
        f.level = lvl.price;
        f.score = lvl.strength;
        f.order = order++;
        f.flipped_at_ms = c.in.as_of_ms;
        ctx.flipped_sr_levels.push_back(f);
    }
    if (!ctx.flipped_sr_levels.empty()) {
        ctx.base_sr_level = ctx.flipped_sr_levels.back().level;
    }
    return ctx;
}

FakeoutVote voteFakeout(const Cycle& c, const core::BreakoutArtifacts& s1) {
    FakeoutVote vote;
    const auto& snap = c.snap;

    // 1. 구조 붕괴
    vote.structural_failure = s1.last_support_below_breakout > 0.0 &&
                              c.px < s1.last_support_below_breakout;

    // 2. 흐름 반전
    vote.flow_reversal = (snap.ema60_slope < 0.0 && snap.ema144_slope < 0.0) ||
                         snap.d_ema60_slope < 0.0;

    // 3. 확신 붕괴 (breakout 봉 앵커 AVWAP)
    if (s1.breakout_ts_ms > 0) {
        auto av = TechnicalIndicators::calculateAnchoredVWAP(c.in.bars, s1.breakout_ts_ms);
        vote.avwap = av.avwap;
        vote.avwap_slope = av.slope_norm;
        if (av.avwap > 0.0) {
            vote.below_avwap = TechnicalIndicators::countClosesBelow(
                c.in.bars, av.avwap, c.params.avwap_below_closes);
        }
    }
    vote.conviction_collapse = vote.avwap_slope < 0.0 ||
                               vote.below_avwap >= c.params.avwap_below_closes;
    return vote;
}

void addFakeoutDiagnostics(core::EnginePayload& payload, const FakeoutVote& vote) {
    payload.diagnostics["fakeout_structural"] = vote.structural_failure ? 1.0 : 0.0;
    payload.diagnostics["fakeout_flow"] = vote.flow_reversal ? 1.0 : 0.0;
    payload.diagnostics["fakeout_conviction"] = vote.conviction_collapse ? 1.0 : 0.0;
    payload.diagnostics["avwap"] = vote.avwap;
    payload.diagnostics["avwap_slope_10"] = vote.avwap_slope;
}

// S2 payload (ladder 결과 + trend_healthy 히스테리시스)
core::EnginePayload s2Payload(const Cycle& c,
                              core::EngineMeta& meta,
                              const analytics::LadderResult& ladder,
                              const core::BreakoutArtifacts& s1) {
    core::EnginePayload payload = basePayload(c, Phase::S2);
    payload.scores = ladder.scores();
    payload.flags["uptrend_holding"] = ladder.uptrend_holding;
    payload.flags["trend_healthy"] = applyHysteresis(c, meta, "trend_healthy", ladder.trend_integrity);

    core::SupportsBlock supports;
    supports.active = ladder.state.active();
    supports.tier_index = ladder.state.tier_index;
    supports.current_sr_level = ladder.state.current_sr;
    supports.halo = ladder.halo;
    payload.supports = supports;
    payload.sr_context = srContextFromArtifacts(c, s1);

    payload.diagnostics["tier_count"] = static_cast<double>(ladder.tiers.size());
    payload.diagnostics["trend_integrity_pre"] = ladder.trend_integrity_pre;
    payload.diagnostics["trend_strength_pre"] = ladder.trend_strength_pre;
    payload.diagnostics["dent"] = ladder.stepped_down ? 1.0 : 0.0;
    payload.diagnostics["reclaim"] = ladder.reclaimed ? 1.0 : 0.0;
    payload.diagnostics["touch_confirm"] = ladder.touch_confirm;
    return payload;
}

// S3 payload (OX/DX/EDX + 히스테리시스). meta.s3 갱신
core::EnginePayload s3Payload(const Cycle& c, core::EngineMeta& meta) {
    analytics::RegimeOscillators oscillators(c.params);
    auto osc = oscillators.evaluate(c.snap, c.in.bars, meta.s3, c.asset_key);
    meta.s3 = osc.regime;

    core::EnginePayload payload = basePayload(c, Phase::S3);
    payload.scores = {
        {"ox", osc.ox},
        {"dx", osc.dx},
        {"edx", osc.edx}
    };
    payload.diagnostics = osc.diagnostics;
    payload.flags["dx_flag"] = osc.dx_flag;
    payload.flags["can_still_enter"] = applyHysteresis(c, meta, "can_still_enter", osc.dx);
    payload.flags["euphoria_building"] = applyHysteresis(c, meta, "euphoria_building", osc.ox);

    if (meta.s1) {
        payload.sr_context = srContextFromArtifacts(c, *meta.s1);
        if (meta.s1->breakout_ts_ms > 0) {
            auto av = TechnicalIndicators::calculateAnchoredVWAP(c.in.bars, meta.s1->breakout_ts_ms);
            payload.diagnostics["avwap"] = av.avwap;
            payload.diagnostics["avwap_slope_10"] = av.slope_norm;
        }
    } else {
        payload.sr_context = srContextFromGeometry(c);
    }
    return payload;
}

// S0 진입은 사이클 종료: S3 EDX smoothing 도 다음 S3 에서 새로 시작
void enterS0(const Cycle& c, PhaseResult& result) {
    result.meta.s1.reset();
    result.meta.s2.reset();
    result.meta.s3.reset();
    result.payload = s0Payload(c, result.meta);
}

// ===== state handlers =====

void handleS0(const Cycle& c, PhaseResult& result) {
    auto& meta = result.meta;

    if (!CompositeScorer::detectBreakout(c.snap)) {
        enterS0(c, result);
        return;
    }

    // S0 → S1: breakout 시점 artifacts 고정
    const auto& bars = c.in.bars;
    double px_breakout = c.px;
    double px_prev_close = bars.size() >= 2 ? bars[bars.size() - 2].close : px_breakout;

    auto flip = CompositeScorer::cacheSrFlip(c.in.levels, px_breakout, px_prev_close, c.in.as_of_ms, c.params);

    core::CompressionBaselines frozen = meta.s0
        ? *meta.s0
        : CompositeScorer::computeCompression(c.snap, bars, c.params).baselines;

    core::BreakoutArtifacts s1;
    s1.base_sr_level = flip.base_sr_level;
    s1.flipped_sr_levels = flip.flipped;
    s1.sr_flip_score = flip.sr_flip_score;
    s1.breakout_price = px_breakout;
    s1.breakout_ts_ms = c.last.timestamp;
    s1.breakout_high = px_breakout;
    s1.atr_at_breakout = c.snap.atr;
    s1.atr_peak = c.snap.atr;
    s1.atr_norm_at_breakout = c.snap.ema50 > 0.0 ? c.snap.atr / c.snap.ema50 : 0.0;
    s1.last_support_below_breakout = CompositeScorer::lastSupportBelowBreakout(
        c.in.levels, bars, px_breakout, c.params.support_lookback_bars);
    s1.frozen_s0 = frozen;

    auto scores = CompositeScorer::scoreBreakout(c.snap, frozen, flip.sr_flip_score, px_breakout, c.params);
    s1.breakout_scores = scores.toMap();

    meta.s1 = s1;
    meta.s2.reset();

    result.payload = basePayload(c, Phase::S1);
    result.payload.flags["breakout_confirmed"] = true;
    result.payload.scores = s1.breakout_scores;
    result.payload.sr_context = srContextFromArtifacts(c, s1);
    result.payload.baselines = frozen;
    result.payload.diagnostics["breakout_strength_base"] = scores.breakout_strength_base;
    result.payload.diagnostics["last_support_below_breakout"] = s1.last_support_below_breakout;
    result.payload.diagnostics["flipped_count"] = static_cast<double>(flip.flipped.size());

    result.events.push_back(PhaseEventType::S1_BREAKOUT);
}

void handleS1(const Cycle& c, PhaseResult& result) {
    auto& meta = result.meta;
    if (!meta.s1) {
        handleS0(c, result);
        return;
    }

    auto vote = voteFakeout(c, *meta.s1);
    if (vote.votes() >= c.params.fakeout_votes_required) {
        enterS0(c, result);
        result.payload.diagnostics["s1_fakeout"] = 1.0;
        addFakeoutDiagnostics(result.payload, vote);
        result.events.push_back(PhaseEventType::S1_FAKEOUT);
        return;
    }

    // S1 동안 ATR peak / breakout high 추적
    auto& s1 = *meta.s1;
    s1.atr_peak = std::max(s1.atr_peak, c.snap.atr);
    s1.breakout_high = std::max(s1.breakout_high, c.px);

    // 1. 변동성 냉각 (peak 대비 10%)
    bool volatility_cooling = c.snap.atr < s1.atr_peak * c.params.s1_atr_cooling_ratio;

    // 2. 단기 EMA 평탄화
    double atr_pct = c.px > 0.0 ? c.snap.atr / c.px : 0.0;
    double ema20_slope_norm = atr_pct > 0.0 ? c.snap.ema20_slope / atr_pct : 0.0;
    bool momentum_slowed = ema20_slope_norm < c.params.s1_slope_norm_flat &&
                           c.snap.dsep_fast_5 < c.params.s1_dsep_flat;

    // 3. 되돌림 max(6%, ATR%)
    double pullback = 0.0;
    bool pulled_back = false;
    if (s1.breakout_high > 0.0 && c.px > 0.0) {
        pullback = (s1.breakout_high - c.px) / s1.breakout_high;
        pulled_back = pullback >= std::max(c.params.s1_min_pullback_pct, atr_pct);
    }

    if (volatility_cooling || momentum_slowed || pulled_back) {
        analytics::SupportLadder ladder(c.params);
        auto lr = ladder.update(core::SupportLadderState(), s1, c.snap, c.in.bars);
        meta.s2 = lr.state;

        result.payload = s2Payload(c, meta, lr, s1);
        result.payload.diagnostics["volatility_cooling"] = volatility_cooling ? 1.0 : 0.0;
        result.payload.diagnostics["momentum_slowed"] = momentum_slowed ? 1.0 : 0.0;
        result.payload.diagnostics["price_pulled_back"] = pulled_back ? 1.0 : 0.0;
        result.events.push_back(PhaseEventType::S2_SUPPORT_TOUCH);
        return;
    }

    // S1 유지
    result.payload = basePayload(c, Phase::S1);
    result.payload.flags["breakout_confirmed"] = true;
    result.payload.scores = s1.breakout_scores;
    result.payload.sr_context = srContextFromArtifacts(c, s1);
    result.payload.baselines = s1.frozen_s0;
    result.payload.diagnostics["atr_peak"] = s1.atr_peak;
    result.payload.diagnostics["breakout_high"] = s1.breakout_high;
    result.payload.diagnostics["pullback"] = pullback;
    result.payload.diagnostics["ema20_slope_norm"] = ema20_slope_norm;
    addFakeoutDiagnostics(result.payload, vote);
}

void handleS2(const Cycle& c, PhaseResult& result) {
    auto& meta = result.meta;
    if (!meta.s1) {
        handleS0(c, result);
        return;
    }
    const core::BreakoutArtifacts s1 = *meta.s1;

    // ladder 는 사이클당 한 번만 갱신
    analytics::SupportLadder ladder(c.params);
    auto lr = ladder.update(meta.s2.value_or(core::SupportLadderState()), s1, c.snap, c.in.bars);
    meta.s2 = lr.state;

    // S2 → S3
    const auto& snap = c.snap;
    bool price_above = false;
    if (snap.ema333 > 0.0 && c.in.bars.size() >= static_cast<size_t>(c.params.window_bars)) {
        int above = TechnicalIndicators::countClosesAbove(c.in.bars, snap.ema333, c.params.window_bars);
        price_above = above >= c.params.window_threshold;
    }
    int slow_pos = 0;
    for (double v : {snap.ema144_slope, snap.ema250_slope, snap.ema333_slope}) {
        if (v >= 0.0) ++slow_pos;
    }
    bool slopes_up = slow_pos >= c.params.s3_entry_slow_slopes_min;
    bool momentum_ok = lr.trend_strength >= c.params.s3_entry_trend_strength;

    if (price_above && slopes_up && momentum_ok) {
        result.payload = s3Payload(c, meta);
        result.events.push_back(PhaseEventType::S3_ACTIVE);
        return;
    }

    // S2 에 머무는 경우에만 fakeout 판정
    auto vote = voteFakeout(c, s1);
    if (vote.votes() >= c.params.fakeout_votes_required) {
        enterS0(c, result);
        result.payload.diagnostics["s2_fakeout"] = 1.0;
        addFakeoutDiagnostics(result.payload, vote);
        result.events.push_back(PhaseEventType::S2_FAKEOUT);
        return;
    }

    result.payload = s2Payload(c, meta, lr, s1);
    addFakeoutDiagnostics(result.payload, vote);
    if (lr.activated) {
        result.events.push_back(PhaseEventType::S2_SUPPORT_TOUCH);
    }
}

void handleS3(const Cycle& c, PhaseResult& result) {
    auto& meta = result.meta;
    const auto& snap = c.snap;

    // S3 → S0: 10봉 중 8봉 이상 EMA333 아래
    if (snap.ema333 > 0.0 && c.in.bars.size() >= static_cast<size_t>(c.params.window_bars)) {
        int below = TechnicalIndicators::countClosesBelow(c.in.bars, snap.ema333, c.params.window_bars);
        if (below >= c.params.window_threshold) {
            enterS0(c, result);
            meta.emergency_exit.reset();
            result.payload.emergency_exit = EmergencyExit::persistentDowntrend(
                c.last, snap, c.in.as_of_ms, below, c.params);
            result.payload.diagnostics["s3_exit"] = 1.0;
            result.payload.diagnostics["below_count"] = static_cast<double>(below);
            result.events.push_back(PhaseEventType::S3_EXIT);
            return;
        }
    }

    result.payload = s3Payload(c, meta);

    // sr_context 레벨 재탈환: 직전 종가 < level <= 현재 종가
    const auto& bars = c.in.bars;
    if (bars.size() >= 2 && result.payload.sr_context) {
        double prev_close = bars[bars.size() - 2].close;
        const auto& ctx = *result.payload.sr_context;
        bool reclaimed = false;
        for (const auto& f : ctx.flipped_sr_levels) {
            if (f.level > 0.0 && prev_close < f.level && c.px >= f.level) {
                reclaimed = true;
                result.payload.diagnostics["sr_reclaim_level"] = f.level;
                break;
            }
        }
        if (!reclaimed && ctx.base_sr_level > 0.0 &&
            prev_close < ctx.base_sr_level && c.px >= ctx.base_sr_level) {
            reclaimed = true;
            result.payload.diagnostics["sr_reclaim_level"] = ctx.base_sr_level;
        }
        if (reclaimed) {
            result.events.push_back(PhaseEventType::S3_SR_RECLAIM);
        }
    }
}

void bootstrap(const Cycle& c, PhaseResult& result) {
    auto& meta = result.meta;
    meta.s1.reset();
    meta.s2.reset();
    meta.emergency_exit.reset();

    const auto& snap = c.snap;
    if (snap.ema333 > 0.0 && c.in.bars.size() >= static_cast<size_t>(c.params.window_bars)) {
        int below = TechnicalIndicators::countClosesBelow(c.in.bars, snap.ema333, c.params.window_bars);
        if (below < c.params.window_threshold) {
            // 하락 추세가 아니면 S3 운영 구간으로 바로 진입
            result.payload = s3Payload(c, meta);
            result.payload.diagnostics["bootstrap"] = 1.0;
            result.events.push_back(PhaseEventType::S3_ACTIVE);
            return;
        }
    }

    // EMA333 무효, 봉 부족, 또는 하락 추세
    enterS0(c, result);
    result.payload.diagnostics["bootstrap"] = 1.0;
}

void applyEmergencyOverlay(const Cycle& c, PhaseResult& result) {
    bool previously_active = c.in.previous &&
                             c.in.previous->emergency_exit &&
                             c.in.previous->emergency_exit->active;

    auto update = EmergencyExit::evaluate(previously_active, result.meta.emergency_exit,
                                          c.last, c.snap, c.in.as_of_ms, c.params);
    result.payload.emergency_exit = update.flag;
    result.meta.emergency_exit = update.meta;

    if (update.activated) {
        result.events.push_back(PhaseEventType::EMERGENCY_EXIT_ON);
        result.emergency_changed = true;
    }
    if (update.deactivated) {
        result.events.push_back(PhaseEventType::EMERGENCY_EXIT_OFF);
        result.emergency_changed = true;
    }
}

} // namespace

PhaseResult PhaseStateMachine::transition(const PhaseInput& input, const PhaseParams& params) {
    if (input.bars.empty()) {
        throw std::invalid_argument("PhaseStateMachine: no bars for " + input.chain + ":" + input.contract);
    }

    Cycle c{input, params, input.indicators, input.bars.back(), input.bars.back().close,
            analytics::RegimeOscillators::assetKey(input.chain, input.contract)};

    PhaseResult result;
    result.meta = input.meta;

    if (!input.previous) {
        bootstrap(c, result);
    } else {
        switch (input.previous->state) {
            case Phase::S0: handleS0(c, result); break;
            case Phase::S1: handleS1(c, result); break;
            case Phase::S2: handleS2(c, result); break;
            case Phase::S3: handleS3(c, result); break;
        }
    }

    if (result.payload.state == Phase::S3) {
        applyEmergencyOverlay(c, result);
    }

    result.transitioned = !input.previous || input.previous->state != result.payload.state;
    return result;
}

} // namespace engine
} // namespace trendphase
