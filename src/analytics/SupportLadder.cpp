#include "analytics/SupportLadder.h"
#include "analytics/CompositeScorer.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <initializer_list>

namespace trendphase {
namespace analytics {

std::map<std::string, double> LadderResult::scores() const {
    return {
        {"support_persistence", support_persistence},
        {"reaction_quality", reaction_quality},
        {"close_persistence", close_persistence},
        {"absorption_wicks", absorption_wicks},
        {"ema_alignment", ema_alignment},
        {"volatility_coherence", volatility_coherence},
        {"trend_integrity", trend_integrity},
        {"trend_strength", trend_strength}
    };
}

SupportLadder::SupportLadder(const engine::PhaseParams& params)
    : params_(params)
{
}

std::vector<double> SupportLadder::buildTiers(const core::BreakoutArtifacts& s1) {
    std::vector<double> tiers;
    for (const auto& f : s1.flipped_sr_levels) {
        if (f.level > 0.0) {
            tiers.push_back(f.level);
        }
    }
    std::sort(tiers.begin(), tiers.end(), std::greater<double>());

    if (s1.base_sr_level > 0.0) {
        tiers.push_back(s1.base_sr_level);
    }

    // 중복 제거 (순서 유지)
    std::vector<double> unique;
    for (double t : tiers) {
        if (std::find(unique.begin(), unique.end(), t) == unique.end()) {
            unique.push_back(t);
        }
    }
    return unique;
}

LadderResult SupportLadder::update(
    const core::SupportLadderState& previous,
    const core::BreakoutArtifacts& s1,
    const core::IndicatorSnapshot& snap,
    const std::vector<Candle>& bars
) const {
    LadderResult result;
    result.state = previous;
    result.tiers = buildTiers(s1);

    if (bars.empty()) {
        result.state = core::SupportLadderState();
        return result;
    }

    const Candle& last = bars.back();
    const double px = last.close;
    result.halo = CompositeScorer::halo(snap.atr, px, params_);

    auto& st = result.state;
    const auto& tiers = result.tiers;

    if (tiers.empty()) {
        st = core::SupportLadderState();
    } else if (!st.active()) {
        // 1. Activation: 최상단 tier 터치 후 종가 유지
        double top = tiers.front();
        if (last.low <= top + result.halo && px >= top) {
            st.tier_index = 0;
            st.current_sr = top;
            st.t0_ms = last.timestamp;
            result.activated = true;
        }
    } else {
        int idx = std::min(st.tier_index, static_cast<int>(tiers.size()) - 1);

        if (px < tiers[idx] && idx + 1 < static_cast<int>(tiers.size())) {
            // 2. Step-down
            ++idx;
            result.stepped_down = true;
        } else if (idx > 0 && px >= tiers[idx - 1]) {
            // 3. Reclaim
            --idx;
            result.reclaimed = true;
        }
        st.tier_index = idx;
        st.current_sr = tiers[idx];
    }

    scorePersistence(result, snap, bars);

    result.ema_alignment = emaAlignment(snap);
    result.volatility_coherence = volatilityCoherence(snap);

    double trend_integrity = 0.55 * result.support_persistence +
                             0.35 * result.ema_alignment +
                             0.10 * result.volatility_coherence;
    double trend_strength = CompositeScorer::trendStrength(snap, params_);

    // tier 깊이 배수
    double tier_mult = 1.0;
    if (st.active()) {
        result.at_base = (st.tier_index == static_cast<int>(tiers.size()) - 1) &&
                         s1.base_sr_level > 0.0 &&
                         st.current_sr == s1.base_sr_level;
        tier_mult = result.at_base
            ? 1.0 + params_.base_tier_boost
            : 1.0 + params_.tier_step_boost * st.tier_index;
    }
    result.trend_integrity_pre = CompositeScorer::clip01(trend_integrity * tier_mult);
    result.trend_strength_pre = CompositeScorer::clip01(trend_strength * tier_mult);

    // 이번 사이클 한정 dent / reclaim
    result.trend_integrity = result.trend_integrity_pre;
    result.trend_strength = result.trend_strength_pre;
    if (result.stepped_down) {
        result.trend_integrity = CompositeScorer::clip01(result.trend_integrity_pre * params_.dent_integrity_mult);
        result.trend_strength = CompositeScorer::clip01(result.trend_strength_pre * params_.dent_strength_mult);
    } else if (result.reclaimed) {
        result.trend_integrity = CompositeScorer::clip01(result.trend_integrity_pre * params_.reclaim_integrity_mult);
        result.trend_strength = CompositeScorer::clip01(result.trend_strength_pre * params_.reclaim_strength_mult);
    }

    result.uptrend_holding = st.active() && px >= st.current_sr;
    return result;
}

void SupportLadder::scorePersistence(
    LadderResult& result,
    const core::IndicatorSnapshot& snap,
    const std::vector<Candle>& bars
) const {
    const auto& st = result.state;
    if (!st.active() || bars.empty()) {
        return;
    }

    const double sr = st.current_sr;
    const Candle& last = bars.back();

    int close_cnt = 0;
    int wick_cnt = 0;
    double max_high = 0.0;
    bool any = false;
    for (const auto& c : bars) {
        if (c.timestamp < st.t0_ms) continue;
        any = true;
        if (c.close >= sr) {
            ++close_cnt;
            if (c.low < sr) ++wick_cnt;
        }
        max_high = std::max(max_high, c.high);
    }

    result.touch_confirm = (last.low <= sr + result.halo && last.close >= sr) ? 1.0 : 0.0;
    result.close_persistence = 1.0 - std::exp(-close_cnt / 6.0);
    result.absorption_wicks = 1.0 - std::exp(-wick_cnt / 2.0);
    if (any && snap.atr > 0.0) {
        result.reaction_quality = CompositeScorer::clip01((max_high - sr) / snap.atr);
    }

    double persistence = 0.25 * result.touch_confirm +
                         0.20 * result.reaction_quality +
                         0.40 * result.close_persistence +
                         0.15 * result.absorption_wicks;

    // EMA60/144 근접 tier 는 +5%
    if (snap.atr > 0.0) {
        double band = 0.5 * snap.atr;
        bool near_ema = (snap.ema60 > 0.0 && std::abs(sr - snap.ema60) <= band) ||
                        (snap.ema144 > 0.0 && std::abs(sr - snap.ema144) <= band);
        if (near_ema) {
            persistence *= 1.05;
        }
    }
    result.support_persistence = CompositeScorer::clip01(persistence);
}

double SupportLadder::emaAlignment(const core::IndicatorSnapshot& snap) const {
    int slow_pos = 0;
    for (double v : {snap.ema144_slope, snap.ema250_slope, snap.ema333_slope}) {
        if (v >= 0.0) ++slow_pos;
    }
    int slow_accel = 0;
    for (double v : {snap.d_ema144_slope, snap.d_ema250_slope, snap.d_ema333_slope}) {
        if (v > 0.0) ++slow_accel;
    }

    double slow = CompositeScorer::clip01(0.60 * (slow_pos / 3.0) + 0.40 * (slow_accel / 3.0));
    double mid_help = snap.ema60_slope >= 0.0 ? 1.0 : 0.0;
    double fast_gt_mid = snap.ema20 > snap.ema60 ? 1.0 : 0.0;

    return CompositeScorer::clip01(
        0.50 * slow +
        0.15 * mid_help +
        0.20 * fast_gt_mid +
        0.15 * CompositeScorer::clip01(snap.sep_fast));
}

double SupportLadder::volatilityCoherence(const core::IndicatorSnapshot& snap) const {
    double mean = snap.atr_mean_20 > 0.0 ? snap.atr_mean_20 : snap.atr;
    if (mean <= 0.0) {
        return 0.5;
    }
    double ratio = (snap.atr - mean) / mean;
    return CompositeScorer::sigmoid(-ratio, 0.3);
}

} // namespace analytics
} // namespace trendphase
