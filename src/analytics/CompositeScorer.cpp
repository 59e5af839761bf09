#include "analytics/CompositeScorer.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>
#include <functional>

namespace trendphase {
namespace analytics {

double CompositeScorer::sigmoid(double x, double k) {
    double scale = std::max(k, 1e-9);
    return 1.0 / (1.0 + std::exp(-x / scale));
}

double CompositeScorer::clip01(double x) {
    if (std::isnan(x)) return 0.0;
    return std::max(0.0, std::min(1.0, x));
}

double CompositeScorer::gatedAdxTerm(const core::IndicatorSnapshot& snap, const engine::PhaseParams& params) {
    if (snap.adx < params.adx_floor) {
        return 0.0;
    }
    return sigmoid(snap.adx_slope_10, params.k.adx_k);
}

CompositeScorer::CompressionResult CompositeScorer::computeCompression(
    const core::IndicatorSnapshot& snap,
    const std::vector<Candle>& bars,
    const engine::PhaseParams& params
) {
    CompressionResult result;
    const auto& k = params.k;

    double atr_norm = snap.ema50 > 0.0 ? snap.atr / snap.ema50 : 0.0;

    if (TechnicalIndicators::rangeNormSlope(bars, snap.ema50, params.compression_slope_bars, result.atr_norm_slope)) {
        result.regression_used = true;
    } else if (snap.ema50 > 0.0 && snap.atr_mean_20 > 0.0) {
        // 봉 부족: 평균 대비 현재 ATR_norm 의 상대 변화로 근사
        double mean_norm = snap.atr_mean_20 / snap.ema50;
        result.atr_norm_slope = (atr_norm - mean_norm) / std::max(mean_norm, 1e-9);
    }

    double compression_index =
        0.40 * sigmoid(-result.atr_norm_slope, k.compression_atr_k) +
        0.30 * sigmoid(-snap.dsep_fast_5, k.compression_sep_k) +
        0.20 * sigmoid(-snap.dsep_mid_5, k.compression_sep_k) +
        0.10 * sigmoid(-snap.adx_slope_10, k.compression_adx_k);

    result.baselines.atr_norm_baseline = atr_norm;
    result.baselines.sep_fast_start = snap.sep_fast;
    result.baselines.sep_mid_start = snap.sep_mid;
    result.baselines.adx_baseline = snap.adx > 0.0 ? snap.adx : params.adx_floor;
    result.baselines.compression_index = clip01(compression_index);
    return result;
}

bool CompositeScorer::detectBreakout(const core::IndicatorSnapshot& snap) {
    return snap.ema20_slope > 0.0 &&
           snap.dsep_fast_5 > 0.0 &&
           snap.atr > snap.atr_mean_20 &&
           snap.vo_z_cluster;
}

CompositeScorer::SrFlipResult CompositeScorer::cacheSrFlip(
    const std::vector<core::SrLevel>& levels,
    double breakout_price,
    double prev_close,
    long long ts_ms,
    const engine::PhaseParams& params
) {
    SrFlipResult result;

    // base: breakout 아래 최고 레벨
    for (const auto& lvl : levels) {
        if (lvl.price > 0.0 && lvl.price < breakout_price && lvl.price > result.base_sr_level) {
            result.base_sr_level = lvl.price;
        }
    }

    // flipped: (prev_close, breakout] 구간
    std::vector<core::SrLevel> crossed;
    for (const auto& lvl : levels) {
        if (lvl.price > 0.0 && lvl.price > prev_close && lvl.price <= breakout_price) {
            crossed.push_back(lvl);
        }
    }
    std::stable_sort(crossed.begin(), crossed.end(),
        [](const core::SrLevel& a, const core::SrLevel& b) { return a.price > b.price; });

    double total = 0.0;
    int order = 1;
    for (const auto& lvl : crossed) {
        double s_norm = std::min(1.0, lvl.strength / 20.0);
        double c_norm = clip01(lvl.confidence);

        core::FlippedLevel flipped;
        flipped.id = lvl.id;
        flipped.level = lvl.price;
        flipped.score = clip01(0.5 * s_norm + 0.5 * c_norm);
        flipped.order = order++;
        flipped.flipped_at_ms = ts_ms;

        total += flipped.score;
        result.flipped.push_back(flipped);
    }

    result.sr_flip_score = sigmoid(total, params.k.sr_flip_scale);
    return result;
}

double CompositeScorer::lastSupportBelowBreakout(
    const std::vector<core::SrLevel>& levels,
    const std::vector<Candle>& bars,
    double breakout_price,
    int lookback
) {
    size_t window = static_cast<size_t>(std::max(lookback, 1));
    size_t start = bars.size() > window ? bars.size() - window : 0;
    std::vector<Candle> recent(bars.begin() + start, bars.end());

    std::vector<double> candidates;
    for (const auto& lvl : levels) {
        if (lvl.price > 0.0 && lvl.price < breakout_price) {
            candidates.push_back(lvl.price);
        }
    }
    std::sort(candidates.begin(), candidates.end(), std::greater<double>());

    if (!recent.empty()) {
        double px = recent.back().close;
        for (double level : candidates) {
            double halo_band = 0.03 * std::max(px, level);
            int close_cnt = 0;
            int wick_cnt = 0;
            for (const auto& c : recent) {
                if (c.close >= level) {
                    ++close_cnt;
                    if (c.low <= level + halo_band) ++wick_cnt;
                }
            }
            if (close_cnt >= 3 || wick_cnt >= 2) {
                return level;
            }
        }

        double lowest = recent.front().low;
        for (const auto& c : recent) {
            lowest = std::min(lowest, c.low);
        }
        return lowest;
    }
    return 0.0;
}

std::map<std::string, double> CompositeScorer::BreakoutScores::toMap() const {
    return {
        {"flow_flip_integrity", flow_flip_integrity},
        {"expansion_quality", expansion_quality},
        {"volume_cluster", volume_cluster},
        {"momentum_drive", momentum_drive},
        {"sr_flip_score", sr_flip_score},
        {"breakout_strength", breakout_strength}
    };
}

CompositeScorer::BreakoutScores CompositeScorer::scoreBreakout(
    const core::IndicatorSnapshot& snap,
    const core::CompressionBaselines& frozen,
    double sr_flip_score,
    double close,
    const engine::PhaseParams& params
) {
    BreakoutScores s;
    const auto& k = params.k;

    // 1. Flow flip integrity
    double price_flag = (snap.ema60 > 0.0 && close >= snap.ema60) ? 1.0 : 0.0;
    s.flow_flip_integrity = clip01(
        0.50 * sigmoid(snap.ema20_slope, k.s1_curvature_k) +
        0.35 * sigmoid(snap.dsep_fast_5, k.s1_comp_inv_k) +
        0.15 * price_flag);

    // 2. Expansion quality (고정된 S0 baseline 대비)
    double atr_norm_now = snap.ema50 > 0.0 ? snap.atr / snap.ema50 : 0.0;
    double atr_base = frozen.atr_norm_baseline;
    if (atr_base <= 0.0 && snap.ema50 > 0.0) {
        atr_base = snap.atr_mean_20 / snap.ema50;
    }
    double atr_term = atr_base > 0.0
        ? sigmoid((atr_norm_now - atr_base) / std::abs(atr_base), k.s1_expansion_k)
        : 0.5;
    double sep_term = sigmoid(
        (snap.sep_fast - frozen.sep_fast_start) / std::max(std::abs(frozen.sep_fast_start), 0.01),
        k.s1_expansion_k);
    s.expansion_quality = clip01(0.5 * (atr_term + sep_term));

    // 3. Volume cluster
    s.volume_cluster = snap.vo_z_cluster ? 1.0 : clip01(snap.vo_z / 6.0);

    // 4. Momentum drive
    s.momentum_drive = clip01(0.6 * sigmoid(snap.rsi_slope_10, k.rsi_k) + 0.4 * gatedAdxTerm(snap, params));

    s.sr_flip_score = clip01(sr_flip_score);

    s.breakout_strength_base = clip01(
        0.30 * s.flow_flip_integrity +
        0.25 * s.expansion_quality +
        0.20 * s.volume_cluster +
        0.15 * s.momentum_drive +
        0.10 * s.sr_flip_score);

    s.breakout_strength = clip01(s.breakout_strength_base * (0.85 + 0.15 * clip01(frozen.compression_index)));
    return s;
}

double CompositeScorer::trendStrength(const core::IndicatorSnapshot& snap, const engine::PhaseParams& params) {
    return clip01(0.6 * sigmoid(snap.rsi_slope_10, params.k.rsi_k) + 0.4 * gatedAdxTerm(snap, params));
}

double CompositeScorer::halo(double atr, double price, const engine::PhaseParams& params) {
    if (price <= 0.0) return 0.0;
    return std::max(params.halo_atr_mult * atr, params.halo_price_pct * price);
}

} // namespace analytics
} // namespace trendphase
