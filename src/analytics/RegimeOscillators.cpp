#include "analytics/RegimeOscillators.h"
#include "analytics/CompositeScorer.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace trendphase {
namespace analytics {

namespace {
double sig(double x, double k) {
    return CompositeScorer::sigmoid(x, k);
}

double clip01(double x) {
    return CompositeScorer::clip01(x);
}
} // namespace

RegimeOscillators::RegimeOscillators(const engine::PhaseParams& params)
    : params_(params)
{
}

std::string RegimeOscillators::assetKey(const std::string& chain, const std::string& contract) {
    return chain + ":" + contract;
}

OscillatorResult RegimeOscillators::evaluate(
    const core::IndicatorSnapshot& snap,
    const std::vector<Candle>& bars,
    const std::optional<core::RegimeState>& previous,
    const std::string& asset_key
) const {
    OscillatorResult result;
    double px = bars.empty() ? 0.0 : bars.back().close;

    result.edx_raw = computeEdxRaw(snap, bars, result.diagnostics);
    result.regime = smoothEdx(result.edx_raw, previous, asset_key);
    result.edx = clip01(result.regime.edx_ema);

    result.ox = computeOx(snap, px, result.edx, result.diagnostics);
    result.dx = computeDx(snap, px, result.edx, result.diagnostics);
    result.dx_flag = px > 0.0 && px <= snap.ema144;

    result.diagnostics["edx_raw"] = result.edx_raw;
    return result;
}

double RegimeOscillators::computeEdxRaw(
    const core::IndicatorSnapshot& snap,
    const std::vector<Candle>& bars,
    std::map<std::string, double>& diagnostics
) const {
    const auto& k = params_.k;

    size_t window = static_cast<size_t>(std::max(params_.edx_lookback_bars, 2));
    size_t start = bars.size() > window ? bars.size() - window : 0;

    // 1. Slow curvature (EMA250/333 하락)
    double slow = 0.5 * sig(-snap.ema250_slope, k.edx_slow_k) +
                  0.5 * sig(-snap.ema333_slope, k.edx_slow_333_k);

    // 2. Structure failure: lower-low 빈도 + EMA60 아래 종가 비율
    double below_mid_ratio = 0.0;
    double ll_ratio = 0.0;
    size_t n = bars.size() - start;
    if (n > 0 && snap.ema60 > 0.0) {
        int below = 0;
        for (size_t i = start; i < bars.size(); ++i) {
            if (bars[i].close < snap.ema60) ++below;
        }
        below_mid_ratio = static_cast<double>(below) / static_cast<double>(n);
    }
    if (n >= 2) {
        int lower_lows = 0;
        for (size_t i = start + 1; i < bars.size(); ++i) {
            if (bars[i].low < bars[i - 1].low) ++lower_lows;
        }
        ll_ratio = static_cast<double>(lower_lows) / static_cast<double>(n - 1);
    }
    double structure = 0.5 * sig(ll_ratio - 0.5, 0.2) + 0.5 * sig(below_mid_ratio - 0.4, 0.2);

    // 3. Participation decay
    double participation = sig(-snap.vo_z, 1.0);

    // 4. Volatility asymmetry: 하락봉 TR / 상승봉 TR
    std::vector<double> ups;
    std::vector<double> downs;
    std::vector<double> all;
    for (size_t i = start + 1; i < bars.size(); ++i) {
        double tr = TechnicalIndicators::trueRange(bars[i], bars[i - 1]);
        all.push_back(tr);
        if (bars[i].close >= bars[i - 1].close) {
            ups.push_back(tr);
        } else {
            downs.push_back(tr);
        }
    }
    double tr_mean = TechnicalIndicators::calculateMean(all);
    double up_avg = ups.empty() ? tr_mean : TechnicalIndicators::calculateMean(ups);
    double down_avg = downs.empty() ? tr_mean : TechnicalIndicators::calculateMean(downs);
    double asymmetry = up_avg > 0.0 ? sig(down_avg / up_avg - 1.0, 0.2) : 0.0;

    // 5. Geometry rollover
    double geometry = 0.6 * sig(-snap.dsep_mid_5, k.s3_exp_mid_k) +
                      0.4 * sig(-snap.dsep_fast_5, k.s3_exp_fast_k);

    diagnostics["edx_slow"] = slow;
    diagnostics["edx_struct"] = structure;
    diagnostics["edx_part"] = participation;
    diagnostics["edx_vol_dis"] = asymmetry;
    diagnostics["edx_geom"] = geometry;

    return clip01(0.30 * slow + 0.25 * structure + 0.20 * participation +
                  0.15 * asymmetry + 0.10 * geometry);
}

core::RegimeState RegimeOscillators::smoothEdx(
    double edx_raw,
    const std::optional<core::RegimeState>& previous,
    const std::string& asset_key
) const {
    core::RegimeState state;
    state.asset_key = asset_key;

    if (!previous || previous->asset_key != asset_key) {
        state.edx_ema = edx_raw;
        return state;
    }

    double alpha = 2.0 / (static_cast<double>(std::max(params_.edx_ema_span, 1)) + 1.0);
    state.edx_ema = alpha * edx_raw + (1.0 - alpha) * previous->edx_ema;
    return state;
}

double RegimeOscillators::computeOx(
    const core::IndicatorSnapshot& snap,
    double px,
    double edx,
    std::map<std::string, double>& diagnostics
) const {
    const auto& k = params_.k;

    double rail_fast = 0.0;
    double rail_mid = 0.0;
    double rail_144 = 0.0;
    double rail_250 = 0.0;
    if (snap.atr > 0.0) {
        rail_fast = sig((px - snap.ema20) / (snap.atr * k.s3_rail_fast_k), 1.0);
        rail_mid = sig((px - snap.ema60) / (snap.atr * k.s3_rail_mid_k), 1.0);
        rail_144 = sig((px - snap.ema144) / (snap.atr * k.s3_rail_144_k), 1.0);
        rail_250 = sig((px - snap.ema250) / (snap.atr * k.s3_rail_250_k), 1.0);
    }
    double exp_fast = sig(snap.dsep_fast_5, k.s3_exp_fast_k);
    double exp_mid = sig(snap.dsep_mid_5, k.s3_exp_mid_k);
    double atr_surge = sig(snap.atr / std::max(snap.atr_mean_20, 1e-9) - 1.0, 1.0);
    double fragility = sig(-snap.ema20_slope, k.s1_curvature_k);

    double ox_base = 0.35 * rail_fast + 0.20 * rail_mid + 0.10 * rail_144 + 0.10 * rail_250 +
                     0.10 * exp_fast + 0.05 * exp_mid + 0.05 * atr_surge + 0.05 * fragility;

    // 높은 EDX 는 OX 를 최대 +33%
    double edx_boost = 1.0 + 0.33 * clip01((edx - 0.5) / 0.5);

    diagnostics["rail_fast"] = rail_fast;
    diagnostics["rail_mid"] = rail_mid;
    diagnostics["rail_144"] = rail_144;
    diagnostics["rail_250"] = rail_250;
    diagnostics["exp_fast"] = exp_fast;
    diagnostics["exp_mid"] = exp_mid;
    diagnostics["atr_surge"] = atr_surge;
    diagnostics["fragility"] = fragility;

    return clip01(ox_base * edx_boost);
}

double RegimeOscillators::computeDx(
    const core::IndicatorSnapshot& snap,
    double px,
    double edx,
    std::map<std::string, double>& diagnostics
) const {
    const auto& k = params_.k;

    // hallway 내 위치 x: 0 = EMA333 쪽 (깊은 할인), 1 = EMA144 쪽
    double x = 0.0;
    double band_width = 0.0;
    if (snap.ema144 > snap.ema333 && px > 0.0) {
        x = clip01((px - snap.ema333) / (snap.ema144 - snap.ema333));
        band_width = snap.ema144 - snap.ema333;
    } else if (snap.ema333 > snap.ema144 && px > 0.0) {
        // 역배열
        x = clip01((px - snap.ema144) / (snap.ema333 - snap.ema144));
        band_width = snap.ema333 - snap.ema144;
    } else {
        x = px <= snap.ema144 ? 1.0 : 0.0;
        band_width = snap.ema333 != snap.ema144
            ? std::abs(snap.ema333 - snap.ema144)
            : std::max(snap.ema333, snap.ema144) * 0.01;
    }
    band_width = std::max(band_width, 1e-9);

    double compression = sig(0.03 - band_width / std::max(px, 1e-9), 0.02);
    double location = std::exp(-3.0 * x) * (1.0 + 0.3 * compression);

    double exhaustion = clip01(sig(-snap.vo_z, 1.0));

    double atr_relief = sig(snap.atr / std::max(snap.atr_mean_20, 1e-9) - 0.9, 0.05);
    double rsi_relief = sig(snap.rsi_slope_10, k.rsi_k);
    double adx_relief = CompositeScorer::gatedAdxTerm(snap, params_);
    double relief = 0.5 * atr_relief + 0.5 * (0.5 * rsi_relief + 0.5 * adx_relief);

    double curl = snap.d_ema144_slope > 0.0 ? 1.0 : 0.0;

    double dx_base = 0.45 * location + 0.25 * exhaustion + 0.25 * relief + 0.05 * curl;

    // 높은 EDX 는 DX 를 최대 -50%
    double suppression = 1.0 - 0.5 * clip01((edx - 0.6) / 0.4);

    diagnostics["dx_location"] = location;
    diagnostics["exhaustion"] = exhaustion;
    diagnostics["relief"] = relief;

    return clip01(dx_base * suppression);
}

} // namespace analytics
} // namespace trendphase
