#include "analytics/CompositeScorer.h"
#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

using namespace trendphase;
using analytics::CompositeScorer;

namespace {
bool inUnit(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

std::vector<Candle> rampBars(int count, double start, double step, long long t0) {
    std::vector<Candle> bars;
    for (int i = 0; i < count; ++i) {
        Candle c;
        c.timestamp = t0 + static_cast<long long>(i) * kBarIntervalMs;
        c.close = start + step * i;
        c.open = c.close - step * 0.5;
        c.high = c.close + 1.0;
        c.low = c.close - 1.0;
        c.volume = 1000.0;
        bars.push_back(c);
    }
    return bars;
}

void testSigmoidAndGate() {
    assert(std::abs(CompositeScorer::sigmoid(0.0, 1.0) - 0.5) < 1e-12);
    assert(CompositeScorer::sigmoid(10.0, 1.0) > 0.99);
    assert(CompositeScorer::sigmoid(-10.0, 1.0) < 0.01);
    // k = 0 은 하한으로 보정, NaN 없음
    assert(std::isfinite(CompositeScorer::sigmoid(1.0, 0.0)));
    assert(CompositeScorer::clip01(std::numeric_limits<double>::quiet_NaN()) == 0.0);
    assert(CompositeScorer::clip01(2.0) == 1.0);
    assert(CompositeScorer::clip01(-1.0) == 0.0);

    engine::PhaseParams params;
    core::IndicatorSnapshot snap;
    snap.adx = 10.0;            // floor 18 미만
    snap.adx_slope_10 = 5.0;
    assert(CompositeScorer::gatedAdxTerm(snap, params) == 0.0);
    snap.adx = 25.0;
    assert(CompositeScorer::gatedAdxTerm(snap, params) > 0.99);
}

void testBreakoutDetection() {
    core::IndicatorSnapshot snap;
    snap.ema20_slope = 0.01;
    snap.dsep_fast_5 = 0.002;
    snap.atr = 2.0;
    snap.atr_mean_20 = 1.5;
    snap.vo_z_cluster = true;
    assert(CompositeScorer::detectBreakout(snap));

    snap.vo_z_cluster = false;
    assert(!CompositeScorer::detectBreakout(snap));
    snap.vo_z_cluster = true;
    snap.atr = 1.0;
    assert(!CompositeScorer::detectBreakout(snap));
}

void testSrFlip() {
    engine::PhaseParams params;
    std::vector<core::SrLevel> levels = {
        {"a", 90.0, 3.0, 0.8, "pivot"},
        {"b", 100.0, 5.0, 0.9, "pivot"},
        {"c", 104.0, 2.0, 0.5, "pivot"},
        {"d", 130.0, 4.0, 0.7, "pivot"}
    };
    // prev_close 102 → 110 돌파: 104 는 flip, 100 은 base
    auto flip = CompositeScorer::cacheSrFlip(levels, 110.0, 102.0, 1000, params);
    assert(flip.base_sr_level > 0.0);
    assert(flip.base_sr_level < 110.0);
    for (const auto& f : flip.flipped) {
        assert(f.level <= 110.0);
    }
    for (size_t i = 1; i < flip.flipped.size(); ++i) {
        assert(flip.flipped[i - 1].level >= flip.flipped[i].level);
    }
    assert(inUnit(flip.sr_flip_score));
}

void testCompressionAndHalo() {
    engine::PhaseParams params;
    core::IndicatorSnapshot snap;
    snap.ema50 = 100.0;
    snap.atr = 1.0;
    snap.atr_mean_20 = 1.2;
    snap.sep_fast = 0.01;
    snap.sep_mid = 0.02;
    snap.adx = 12.0;

    auto bars = rampBars(40, 100.0, 0.0, 0);
    auto comp = CompositeScorer::computeCompression(snap, bars, params);
    assert(inUnit(comp.baselines.compression_index));
    assert(std::abs(comp.baselines.atr_norm_baseline - 0.01) < 1e-12);
    // ADX > 0 이면 그대로 baseline
    assert(comp.baselines.adx_baseline == 12.0);

    assert(CompositeScorer::halo(1.0, 100.0, params) == 3.0);    // 0.03 * price
    assert(CompositeScorer::halo(10.0, 100.0, params) == 5.0);   // 0.5 * ATR
    assert(CompositeScorer::halo(10.0, 0.0, params) == 0.0);
}

void testLastSupportBelowBreakout() {
    std::vector<core::SrLevel> levels = {{"s", 100.0, 1.0, 1.0, "pivot"}};
    // 종가가 100 근처에서 여러 번 지지
    auto bars = rampBars(30, 101.0, 0.0, 0);
    double support = CompositeScorer::lastSupportBelowBreakout(levels, bars, 110.0, 30);
    assert(support == 100.0);

    // 레벨 없음: 최저 저가로 대체
    double fallback = CompositeScorer::lastSupportBelowBreakout({}, bars, 110.0, 30);
    assert(std::abs(fallback - 100.0) < 1e-9);
}

// 임의 입력에서도 모든 점수는 [0, 1]
void testScoreClippingFuzz() {
    engine::PhaseParams params;
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> wide(-1e6, 1e6);
    std::uniform_real_distribution<double> small(-5.0, 5.0);

    for (int i = 0; i < 2000; ++i) {
        core::IndicatorSnapshot snap;
        snap.valid = true;
        snap.ema20 = wide(rng);
        snap.ema50 = wide(rng);
        snap.ema60 = wide(rng);
        snap.ema144 = wide(rng);
        snap.ema333 = wide(rng);
        snap.ema20_slope = small(rng);
        snap.ema60_slope = small(rng);
        snap.ema144_slope = small(rng);
        snap.d_ema60_slope = small(rng);
        snap.sep_fast = small(rng);
        snap.sep_mid = small(rng);
        snap.dsep_fast_5 = small(rng);
        snap.dsep_mid_5 = small(rng);
        snap.atr = wide(rng);
        snap.atr_mean_20 = wide(rng);
        snap.adx = wide(rng);
        snap.adx_slope_10 = wide(rng);
        snap.rsi_slope_10 = wide(rng);
        snap.vo_z = wide(rng);
        snap.vo_z_cluster = (i % 2) == 0;

        core::CompressionBaselines frozen;
        frozen.atr_norm_baseline = small(rng);
        frozen.sep_fast_start = small(rng);
        frozen.sep_mid_start = small(rng);
        frozen.adx_baseline = wide(rng);
        frozen.compression_index = small(rng);

        auto scores = CompositeScorer::scoreBreakout(snap, frozen, small(rng), wide(rng), params);
        for (const auto& kv : scores.toMap()) {
            assert(inUnit(kv.second));
        }
        assert(inUnit(CompositeScorer::trendStrength(snap, params)));

        auto comp = CompositeScorer::computeCompression(snap, {}, params);
        assert(inUnit(comp.baselines.compression_index));
    }
}
} // namespace

int main() {
    testSigmoidAndGate();
    testBreakoutDetection();
    testSrFlip();
    testCompressionAndHalo();
    testLastSupportBelowBreakout();
    testScoreClippingFuzz();

    std::cout << "[TEST] CompositeScorer PASSED\n";
    return 0;
}
