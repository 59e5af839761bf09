#include "analytics/RegimeOscillators.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace trendphase;
using analytics::RegimeOscillators;

namespace {
std::vector<Candle> trendBars(int count, double start, double step) {
    std::vector<Candle> bars;
    for (int i = 0; i < count; ++i) {
        Candle c;
        c.timestamp = 1700000000000LL + static_cast<long long>(i) * kBarIntervalMs;
        c.close = start + step * i;
        c.open = c.close - step;
        c.high = c.close + 0.5;
        c.low = c.open - 0.5;
        c.volume = 100.0;
        bars.push_back(c);
    }
    return bars;
}

core::IndicatorSnapshot s3Snapshot() {
    core::IndicatorSnapshot snap;
    snap.valid = true;
    snap.ema20 = 150.0;
    snap.ema60 = 140.0;
    snap.ema144 = 125.0;
    snap.ema250 = 115.0;
    snap.ema333 = 110.0;
    snap.ema20_slope = 0.002;
    snap.ema250_slope = 0.001;
    snap.ema333_slope = 0.001;
    snap.atr = 3.0;
    snap.atr_mean_20 = 3.0;
    snap.adx = 22.0;
    snap.adx_slope_10 = 1.0;
    snap.rsi_slope_10 = 1.0;
    return snap;
}

bool inUnit(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

void testEvaluateRanges() {
    engine::PhaseParams params;
    RegimeOscillators osc(params);
    auto bars = trendBars(60, 100.0, 1.0);
    auto result = osc.evaluate(s3Snapshot(), bars, std::nullopt, "solana:TOKEN");

    assert(inUnit(result.ox));
    assert(inUnit(result.dx));
    assert(inUnit(result.edx));
    assert(inUnit(result.edx_raw));
    assert(!result.dx_flag);
    assert(result.regime.asset_key == "solana:TOKEN");
    assert(result.diagnostics.count("edx_slow") == 1);
    assert(result.diagnostics.count("rail_fast") == 1);
    assert(result.diagnostics.count("dx_location") == 1);
}

// 이전 상태가 없거나 asset key 가 다르면 raw 로 리셋
void testEdxResetOnKeyChange() {
    engine::PhaseParams params;
    RegimeOscillators osc(params);

    auto fresh = osc.smoothEdx(0.8, std::nullopt, "eth:A");
    assert(fresh.edx_ema == 0.8);

    core::RegimeState other;
    other.edx_ema = 0.1;
    other.asset_key = "eth:B";
    auto reset = osc.smoothEdx(0.8, other, "eth:A");
    assert(reset.edx_ema == 0.8);
    assert(reset.asset_key == "eth:A");

    core::RegimeState same;
    same.edx_ema = 0.2;
    same.asset_key = "eth:A";
    auto smoothed = osc.smoothEdx(0.8, same, "eth:A");
    const double alpha = 2.0 / 21.0;
    assert(std::abs(smoothed.edx_ema - (alpha * 0.8 + (1.0 - alpha) * 0.2)) < 1e-12);
}

// EMA333 근처 (깊은 할인) 에서 DX 가 EMA144 근처보다 높음
void testDxLocation() {
    engine::PhaseParams params;
    RegimeOscillators osc(params);
    auto snap = s3Snapshot();

    std::map<std::string, double> deep_diag;
    std::map<std::string, double> shallow_diag;
    double deep = osc.computeDx(snap, 111.0, 0.0, deep_diag);
    double shallow = osc.computeDx(snap, 124.0, 0.0, shallow_diag);
    assert(deep_diag["dx_location"] > shallow_diag["dx_location"]);
    assert(deep > shallow);

    // EDX 가 높으면 DX 억제
    std::map<std::string, double> diag;
    double suppressed = osc.computeDx(snap, 111.0, 1.0, diag);
    assert(suppressed < deep);
}

// 높은 EDX 는 OX 를 증폭
void testOxBoost() {
    engine::PhaseParams params;
    RegimeOscillators osc(params);
    auto snap = s3Snapshot();

    std::map<std::string, double> diag;
    double base = osc.computeOx(snap, 140.0, 0.0, diag);
    double boosted = osc.computeOx(snap, 140.0, 1.0, diag);
    assert(boosted >= base);
    assert(std::abs(boosted - std::min(1.0, base * 1.33)) < 1e-9);
}
} // namespace

int main() {
    testEvaluateRanges();
    testEdxResetOnKeyChange();
    testDxLocation();
    testOxBoost();

    std::cout << "[TEST] RegimeOscillators PASSED\n";
    return 0;
}
