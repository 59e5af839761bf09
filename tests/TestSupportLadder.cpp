#include "analytics/CompositeScorer.h"
#include "analytics/SupportLadder.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace trendphase;
using analytics::CompositeScorer;
using analytics::SupportLadder;

namespace {
constexpr long long kT0 = 1700000000000LL;

Candle bar(int i, double close, double low) {
    Candle c;
    c.timestamp = kT0 + static_cast<long long>(i) * kBarIntervalMs;
    c.open = close;
    c.high = close + 2.0;
    c.low = low;
    c.close = close;
    c.volume = 500.0;
    return c;
}

// flipped 120, 110 + base 100
core::BreakoutArtifacts artifacts() {
    core::BreakoutArtifacts s1;
    s1.base_sr_level = 100.0;
    core::FlippedLevel a;
    a.level = 110.0;
    core::FlippedLevel b;
    b.level = 120.0;
    s1.flipped_sr_levels = {a, b};
    return s1;
}

core::IndicatorSnapshot strongSnapshot() {
    core::IndicatorSnapshot snap;
    snap.valid = true;
    snap.ema20 = 118.0;
    snap.ema60 = 112.0;
    snap.ema144 = 105.0;
    snap.ema250 = 98.0;
    snap.ema333 = 95.0;
    snap.ema60_slope = 0.01;
    snap.ema144_slope = 0.01;
    snap.ema250_slope = 0.01;
    snap.ema333_slope = 0.01;
    snap.atr = 2.0;
    snap.atr_mean_20 = 2.0;
    snap.adx = 25.0;
    snap.adx_slope_10 = 3.0;
    snap.rsi_slope_10 = 5.0;
    return snap;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-12;
}

void testTierOrdering() {
    auto s1 = artifacts();
    s1.flipped_sr_levels.push_back(s1.flipped_sr_levels.front());   // 중복
    auto tiers = SupportLadder::buildTiers(s1);
    assert(tiers.size() == 3);
    assert(tiers[0] == 120.0);
    assert(tiers[1] == 110.0);
    assert(tiers[2] == 100.0);
}

void testActivation() {
    engine::PhaseParams params;
    SupportLadder ladder(params);
    auto s1 = artifacts();

    // 최상단 tier 120 터치 (low 122 <= 120 + halo) 후 125 종가
    std::vector<Candle> bars = {bar(0, 130.0, 128.0), bar(1, 125.0, 122.0)};
    auto lr = ladder.update(core::SupportLadderState(), s1, strongSnapshot(), bars);
    assert(lr.activated);
    assert(lr.state.tier_index == 0);
    assert(lr.state.current_sr == 120.0);
    assert(lr.state.t0_ms == bars.back().timestamp);
    assert(lr.touch_confirm == 1.0);
    assert(lr.uptrend_holding);

    // 터치 없으면 비활성 유지
    std::vector<Candle> far = {bar(0, 140.0, 139.0)};
    auto idle = ladder.update(core::SupportLadderState(), s1, strongSnapshot(), far);
    assert(!idle.activated);
    assert(!idle.state.active());
    assert(idle.support_persistence == 0.0);
}

// tier 1 (110) 에서 종가가 아래로 → tier 2 (base 100), dent 적용
void testStepDownDent() {
    engine::PhaseParams params;
    SupportLadder ladder(params);
    auto s1 = artifacts();

    core::SupportLadderState prev;
    prev.tier_index = 1;
    prev.current_sr = 110.0;
    prev.t0_ms = kT0;

    std::vector<Candle> bars = {bar(0, 112.0, 109.0), bar(1, 111.0, 108.0), bar(2, 105.0, 103.0)};
    auto lr = ladder.update(prev, s1, strongSnapshot(), bars);

    assert(lr.stepped_down);
    assert(!lr.reclaimed);
    assert(lr.state.tier_index == 2);
    assert(lr.state.current_sr == 100.0);
    assert(lr.at_base);
    assert(near(lr.trend_integrity, CompositeScorer::clip01(lr.trend_integrity_pre * 0.4)));
    assert(near(lr.trend_strength, CompositeScorer::clip01(lr.trend_strength_pre * 0.6)));
    assert(lr.trend_integrity < lr.trend_integrity_pre || lr.trend_integrity_pre == 0.0);
}

// base 에서 한 단계 위 tier 재탈환 → reclaim 배수
void testReclaim() {
    engine::PhaseParams params;
    SupportLadder ladder(params);
    auto s1 = artifacts();

    core::SupportLadderState prev;
    prev.tier_index = 2;
    prev.current_sr = 100.0;
    prev.t0_ms = kT0;

    std::vector<Candle> bars = {bar(0, 101.0, 99.0), bar(1, 104.0, 100.5), bar(2, 112.0, 108.0)};
    auto lr = ladder.update(prev, s1, strongSnapshot(), bars);

    assert(lr.reclaimed);
    assert(!lr.stepped_down);
    assert(lr.state.tier_index == 1);
    assert(lr.state.current_sr == 110.0);
    assert(near(lr.trend_integrity, CompositeScorer::clip01(lr.trend_integrity_pre * 1.3)));
    assert(near(lr.trend_strength, CompositeScorer::clip01(lr.trend_strength_pre * 1.6)));
}

// 한 사이클에 한 칸만 이동
void testSingleStepPerCycle() {
    engine::PhaseParams params;
    SupportLadder ladder(params);
    auto s1 = artifacts();

    core::SupportLadderState prev;
    prev.tier_index = 0;
    prev.current_sr = 120.0;
    prev.t0_ms = kT0;

    std::vector<Candle> bars = {bar(0, 121.0, 119.0), bar(1, 95.0, 94.0)};
    auto lr = ladder.update(prev, s1, strongSnapshot(), bars);
    assert(lr.stepped_down);
    assert(lr.state.tier_index == 1);
    assert(!lr.uptrend_holding);
}

void testScoresInRange() {
    engine::PhaseParams params;
    SupportLadder ladder(params);

    core::IndicatorSnapshot flat;
    assert(ladder.volatilityCoherence(flat) == 0.5);

    auto snap = strongSnapshot();
    double align = ladder.emaAlignment(snap);
    assert(align > 0.0 && align <= 1.0);

    std::vector<Candle> bars = {bar(0, 130.0, 128.0), bar(1, 125.0, 122.0)};
    auto lr = ladder.update(core::SupportLadderState(), artifacts(), snap, bars);
    for (const auto& kv : lr.scores()) {
        assert(kv.second >= 0.0 && kv.second <= 1.0);
    }
}
} // namespace

int main() {
    testTierOrdering();
    testActivation();
    testStepDownDent();
    testReclaim();
    testSingleStepPerCycle();
    testScoresInRange();

    std::cout << "[TEST] SupportLadder PASSED\n";
    return 0;
}
