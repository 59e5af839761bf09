#include "engine/Hysteresis.h"

#include <cassert>
#include <iostream>

int main() {
    using namespace trendphase;

    engine::HysteresisConfig config;    // on 0.70 / off 0.60, 3 samples

    // 1. [0.75, 0.75, 0.75] → 세 번째 샘플에서 on
    core::HysteresisState state;
    state = engine::updateHysteresis(state, 0.75, config);
    assert(!state.active);
    state = engine::updateHysteresis(state, 0.75, config);
    assert(!state.active);
    state = engine::updateHysteresis(state, 0.75, config);
    assert(state.active);
    assert(state.on_count == 3);

    // 2. 이어서 [0.55, 0.55, 0.55] → 세 번째 샘플에서 off
    state = engine::updateHysteresis(state, 0.55, config);
    assert(state.active);
    assert(state.on_count == 0);
    state = engine::updateHysteresis(state, 0.55, config);
    assert(state.active);
    state = engine::updateHysteresis(state, 0.55, config);
    assert(!state.active);

    // 3. 중간 구간 값은 카운트를 유지 (리셋하지 않음)
    core::HysteresisState mid;
    mid = engine::updateHysteresis(mid, 0.80, config);
    mid = engine::updateHysteresis(mid, 0.65, config);
    assert(mid.on_count == 1);
    mid = engine::updateHysteresis(mid, 0.80, config);
    mid = engine::updateHysteresis(mid, 0.80, config);
    assert(mid.active);

    // 4. on 중 하나라도 off 이하가 끼면 on 연속이 끊김
    core::HysteresisState broken;
    broken = engine::updateHysteresis(broken, 0.90, config);
    broken = engine::updateHysteresis(broken, 0.90, config);
    broken = engine::updateHysteresis(broken, 0.10, config);
    broken = engine::updateHysteresis(broken, 0.90, config);
    assert(!broken.active);
    assert(broken.on_count == 1);
    assert(broken.last_value == 0.90);

    std::cout << "[TEST] Hysteresis PASSED\n";
    return 0;
}
