#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace engine {

// 한 포지션, 한 as-of 시점의 입력
struct PhaseInput {
    std::string contract;
    std::string chain;
    long long as_of_ms = 0;

    std::optional<core::EnginePayload> previous;    // 없으면 bootstrap
    core::EngineMeta meta;

    core::IndicatorSnapshot indicators;
    std::vector<core::SrLevel> levels;
    std::vector<Candle> bars;                       // 시간순, timestamp <= as_of
};

struct PhaseResult {
    core::EnginePayload payload;
    core::EngineMeta meta;
    std::vector<core::PhaseEventType> events;
    bool transitioned = false;          // 이전 상태와 다름 (bootstrap 포함)
    bool emergency_changed = false;     // emergency_exit on/off 전환
};

// S0 → S1 → S2 → S3, S3 는 S0 로만 이탈
// 상태별 handler 하나씩, 모든 (state, input) 조합에 대해 결과를 반환
class PhaseStateMachine {
public:
    // bars 가 비어 있으면 std::invalid_argument
    static PhaseResult transition(const PhaseInput& input, const PhaseParams& params);
};

} // namespace engine
} // namespace trendphase
