#pragma once

#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace engine {

// 플래그 지속성: value >= on_threshold 이면 on 카운트, < off_threshold 이면 off 카운트,
// 그 사이 구간은 두 카운트 모두 유지. on_bars/off_bars 연속 시 전환
core::HysteresisState updateHysteresis(const core::HysteresisState& previous,
                                       double value,
                                       const HysteresisConfig& config);

} // namespace engine
} // namespace trendphase
