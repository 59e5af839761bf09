#pragma once

#include <optional>

#include "common/Types.h"
#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace engine {

// S3 사이클 전용 EMA333 kill-switch
// close < EMA333 이면 즉시 플래그, bounce window(6봉) 동안 행동 제안
class EmergencyExit {
public:
    struct Update {
        std::optional<core::EmergencyExitFlag> flag;
        std::optional<core::EmergencyExitState> meta;
        bool activated = false;
        bool deactivated = false;
    };

    static Update evaluate(bool previously_active,
                           const std::optional<core::EmergencyExitState>& previous_meta,
                           const Candle& last,
                           const core::IndicatorSnapshot& snap,
                           long long as_of_ms,
                           const PhaseParams& params);

    // S3 → S0 (10봉 중 8봉 EMA333 아래) 확정 시 플래그
    static core::EmergencyExitFlag persistentDowntrend(const Candle& last,
                                                       const core::IndicatorSnapshot& snap,
                                                       long long as_of_ms,
                                                       int below_count,
                                                       const PhaseParams& params);

    static constexpr const char* kReasonCloseBelow = "close_below_ema333";
    static constexpr const char* kReasonPersistent = "persistent_downtrend";
};

} // namespace engine
} // namespace trendphase
