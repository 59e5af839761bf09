#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace analytics {

struct LadderResult {
    core::SupportLadderState state;
    std::vector<double> tiers;      // 가격 내림차순, base 가 마지막

    double halo = 0.0;
    bool activated = false;
    bool stepped_down = false;
    bool reclaimed = false;
    bool at_base = false;

    // persistence 구성 요소
    double touch_confirm = 0.0;
    double reaction_quality = 0.0;
    double close_persistence = 0.0;
    double absorption_wicks = 0.0;
    double support_persistence = 0.0;

    double ema_alignment = 0.0;
    double volatility_coherence = 0.0;

    // tier 배수 적용 후, dent/reclaim 적용 전
    double trend_integrity_pre = 0.0;
    double trend_strength_pre = 0.0;

    double trend_integrity = 0.0;
    double trend_strength = 0.0;

    bool uptrend_holding = false;

    std::map<std::string, double> scores() const;
};

// S2 동적 지지 사다리
// 포인터는 사이클당 최대 한 칸 이동 (step-down 우선, 없을 때만 reclaim)
class SupportLadder {
public:
    explicit SupportLadder(const engine::PhaseParams& params);

    // flipped(내림차순) + base, 중복/0 이하 제거
    static std::vector<double> buildTiers(const core::BreakoutArtifacts& s1);

    LadderResult update(const core::SupportLadderState& previous,
                        const core::BreakoutArtifacts& s1,
                        const core::IndicatorSnapshot& snap,
                        const std::vector<Candle>& bars) const;

    double emaAlignment(const core::IndicatorSnapshot& snap) const;
    double volatilityCoherence(const core::IndicatorSnapshot& snap) const;

private:
    void scorePersistence(LadderResult& result,
                          const core::IndicatorSnapshot& snap,
                          const std::vector<Candle>& bars) const;

    engine::PhaseParams params_;
};

} // namespace analytics
} // namespace trendphase
