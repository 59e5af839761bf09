#pragma once

#include "common/Types.h"
#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace trendphase {
namespace analytics {

// S3 운영 구간 오실레이터
//   OX  - overextension (레일 이격 + 확장 + ATR surge)
//   DX  - discount (EMA144~EMA333 hallway 내 위치 + exhaustion + relief)
//   EDX - exhaustion/decay (slow 곡률, 구조 붕괴, 참여 감소, 변동성 비대칭, geometry)
struct OscillatorResult {
    double ox = 0.0;
    double dx = 0.0;
    double edx = 0.0;       // smoothing 후
    double edx_raw = 0.0;
    bool dx_flag = false;   // close <= EMA144
    core::RegimeState regime;
    std::map<std::string, double> diagnostics;
};

class RegimeOscillators {
public:
    explicit RegimeOscillators(const engine::PhaseParams& params);

    OscillatorResult evaluate(const core::IndicatorSnapshot& snap,
                              const std::vector<Candle>& bars,
                              const std::optional<core::RegimeState>& previous,
                              const std::string& asset_key) const;

    // 최근 edx_lookback_bars 봉 기준 raw EDX (0~1)
    double computeEdxRaw(const core::IndicatorSnapshot& snap,
                         const std::vector<Candle>& bars,
                         std::map<std::string, double>& diagnostics) const;

    // EMA(span) smoothing. 이전 상태가 없거나 asset key 가 다르면 raw 로 리셋
    core::RegimeState smoothEdx(double edx_raw,
                                const std::optional<core::RegimeState>& previous,
                                const std::string& asset_key) const;

    double computeOx(const core::IndicatorSnapshot& snap, double px, double edx,
                     std::map<std::string, double>& diagnostics) const;
    double computeDx(const core::IndicatorSnapshot& snap, double px, double edx,
                     std::map<std::string, double>& diagnostics) const;

    static std::string assetKey(const std::string& chain, const std::string& contract);

private:
    engine::PhaseParams params_;
};

} // namespace analytics
} // namespace trendphase
