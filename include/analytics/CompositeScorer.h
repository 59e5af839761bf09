#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace analytics {

// 지표 델타 → 0~1 점수. 모든 함수는 순수 함수
class CompositeScorer {
public:
    // 1 / (1 + e^(-x/k)), k 는 1e-9 하한
    static double sigmoid(double x, double k);
    static double clip01(double x);

    // ADX 가 floor 미만이면 ADX-slope 항은 0
    static double gatedAdxTerm(const core::IndicatorSnapshot& snap, const engine::PhaseParams& params);

    // ===== S0 =====
    struct CompressionResult {
        core::CompressionBaselines baselines;
        double atr_norm_slope;
        bool regression_used;   // false 이면 atr_mean_20 근사

        CompressionResult() : atr_norm_slope(0), regression_used(false) {}
    };
    static CompressionResult computeCompression(const core::IndicatorSnapshot& snap,
                                                const std::vector<Candle>& bars,
                                                const engine::PhaseParams& params);

    // S0 → S1 조건: ema20 slope > 0, dsep_fast_5 > 0, ATR > mean, volume cluster
    static bool detectBreakout(const core::IndicatorSnapshot& snap);

    // ===== S1 =====
    struct SrFlipResult {
        double base_sr_level;
        std::vector<core::FlippedLevel> flipped;   // 가격 내림차순
        double sr_flip_score;

        SrFlipResult() : base_sr_level(0), sr_flip_score(0) {}
    };
    static SrFlipResult cacheSrFlip(const std::vector<core::SrLevel>& levels,
                                    double breakout_price,
                                    double prev_close,
                                    long long ts_ms,
                                    const engine::PhaseParams& params);

    // 최근 lookback 봉에서 지지가 확인된 breakout 아래 최고 레벨, 없으면 최저 저가
    static double lastSupportBelowBreakout(const std::vector<core::SrLevel>& levels,
                                           const std::vector<Candle>& bars,
                                           double breakout_price,
                                           int lookback);

    struct BreakoutScores {
        double flow_flip_integrity;
        double expansion_quality;
        double volume_cluster;
        double momentum_drive;
        double sr_flip_score;
        double breakout_strength_base;
        double breakout_strength;

        BreakoutScores()
            : flow_flip_integrity(0), expansion_quality(0), volume_cluster(0)
            , momentum_drive(0), sr_flip_score(0), breakout_strength_base(0)
            , breakout_strength(0) {}

        std::map<std::string, double> toMap() const;
    };
    static BreakoutScores scoreBreakout(const core::IndicatorSnapshot& snap,
                                        const core::CompressionBaselines& frozen,
                                        double sr_flip_score,
                                        double close,
                                        const engine::PhaseParams& params);

    // RSI slope 0.6 + ADX slope(게이트) 0.4
    static double trendStrength(const core::IndicatorSnapshot& snap, const engine::PhaseParams& params);

    // max(0.5 * ATR, 0.03 * price)
    static double halo(double atr, double price, const engine::PhaseParams& params);
};

} // namespace analytics
} // namespace trendphase
