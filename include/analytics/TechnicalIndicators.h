#pragma once

#include <vector>
#include <string>
#include "common/Types.h"

namespace trendphase {
namespace analytics {

// 봉 단위 보조 계산 - 지표 자체(EMA/ATR/ADX)는 상류 파이프라인이 제공
class TechnicalIndicators {
public:
    // 최소제곱 선형회귀 기울기 (x = 0..n-1), 2개 미만이면 0
    static double linearSlope(const std::vector<double>& values);

    // Anchored VWAP - 앵커 봉부터 누적 (close * volume) / volume
    struct AnchoredVWAP {
        double avwap;           // 최신 AVWAP
        double slope_norm;      // 최근 10개 AVWAP 기울기 / avwap
        std::vector<double> series;

        AnchoredVWAP() : avwap(0), slope_norm(0) {}
    };
    static AnchoredVWAP calculateAnchoredVWAP(const std::vector<Candle>& candles,
                                              long long anchor_ts_ms,
                                              int slope_window = 10);

    // True Range (전봉 종가 기준)
    static double trueRange(const Candle& current, const Candle& prev);

    // 최근 window 개 종가 중 level 아래/위 개수
    static int countClosesBelow(const std::vector<Candle>& candles, double level, int window);
    static int countClosesAbove(const std::vector<Candle>& candles, double level, int window);

    // 정규화 ATR 기울기: (high-low)/ema50 의 bars 개 선형회귀
    // 봉이 부족하거나 ema50 <= 0 이면 false
    static bool rangeNormSlope(const std::vector<Candle>& candles, double ema50, int bars, double& out_slope);

    static double calculateMean(const std::vector<double>& values);

    // 입력 검증: 유한값이고 close > 0
    static bool isWellFormed(const Candle& candle);
};

} // namespace analytics
} // namespace trendphase
