#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace trendphase {
namespace analytics {

double TechnicalIndicators::linearSlope(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < 2) {
        return 0.0;
    }

    double x_mean = (static_cast<double>(n) - 1.0) / 2.0;
    double y_mean = calculateMean(values);

    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = static_cast<double>(i) - x_mean;
        num += dx * (values[i] - y_mean);
        den += dx * dx;
    }

    if (den <= 0.0) return 0.0;
    return num / den;
}

// Anchored VWAP 계산 (앵커 봉 포함)
TechnicalIndicators::AnchoredVWAP TechnicalIndicators::calculateAnchoredVWAP(
    const std::vector<Candle>& candles,
    long long anchor_ts_ms,
    int slope_window
) {
    AnchoredVWAP result;

    double pv_sum = 0.0;
    double v_sum = 0.0;
    for (const auto& candle : candles) {
        if (candle.timestamp < anchor_ts_ms) {
            continue;
        }
        double v = std::max(0.0, candle.volume);
        pv_sum += candle.close * v;
        v_sum += v;
        // 거래량이 없으면 종가로 대체
        result.series.push_back(v_sum > 0.0 ? pv_sum / v_sum : candle.close);
    }

    if (result.series.empty()) {
        return result;
    }

    result.avwap = result.series.back();

    size_t window = static_cast<size_t>(std::max(slope_window, 2));
    size_t start = result.series.size() > window ? result.series.size() - window : 0;
    std::vector<double> tail(result.series.begin() + start, result.series.end());

    if (tail.size() >= 2 && result.avwap > 0.0) {
        result.slope_norm = linearSlope(tail) / result.avwap;
    }
    return result;
}

double TechnicalIndicators::trueRange(const Candle& current, const Candle& prev) {
    double tr1 = current.high - current.low;
    double tr2 = std::abs(current.high - prev.close);
    double tr3 = std::abs(current.low - prev.close);
    return std::max({tr1, tr2, tr3});
}

int TechnicalIndicators::countClosesBelow(const std::vector<Candle>& candles, double level, int window) {
    if (window <= 0) return 0;
    size_t start = candles.size() > static_cast<size_t>(window) ? candles.size() - window : 0;
    int count = 0;
    for (size_t i = start; i < candles.size(); ++i) {
        if (candles[i].close < level) ++count;
    }
    return count;
}

int TechnicalIndicators::countClosesAbove(const std::vector<Candle>& candles, double level, int window) {
    if (window <= 0) return 0;
    size_t start = candles.size() > static_cast<size_t>(window) ? candles.size() - window : 0;
    int count = 0;
    for (size_t i = start; i < candles.size(); ++i) {
        if (candles[i].close > level) ++count;
    }
    return count;
}

bool TechnicalIndicators::rangeNormSlope(
    const std::vector<Candle>& candles,
    double ema50,
    int bars,
    double& out_slope
) {
    if (ema50 <= 0.0 || bars < 2 || candles.size() < static_cast<size_t>(bars)) {
        return false;
    }

    std::vector<double> norms;
    norms.reserve(bars);
    for (size_t i = candles.size() - bars; i < candles.size(); ++i) {
        const auto& c = candles[i];
        double range = c.high > c.low ? c.high - c.low : 0.0;
        norms.push_back(range / ema50);
    }

    out_slope = linearSlope(norms);
    return true;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

bool TechnicalIndicators::isWellFormed(const Candle& candle) {
    return std::isfinite(candle.open) && std::isfinite(candle.high) &&
           std::isfinite(candle.low) && std::isfinite(candle.close) &&
           std::isfinite(candle.volume) && candle.close > 0.0;
}

} // namespace analytics
} // namespace trendphase
