#pragma once

#include <chrono>

namespace trendphase {

// 1h 봉 간격 (ms)
constexpr long long kBarIntervalMs = 3600LL * 1000LL;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;   // epoch ms, 봉 시작 시각

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace trendphase
