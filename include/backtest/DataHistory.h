#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace trendphase {
namespace backtest {

class DataHistory {
public:
    // Load 1h candles from a CSV file
    // Expected format: timestamp_ms,open,high,low,close,volume
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // timestamp <= as_of_ms 인 최근 limit 개 (limit <= 0 이면 전체)
    static std::vector<Candle> filterUntil(const std::vector<Candle>& candles,
                                           long long as_of_ms,
                                           int limit);
};

} // namespace backtest
} // namespace trendphase
