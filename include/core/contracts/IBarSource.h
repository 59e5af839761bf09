#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace trendphase {
namespace core {

class IBarSource {
public:
    virtual ~IBarSource() = default;

    // 시간순 OHLCV, timestamp <= as_of_ms, 최근 limit 개
    virtual std::vector<Candle> bars(const std::string& contract,
                                     const std::string& chain,
                                     const std::string& timeframe,
                                     long long as_of_ms,
                                     int limit) = 0;
};

} // namespace core
} // namespace trendphase
