#pragma once

#include <optional>
#include <string>

#include "core/model/PhaseTypes.h"

namespace trendphase {
namespace core {

class IIndicatorSource {
public:
    virtual ~IIndicatorSource() = default;

    // ts <= as_of_ms 인 최신 스냅샷
    virtual std::optional<IndicatorSnapshot> latest(const std::string& contract,
                                                    const std::string& chain,
                                                    long long as_of_ms) = 0;
};

} // namespace core
} // namespace trendphase
