#pragma once

#include <string>
#include <vector>

#include "core/model/PhaseTypes.h"

namespace trendphase {
namespace core {

class IGeometrySource {
public:
    virtual ~IGeometrySource() = default;

    virtual std::vector<SrLevel> levels(const std::string& contract,
                                        const std::string& chain,
                                        long long as_of_ms) = 0;
};

} // namespace core
} // namespace trendphase
