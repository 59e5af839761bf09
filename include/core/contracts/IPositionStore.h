#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/model/PhaseTypes.h"

namespace trendphase {
namespace core {

// 포지션 system-of-record. payload + meta 는 한 번에 교체
class IPositionStore {
public:
    virtual ~IPositionStore() = default;

    virtual std::vector<PositionRef> listActive() = 0;
    virtual std::optional<PositionRecord> load(const std::string& id) = 0;
    virtual bool save(const std::string& id, const EnginePayload& payload, const EngineMeta& meta) = 0;
};

} // namespace core
} // namespace trendphase
