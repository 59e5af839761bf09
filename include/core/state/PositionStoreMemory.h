#pragma once

#include <map>
#include <mutex>
#include <optional>

#include "core/contracts/IPositionStore.h"

namespace trendphase {
namespace core {

// 백테스트 / 테스트용 인메모리 저장소
class PositionStoreMemory : public IPositionStore {
public:
    std::vector<PositionRef> listActive() override;
    std::optional<PositionRecord> load(const std::string& id) override;
    bool save(const std::string& id, const EnginePayload& payload, const EngineMeta& meta) override;

    void upsert(const PositionRecord& record);

private:
    std::mutex mutex_;
    std::map<std::string, PositionRecord> records_;
};

} // namespace core
} // namespace trendphase
