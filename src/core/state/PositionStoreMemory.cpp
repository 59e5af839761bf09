#include "core/state/PositionStoreMemory.h"

namespace trendphase {
namespace core {

std::vector<PositionRef> PositionStoreMemory::listActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PositionRef> refs;
    for (const auto& kv : records_) {
        if (kv.second.status == "active") {
            refs.push_back({kv.second.id, kv.second.contract, kv.second.chain});
        }
    }
    return refs;
}

std::optional<PositionRecord> PositionStoreMemory::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PositionStoreMemory::save(const std::string& id, const EnginePayload& payload, const EngineMeta& meta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    it->second.payload = payload;
    it->second.meta = meta;
    return true;
}

void PositionStoreMemory::upsert(const PositionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.id] = record;
}

} // namespace core
} // namespace trendphase
