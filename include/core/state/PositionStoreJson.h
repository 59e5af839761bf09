#pragma once

#include <filesystem>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IPositionStore.h"

namespace trendphase {
namespace core {

// 단일 JSON 문서 기반 포지션 저장소
// {"schema_version":1,"positions":[{id, token_contract, token_chain, status,
//   features:{uptrend_engine, uptrend_engine_meta}}]}
class PositionStoreJson : public IPositionStore {
public:
    explicit PositionStoreJson(std::filesystem::path file_path);

    std::vector<PositionRef> listActive() override;
    std::optional<PositionRecord> load(const std::string& id) override;
    bool save(const std::string& id, const EnginePayload& payload, const EngineMeta& meta) override;

    // 포지션 등록 또는 교체 (payload 없으면 bootstrap 대상)
    bool upsert(const PositionRecord& record);

private:
    nlohmann::json readDocument() const;
    bool writeDocument(const nlohmann::json& document) const;

    std::filesystem::path file_path_;
    std::mutex mutex_;
};

} // namespace core
} // namespace trendphase
