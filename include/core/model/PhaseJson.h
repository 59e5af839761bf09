#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "core/model/PhaseTypes.h"

namespace trendphase {
namespace core {

// 공개 페이로드 (features.uptrend_engine)
nlohmann::json payloadToJson(const EnginePayload& payload);
EnginePayload payloadFromJson(const nlohmann::json& raw);

// 내부 메타 (features.uptrend_engine_meta)
nlohmann::json metaToJson(const EngineMeta& meta);
EngineMeta metaFromJson(const nlohmann::json& raw);

// 상류 계약: "ta" 블록 {ema, ema_slopes, separations, atr, momentum, volume}
IndicatorSnapshot indicatorsFromJson(const nlohmann::json& ta);
nlohmann::json indicatorsToJson(const IndicatorSnapshot& snapshot);

// 상류 계약: sr_levels 배열
std::vector<SrLevel> levelsFromJson(const nlohmann::json& sr_levels);

} // namespace core
} // namespace trendphase
