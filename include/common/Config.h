#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace trendphase {

class Config {
public:
    static Config& getInstance();

    // 파일이 없거나 키가 없으면 기본값 유지
    void load(const std::string& config_path);
    // 이미 파싱된 문서 적용 (load 내부, 테스트)
    void apply(const nlohmann::json& j);
    // 모든 값을 기본값으로
    void reset();

    // 완성된 엔진 설정 (불변 값으로 복사해 전달)
    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getLogLevel() const { return engine_config_.log_level; }
    std::string getLogDir() const { return engine_config_.log_dir; }
    bool isLoaded() const { return loaded_; }

private:
    Config() = default;

    // TRENDPHASE_DATA_DIR 가 있으면 저장소 경로를 그 아래로
    void applyDataDirOverride();

    engine::EngineConfig engine_config_;
    bool loaded_ = false;
};

} // namespace trendphase
