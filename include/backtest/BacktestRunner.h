#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IBarSource.h"
#include "core/contracts/IGeometrySource.h"
#include "core/contracts/IIndicatorSource.h"
#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace backtest {

// 한 자산을 과거 as-of 시점들로 재실행 (새 인메모리 포지션)
class BacktestRunner {
public:
    struct TimelineEntry {
        long long as_of_ms = 0;
        bool updated = false;
        core::Phase state = core::Phase::S0;
        std::vector<core::PhaseEventType> events;
        std::map<std::string, double> scores;
        bool emergency_exit = false;
    };

    struct Result {
        std::string chain;
        std::string contract;
        long long from_ms = 0;
        long long to_ms = 0;
        long long step_ms = 0;
        int cycles = 0;
        int updated = 0;
        int skipped_no_data = 0;
        int transitions = 0;
        std::optional<core::Phase> final_state;
        std::map<std::string, int> state_counts;
        std::map<std::string, int> event_counts;
        std::vector<TimelineEntry> timeline;
    };

    BacktestRunner(std::shared_ptr<core::IIndicatorSource> indicators,
                   std::shared_ptr<core::IGeometrySource> geometry,
                   std::shared_ptr<core::IBarSource> bars,
                   const engine::EngineConfig& config);

    // step_ms <= 0 이면 bar_interval_ms
    Result run(const std::string& chain, const std::string& contract,
               long long from_ms, long long to_ms, long long step_ms) const;

    static nlohmann::json toJson(const Result& result);

private:
    std::shared_ptr<core::IIndicatorSource> indicators_;
    std::shared_ptr<core::IGeometrySource> geometry_;
    std::shared_ptr<core::IBarSource> bars_;
    engine::EngineConfig config_;
};

} // namespace backtest
} // namespace trendphase
