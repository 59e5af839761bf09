#include "backtest/BacktestRunner.h"

#include <stdexcept>

#include "common/Logger.h"
#include "core/orchestration/PhaseCycleCoordinator.h"
#include "core/state/PositionStoreMemory.h"

namespace trendphase {
namespace backtest {

BacktestRunner::BacktestRunner(std::shared_ptr<core::IIndicatorSource> indicators,
                               std::shared_ptr<core::IGeometrySource> geometry,
                               std::shared_ptr<core::IBarSource> bars,
                               const engine::EngineConfig& config)
    : indicators_(std::move(indicators))
    , geometry_(std::move(geometry))
    , bars_(std::move(bars))
    , config_(config) {}

BacktestRunner::Result BacktestRunner::run(const std::string& chain, const std::string& contract,
                                           long long from_ms, long long to_ms,
                                           long long step_ms) const {
    if (to_ms < from_ms) {
        throw std::invalid_argument("backtest range is empty (to < from)");
    }
    if (step_ms <= 0) {
        step_ms = config_.phase.bar_interval_ms;
    }

    Result result;
    result.chain = chain;
    result.contract = contract;
    result.from_ms = from_ms;
    result.to_ms = to_ms;
    result.step_ms = step_ms;

    auto store = std::make_shared<core::PositionStoreMemory>();
    core::PositionRecord record;
    record.id = "backtest:" + chain + ":" + contract;
    record.contract = contract;
    record.chain = chain;
    store->upsert(record);

    core::PhaseCycleCoordinator coordinator(store, indicators_, geometry_, bars_,
                                            nullptr, nullptr, config_);
    const core::PositionRef ref{record.id, contract, chain};

    LOG_INFO("Backtest {}:{} from {} to {} step {} ms", chain, contract, from_ms, to_ms, step_ms);

    for (long long as_of = from_ms; as_of <= to_ms; as_of += step_ms) {
        ++result.cycles;
        auto report = coordinator.runPosition(ref, as_of);

        TimelineEntry entry;
        entry.as_of_ms = as_of;
        if (report.outcome != core::CycleOutcome::UPDATED) {
            ++result.skipped_no_data;
            result.timeline.push_back(std::move(entry));
            continue;
        }

        ++result.updated;
        entry.updated = true;
        entry.state = report.to_state;
        entry.events = report.events;

        auto saved = store->load(record.id);
        if (saved && saved->payload) {
            entry.scores = saved->payload->scores;
            entry.emergency_exit = saved->payload->emergency_exit &&
                                   saved->payload->emergency_exit->active;
        }

        if (!result.final_state || *result.final_state != entry.state) {
            ++result.transitions;
        }
        result.final_state = entry.state;
        result.state_counts[core::phaseName(entry.state)]++;
        for (auto type : entry.events) {
            result.event_counts[core::eventTypeName(type)]++;
        }
        result.timeline.push_back(std::move(entry));
    }

    LOG_INFO("Backtest completed: cycles={} updated={} skipped={} transitions={}",
             result.cycles, result.updated, result.skipped_no_data, result.transitions);
    return result;
}

nlohmann::json BacktestRunner::toJson(const Result& result) {
    nlohmann::json j;
    j["chain"] = result.chain;
    j["contract"] = result.contract;
    j["from_ms"] = result.from_ms;
    j["to_ms"] = result.to_ms;
    j["step_ms"] = result.step_ms;
    j["cycles"] = result.cycles;
    j["updated"] = result.updated;
    j["skipped_no_data"] = result.skipped_no_data;
    j["transitions"] = result.transitions;
    j["final_state"] = result.final_state ? nlohmann::json(core::phaseName(*result.final_state))
                                          : nlohmann::json(nullptr);
    j["state_counts"] = result.state_counts;
    j["event_counts"] = result.event_counts;

    j["timeline"] = nlohmann::json::array();
    for (const auto& entry : result.timeline) {
        nlohmann::json row;
        row["as_of_ms"] = entry.as_of_ms;
        row["updated"] = entry.updated;
        if (entry.updated) {
            row["state"] = core::phaseName(entry.state);
            row["emergency_exit"] = entry.emergency_exit;
            row["scores"] = entry.scores;
            row["events"] = nlohmann::json::array();
            for (auto type : entry.events) {
                row["events"].push_back(core::eventTypeName(type));
            }
        }
        j["timeline"].push_back(row);
    }
    return j;
}

} // namespace backtest
} // namespace trendphase
