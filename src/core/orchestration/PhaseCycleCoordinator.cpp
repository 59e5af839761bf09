#include "core/orchestration/PhaseCycleCoordinator.h"

#include <algorithm>

#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include "core/model/PhaseJson.h"
#include "engine/PhaseStateMachine.h"

namespace trendphase {
namespace core {

namespace {
constexpr const char* kEventStateTransition = "state_transition";
constexpr const char* kEventEmergencyChange = "emergency_exit_change";
} // namespace

PhaseCycleCoordinator::PhaseCycleCoordinator(
    std::shared_ptr<IPositionStore> positions,
    std::shared_ptr<IIndicatorSource> indicators,
    std::shared_ptr<IGeometrySource> geometry,
    std::shared_ptr<IBarSource> bars,
    std::shared_ptr<IEventJournal> journal,
    std::shared_ptr<IScoreLog> score_log,
    const engine::EngineConfig& config
)
    : positions_(std::move(positions))
    , indicators_(std::move(indicators))
    , geometry_(std::move(geometry))
    , bars_(std::move(bars))
    , journal_(std::move(journal))
    , score_log_(std::move(score_log))
    , config_(config) {
    if (!positions_ || !indicators_ || !geometry_ || !bars_) {
        throw std::invalid_argument("PhaseCycleCoordinator: position store and market data sources are required");
    }
}

std::vector<PositionRef> PhaseCycleCoordinator::listActive() {
    return positions_->listActive();
}

CycleReport PhaseCycleCoordinator::runPosition(const PositionRef& ref, long long as_of_ms) {
    CycleReport report;
    report.position_id = ref.id;

    auto record = positions_->load(ref.id);
    if (!record) {
        report.skip_reason = "position_not_found";
        return report;
    }

    // 모든 입력은 같은 as_of 기준
    auto snapshot = indicators_->latest(ref.contract, ref.chain, as_of_ms);
    if (!snapshot || !snapshot->valid) {
        report.skip_reason = "no_indicators";
        LOG_DEBUG("[{}] skipped: no indicator snapshot at {}", ref.id, as_of_ms);
        return report;
    }

    auto levels = geometry_->levels(ref.contract, ref.chain, as_of_ms);
    if (levels.empty()) {
        report.skip_reason = "no_geometry";
        LOG_DEBUG("[{}] skipped: no S/R geometry at {}", ref.id, as_of_ms);
        return report;
    }

    auto bars = bars_->bars(ref.contract, ref.chain, config_.timeframe, as_of_ms, config_.bar_window);
    if (bars.empty()) {
        report.skip_reason = "no_bars";
        LOG_DEBUG("[{}] skipped: no bars at {}", ref.id, as_of_ms);
        return report;
    }

    for (const auto& bar : bars) {
        if (!analytics::TechnicalIndicators::isWellFormed(bar)) {
            throw std::runtime_error("malformed bar for " + ref.chain + ":" + ref.contract +
                                     " at " + std::to_string(bar.timestamp));
        }
    }

    engine::PhaseInput input;
    input.contract = ref.contract;
    input.chain = ref.chain;
    input.as_of_ms = as_of_ms;
    input.previous = record->payload;
    input.meta = record->meta;
    input.indicators = *snapshot;
    input.levels = std::move(levels);
    input.bars = std::move(bars);

    auto result = engine::PhaseStateMachine::transition(input, config_.phase);

    // 저장 성공 후에만 이벤트/로그 기록
    persist(ref, result.payload, result.meta);

    report.outcome = CycleOutcome::UPDATED;
    if (record->payload) {
        report.from_state = record->payload->state;
    }
    report.to_state = result.payload.state;
    report.events = result.events;

    emitEvents(ref, as_of_ms, result.events, result.payload);

    const bool full_row = result.transitioned || result.emergency_changed;
    std::string event_type;
    if (result.transitioned) {
        event_type = kEventStateTransition;
    } else if (result.emergency_changed) {
        event_type = kEventEmergencyChange;
    }
    writeScoreRow(ref, as_of_ms, result.payload, full_row, event_type);

    if (result.transitioned) {
        const std::string from = report.from_state ? phaseName(*report.from_state) : "NONE";
        const std::string to = phaseName(report.to_state);
        LOG_INFO("[{}] {}:{} {} -> {}", ref.id, ref.chain, ref.contract, from, to);
        Logger::getInstance().logTransition(ref.contract, ref.chain, from, to, as_of_ms);
    }
    return report;
}

void PhaseCycleCoordinator::persist(const PositionRef& ref,
                                    const EnginePayload& payload,
                                    const EngineMeta& meta) {
    const int attempts = 1 + (std::max)(0, config_.write_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (positions_->save(ref.id, payload, meta)) {
            return;
        }
        LOG_WARN("[{}] payload write failed (attempt {}/{})", ref.id, attempt, attempts);
    }
    throw PositionWriteError("failed to persist payload for position " + ref.id);
}

void PhaseCycleCoordinator::emitEvents(const PositionRef& ref, long long as_of_ms,
                                       const std::vector<PhaseEventType>& events,
                                       const EnginePayload& payload) {
    if (!journal_ || events.empty()) {
        return;
    }

    const auto body = payloadToJson(payload);
    for (auto type : events) {
        JournalEvent event;
        event.ts_ms = as_of_ms;
        event.type = type;
        event.contract = ref.contract;
        event.chain = ref.chain;
        event.payload = body;
        try {
            if (!journal_->append(event)) {
                LOG_WARN("[{}] event append failed: {}", ref.id, eventTypeName(type));
            }
        } catch (const std::exception& e) {
            LOG_WARN("[{}] event append error: {} ({})", ref.id, eventTypeName(type), e.what());
        }
    }
}

void PhaseCycleCoordinator::writeScoreRow(const PositionRef& ref, long long as_of_ms,
                                          const EnginePayload& payload,
                                          bool full_row, const std::string& event_type) {
    if (!score_log_) {
        return;
    }

    ScoreLogRow row;
    row.ts_ms = as_of_ms;
    row.contract = ref.contract;
    row.chain = ref.chain;
    row.state = payload.state;
    row.scores = payload.scores;
    if (full_row) {
        row.diagnostics = payload.diagnostics;
        row.event_type = event_type;
    }

    try {
        if (!score_log_->append(row)) {
            LOG_WARN("[{}] score log append failed", ref.id);
        }
    } catch (const std::exception& e) {
        LOG_WARN("[{}] score log append error: {}", ref.id, e.what());
    }
}

} // namespace core
} // namespace trendphase
