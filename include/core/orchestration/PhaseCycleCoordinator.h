#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/contracts/IBarSource.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IGeometrySource.h"
#include "core/contracts/IIndicatorSource.h"
#include "core/contracts/IPositionStore.h"
#include "core/contracts/IScoreLog.h"
#include "core/model/PhaseTypes.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace core {

// payload + meta 저장이 재시도 후에도 실패
class PositionWriteError : public std::runtime_error {
public:
    explicit PositionWriteError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class CycleOutcome {
    UPDATED,
    SKIPPED_NO_DATA
};

struct CycleReport {
    CycleOutcome outcome = CycleOutcome::SKIPPED_NO_DATA;
    std::string position_id;
    std::optional<Phase> from_state;
    Phase to_state = Phase::S0;
    std::vector<PhaseEventType> events;
    std::string skip_reason;
};

// 포지션 하나, as-of 하나: 읽기 → 상태 머신 → 저장 → 이벤트/점수 로그
// journal, score_log 는 nullptr 허용
class PhaseCycleCoordinator {
public:
    PhaseCycleCoordinator(
        std::shared_ptr<IPositionStore> positions,
        std::shared_ptr<IIndicatorSource> indicators,
        std::shared_ptr<IGeometrySource> geometry,
        std::shared_ptr<IBarSource> bars,
        std::shared_ptr<IEventJournal> journal,
        std::shared_ptr<IScoreLog> score_log,
        const engine::EngineConfig& config
    );

    // 잘못된 봉: std::runtime_error, 저장 실패: PositionWriteError
    CycleReport runPosition(const PositionRef& ref, long long as_of_ms);

    std::vector<PositionRef> listActive();

private:
    void persist(const PositionRef& ref, const EnginePayload& payload, const EngineMeta& meta);
    void emitEvents(const PositionRef& ref, long long as_of_ms,
                    const std::vector<PhaseEventType>& events,
                    const EnginePayload& payload);
    void writeScoreRow(const PositionRef& ref, long long as_of_ms,
                       const EnginePayload& payload,
                       bool full_row, const std::string& event_type);

    std::shared_ptr<IPositionStore> positions_;
    std::shared_ptr<IIndicatorSource> indicators_;
    std::shared_ptr<IGeometrySource> geometry_;
    std::shared_ptr<IBarSource> bars_;
    std::shared_ptr<IEventJournal> journal_;
    std::shared_ptr<IScoreLog> score_log_;
    engine::EngineConfig config_;
};

} // namespace core
} // namespace trendphase
