#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/orchestration/PhaseCycleCoordinator.h"
#include "engine/EngineConfig.h"

namespace trendphase {
namespace engine {

struct BatchSummary {
    int total = 0;
    int updated = 0;
    int skipped_no_data = 0;
    int failed = 0;
    int timed_out = 0;
    long long duration_ms = 0;
};

// 모든 active 포지션에 대해 한 tick 실행
// worker_threads 개의 스레드가 공유 인덱스에서 포지션을 가져감
class PhaseBatchRunner {
public:
    PhaseBatchRunner(std::shared_ptr<core::PhaseCycleCoordinator> coordinator,
                     const EngineConfig& config);

    BatchSummary runTick(long long as_of_ms);

    // scan_interval_seconds 마다 runTick(now), stop() 까지 블로킹
    void runLoop();
    void stop();
    bool isRunning() const { return running_; }

    // 현재 유지 중인 포지션 lock 수
    size_t trackedLockCount() const;

private:
    std::shared_ptr<std::mutex> positionLock(const std::string& id);
    // 이번 tick 의 active 목록에 없는 포지션 lock 제거
    void pruneLocks(const std::vector<core::PositionRef>& active);

    std::shared_ptr<core::PhaseCycleCoordinator> coordinator_;
    EngineConfig config_;

    std::atomic<bool> running_;
    mutable std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> position_locks_;
};

} // namespace engine
} // namespace trendphase
