#include "engine/PhaseBatchRunner.h"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "common/Logger.h"
#include "common/Types.h"

namespace trendphase {
namespace engine {

PhaseBatchRunner::PhaseBatchRunner(std::shared_ptr<core::PhaseCycleCoordinator> coordinator,
                                   const EngineConfig& config)
    : coordinator_(std::move(coordinator))
    , config_(config)
    , running_(false) {
    if (!coordinator_) {
        throw std::invalid_argument("PhaseBatchRunner: coordinator is required");
    }
}

std::shared_ptr<std::mutex> PhaseBatchRunner::positionLock(const std::string& id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = position_locks_[id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void PhaseBatchRunner::pruneLocks(const std::vector<core::PositionRef>& active) {
    std::set<std::string> ids;
    for (const auto& ref : active) {
        ids.insert(ref.id);
    }

    std::lock_guard<std::mutex> lock(locks_mutex_);
    for (auto it = position_locks_.begin(); it != position_locks_.end();) {
        if (ids.count(it->first) == 0) {
            it = position_locks_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t PhaseBatchRunner::trackedLockCount() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return position_locks_.size();
}

BatchSummary PhaseBatchRunner::runTick(long long as_of_ms) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + std::chrono::seconds((std::max)(0, config_.tick_timeout_seconds));

    BatchSummary summary;
    std::vector<core::PositionRef> refs;
    try {
        refs = coordinator_->listActive();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list active positions: {}", e.what());
        return summary;
    }
    summary.total = static_cast<int>(refs.size());

    std::atomic<size_t> next_index{0};
    std::atomic<int> updated{0};
    std::atomic<int> skipped{0};
    std::atomic<int> failed{0};
    std::atomic<int> timed_out{0};

    auto worker = [&]() {
        while (true) {
            const size_t index = next_index.fetch_add(1);
            if (index >= refs.size()) {
                return;
            }
            const auto& ref = refs[index];

            // 시작 전 deadline 초과: 건드리지 않음
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out.fetch_add(1);
                continue;
            }

            auto lock_ptr = positionLock(ref.id);
            std::lock_guard<std::mutex> position_guard(*lock_ptr);
            try {
                auto report = coordinator_->runPosition(ref, as_of_ms);
                if (report.outcome == core::CycleOutcome::UPDATED) {
                    updated.fetch_add(1);
                } else {
                    skipped.fetch_add(1);
                }
            } catch (const core::PositionWriteError& e) {
                LOG_ERROR("[{}] {}", ref.id, e.what());
                failed.fetch_add(1);
            } catch (const std::exception& e) {
                LOG_ERROR("[{}] cycle failed: {}", ref.id, e.what());
                failed.fetch_add(1);
            }
        }
    };

    const int thread_count = (std::max)(1, (std::min)(config_.worker_threads,
                                                      static_cast<int>(refs.size())));
    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (int i = 0; i < thread_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }
    pruneLocks(refs);

    summary.updated = updated.load();
    summary.skipped_no_data = skipped.load();
    summary.failed = failed.load();
    summary.timed_out = timed_out.load();
    summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    ).count();

    LOG_INFO("Tick {}: total={} updated={} skipped_no_data={} failed={} timed_out={} ({} ms)",
             as_of_ms, summary.total, summary.updated, summary.skipped_no_data,
             summary.failed, summary.timed_out, summary.duration_ms);
    return summary;
}

void PhaseBatchRunner::runLoop() {
    running_ = true;
    LOG_INFO("Phase batch loop started (interval {}s, {} workers)",
             config_.scan_interval_seconds, config_.worker_threads);

    const auto scan_interval = std::chrono::seconds((std::max)(1, config_.scan_interval_seconds));
    const auto poll_interval = std::chrono::milliseconds(200);

    while (running_) {
        const auto tick_start = std::chrono::steady_clock::now();

        try {
            runTick(nowMs());
        } catch (const std::exception& e) {
            LOG_ERROR("Batch tick error: {}", e.what());
        }

        // 남은 시간만큼 대기, stop() 에 빠르게 반응
        while (running_ && std::chrono::steady_clock::now() - tick_start < scan_interval) {
            std::this_thread::sleep_for(poll_interval);
        }
    }

    LOG_INFO("Phase batch loop stopped");
}

void PhaseBatchRunner::stop() {
    running_ = false;
}

} // namespace engine
} // namespace trendphase
