#include "engine/PhaseBatchRunner.h"
#include "core/state/PositionStoreMemory.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <thread>

using namespace trendphase;
using namespace trendphase::core;

namespace {
constexpr long long kT0 = 1700000000000LL;

std::vector<Candle> flatBars(int count, double close) {
    std::vector<Candle> bars;
    for (int i = 0; i < count; ++i) {
        Candle c;
        c.timestamp = kT0 + static_cast<long long>(i) * kBarIntervalMs;
        c.open = close;
        c.high = close * 1.01;
        c.low = close * 0.99;
        c.close = close;
        c.volume = 1000.0;
        bars.push_back(c);
    }
    return bars;
}

// contract 별 동작: "nodata" → 지표 없음, "broken" → 잘못된 봉, 그 외 정상
class ScriptedMarket : public IIndicatorSource, public IGeometrySource, public IBarSource {
public:
    int bar_delay_ms = 0;
    std::atomic<int> bar_calls{0};

    std::optional<IndicatorSnapshot> latest(const std::string& contract, const std::string&, long long) override {
        if (contract == "nodata") {
            return std::nullopt;
        }
        IndicatorSnapshot snap;
        snap.valid = true;
        snap.ema20 = 120.0;
        snap.ema50 = 115.0;
        snap.ema60 = 112.0;
        snap.ema144 = 105.0;
        snap.ema250 = 98.0;
        snap.ema333 = 90.0;
        snap.atr = 2.0;
        snap.atr_mean_20 = 2.0;
        return snap;
    }

    std::vector<SrLevel> levels(const std::string&, const std::string&, long long) override {
        return {{"l1", 100.0, 5.0, 0.9, "pivot"}};
    }

    std::vector<Candle> bars(const std::string& contract, const std::string&, const std::string&,
                             long long, int) override {
        bar_calls.fetch_add(1);
        if (bar_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(bar_delay_ms));
        }
        auto out = flatBars(30, 118.0);
        if (contract == "broken") {
            out.back().close = -1.0;
        }
        return out;
    }
};

std::shared_ptr<PositionStoreMemory> storeWith(const std::vector<std::string>& contracts) {
    auto store = std::make_shared<PositionStoreMemory>();
    int n = 0;
    for (const auto& contract : contracts) {
        PositionRecord record;
        record.id = "pos-" + std::to_string(++n);
        record.contract = contract;
        record.chain = "solana";
        store->upsert(record);
    }
    return store;
}

engine::PhaseBatchRunner makeRunner(std::shared_ptr<PositionStoreMemory> store,
                                    std::shared_ptr<ScriptedMarket> market,
                                    const engine::EngineConfig& config) {
    auto coordinator = std::make_shared<PhaseCycleCoordinator>(
        store, market, market, market, nullptr, nullptr, config);
    return engine::PhaseBatchRunner(coordinator, config);
}

// 한 포지션의 실패가 배치를 중단시키지 않음
void testFailureIsolation() {
    auto store = storeWith({"good", "nodata", "broken", "good2"});
    auto market = std::make_shared<ScriptedMarket>();
    engine::EngineConfig config;
    config.worker_threads = 2;

    auto runner = makeRunner(store, market, config);
    auto summary = runner.runTick(kT0 + 30 * kBarIntervalMs);

    assert(summary.total == 4);
    assert(summary.updated == 2);
    assert(summary.skipped_no_data == 1);
    assert(summary.failed == 1);
    assert(summary.timed_out == 0);
    assert(summary.duration_ms >= 0);

    assert(store->load("pos-1")->payload.has_value());
    assert(!store->load("pos-2")->payload.has_value());
    assert(!store->load("pos-3")->payload.has_value());
    assert(store->load("pos-4")->payload.has_value());
}

// deadline 이후 시작 못 한 포지션은 timed_out, 건드리지 않음
void testGlobalTimeout() {
    auto store = storeWith({"a", "b", "c"});
    auto market = std::make_shared<ScriptedMarket>();
    market->bar_delay_ms = 1200;
    engine::EngineConfig config;
    config.worker_threads = 1;
    config.tick_timeout_seconds = 1;

    auto runner = makeRunner(store, market, config);
    auto summary = runner.runTick(kT0 + 30 * kBarIntervalMs);

    assert(summary.total == 3);
    assert(summary.updated == 1);
    assert(summary.timed_out == 2);
    assert(market->bar_calls.load() == 1);
    assert(store->load("pos-1")->payload.has_value());
    assert(!store->load("pos-2")->payload.has_value());
}

void testManyPositionsParallel() {
    std::vector<std::string> contracts;
    for (int i = 0; i < 25; ++i) {
        contracts.push_back("tok" + std::to_string(i));
    }
    auto store = storeWith(contracts);
    auto market = std::make_shared<ScriptedMarket>();
    engine::EngineConfig config;
    config.worker_threads = 4;

    auto runner = makeRunner(store, market, config);
    auto summary = runner.runTick(kT0 + 30 * kBarIntervalMs);
    assert(summary.total == 25);
    assert(summary.updated == 25);
    assert(market->bar_calls.load() == 25);
}

void testEmptyBatch() {
    auto store = std::make_shared<PositionStoreMemory>();
    auto market = std::make_shared<ScriptedMarket>();
    engine::EngineConfig config;

    auto runner = makeRunner(store, market, config);
    auto summary = runner.runTick(kT0);
    assert(summary.total == 0);
    assert(summary.updated == 0);
}

// 닫힌 포지션의 lock 은 다음 tick 이후 남지 않음
void testLocksFollowActivePositions() {
    auto store = storeWith({"a", "b", "c"});
    auto market = std::make_shared<ScriptedMarket>();
    engine::EngineConfig config;
    config.worker_threads = 2;

    auto runner = makeRunner(store, market, config);
    assert(runner.trackedLockCount() == 0);
    runner.runTick(kT0 + 30 * kBarIntervalMs);
    assert(runner.trackedLockCount() == 3);

    auto closed = *store->load("pos-2");
    closed.status = "closed";
    store->upsert(closed);

    auto summary = runner.runTick(kT0 + 31 * kBarIntervalMs);
    assert(summary.total == 2);
    assert(runner.trackedLockCount() == 2);

    auto reopened = *store->load("pos-2");
    reopened.status = "active";
    store->upsert(reopened);
    runner.runTick(kT0 + 32 * kBarIntervalMs);
    assert(runner.trackedLockCount() == 3);
}

void testLoopStops() {
    auto store = storeWith({"a"});
    auto market = std::make_shared<ScriptedMarket>();
    engine::EngineConfig config;
    config.scan_interval_seconds = 60;

    auto coordinator = std::make_shared<PhaseCycleCoordinator>(
        store, market, market, market, nullptr, nullptr, config);
    engine::PhaseBatchRunner runner(coordinator, config);

    std::thread loop([&runner]() { runner.runLoop(); });
    while (market->bar_calls.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    runner.stop();
    loop.join();
    assert(!runner.isRunning());
    assert(market->bar_calls.load() == 1);
}
} // namespace

int main() {
    testFailureIsolation();
    testGlobalTimeout();
    testManyPositionsParallel();
    testEmptyBatch();
    testLocksFollowActivePositions();
    testLoopStops();

    std::cout << "[TEST] BatchRunner PASSED\n";
    return 0;
}
