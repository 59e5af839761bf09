#include "core/orchestration/PhaseCycleCoordinator.h"
#include "core/state/PositionStoreMemory.h"

#include <cassert>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>

using namespace trendphase;
using namespace trendphase::core;

namespace {
constexpr long long kT0 = 1700000000000LL;

class FakeMarket : public IIndicatorSource, public IGeometrySource, public IBarSource {
public:
    std::optional<IndicatorSnapshot> snapshot;
    std::vector<SrLevel> sr_levels;
    std::vector<Candle> candles;
    long long last_as_of = 0;

    std::optional<IndicatorSnapshot> latest(const std::string&, const std::string&, long long as_of_ms) override {
        last_as_of = as_of_ms;
        return snapshot;
    }
    std::vector<SrLevel> levels(const std::string&, const std::string&, long long) override {
        return sr_levels;
    }
    std::vector<Candle> bars(const std::string&, const std::string&, const std::string&, long long, int) override {
        return candles;
    }
};

// save 가 fail_saves 번 실패한 뒤 성공
class FlakyStore : public PositionStoreMemory {
public:
    int fail_saves = 0;
    int save_calls = 0;

    bool save(const std::string& id, const EnginePayload& payload, const EngineMeta& meta) override {
        ++save_calls;
        if (fail_saves > 0) {
            --fail_saves;
            return false;
        }
        return PositionStoreMemory::save(id, payload, meta);
    }
};

class MemoryJournal : public IEventJournal {
public:
    std::vector<JournalEvent> events;
    bool throw_on_append = false;

    bool append(const JournalEvent& event) override {
        if (throw_on_append) {
            throw std::runtime_error("journal unavailable");
        }
        events.push_back(event);
        events.back().seq = events.size();
        return true;
    }
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override {
        std::vector<JournalEvent> out;
        for (const auto& e : events) {
            if (e.seq >= seq_inclusive) out.push_back(e);
        }
        return out;
    }
    std::uint64_t lastSeq() const override { return events.size(); }
};

class MemoryScoreLog : public IScoreLog {
public:
    std::vector<ScoreLogRow> rows;
    bool append(const ScoreLogRow& row) override {
        rows.push_back(row);
        return true;
    }
    std::vector<ScoreLogRow> readAll() override { return rows; }
};

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

IndicatorSnapshot snapshot() {
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
    snap.adx = 25.0;
    return snap;
}

struct Fixture {
    std::shared_ptr<FlakyStore> store = std::make_shared<FlakyStore>();
    std::shared_ptr<FakeMarket> market = std::make_shared<FakeMarket>();
    std::shared_ptr<MemoryJournal> journal = std::make_shared<MemoryJournal>();
    std::shared_ptr<MemoryScoreLog> score_log = std::make_shared<MemoryScoreLog>();
    engine::EngineConfig config;
    PositionRef ref{"pos-1", "TOKEN", "solana"};

    Fixture() {
        PositionRecord record;
        record.id = ref.id;
        record.contract = ref.contract;
        record.chain = ref.chain;
        store->upsert(record);

        market->snapshot = snapshot();
        market->sr_levels = {{"l1", 100.0, 5.0, 0.9, "pivot"}, {"l2", 110.0, 3.0, 0.8, "pivot"}};
        market->candles = flatBars(30, 118.0);
    }

    PhaseCycleCoordinator coordinator() {
        return PhaseCycleCoordinator(store, market, market, market, journal, score_log, config);
    }
};

void testSkipsWithoutIndicators() {
    Fixture f;
    f.market->snapshot.reset();
    auto coordinator = f.coordinator();

    auto report = coordinator.runPosition(f.ref, kT0 + 30 * kBarIntervalMs);
    assert(report.outcome == CycleOutcome::SKIPPED_NO_DATA);
    assert(report.skip_reason == "no_indicators");
    assert(f.store->save_calls == 0);
    assert(f.journal->events.empty());
    assert(f.score_log->rows.empty());
    assert(!f.store->load(f.ref.id)->payload.has_value());
}

void testSkipsWithoutGeometry() {
    Fixture f;
    f.market->sr_levels.clear();
    auto coordinator = f.coordinator();

    auto report = coordinator.runPosition(f.ref, kT0);
    assert(report.outcome == CycleOutcome::SKIPPED_NO_DATA);
    assert(report.skip_reason == "no_geometry");
    assert(f.store->save_calls == 0);
}

void testBootstrapWritesPayloadEventsAndScores() {
    Fixture f;
    auto coordinator = f.coordinator();
    const long long as_of = kT0 + 30 * kBarIntervalMs;

    auto report = coordinator.runPosition(f.ref, as_of);
    assert(report.outcome == CycleOutcome::UPDATED);
    assert(!report.from_state.has_value());
    assert(report.to_state == Phase::S3);
    assert(f.market->last_as_of == as_of);

    auto saved = f.store->load(f.ref.id);
    assert(saved->payload.has_value());
    assert(saved->payload->state == Phase::S3);
    assert(saved->meta.s3.has_value());

    assert(f.journal->events.size() == 1);
    assert(f.journal->events[0].type == PhaseEventType::S3_ACTIVE);
    assert(f.journal->events[0].contract == "TOKEN");
    assert(f.journal->events[0].ts_ms == as_of);
    assert(f.journal->events[0].payload.value("state", std::string()) == "S3");

    assert(f.score_log->rows.size() == 1);
    assert(f.score_log->rows[0].diagnostics.has_value());
    assert(f.score_log->rows[0].event_type == "state_transition");

    // 같은 입력으로 한 번 더: 전이 없음 → 기본 행만
    auto again = coordinator.runPosition(f.ref, as_of);
    assert(again.outcome == CycleOutcome::UPDATED);
    assert(again.from_state == Phase::S3);
    assert(f.journal->events.size() == 1);
    assert(f.score_log->rows.size() == 2);
    assert(!f.score_log->rows[1].diagnostics.has_value());
    assert(f.score_log->rows[1].event_type.empty());
}

void testMalformedBarThrows() {
    Fixture f;
    f.market->candles.back().close = std::numeric_limits<double>::quiet_NaN();
    auto coordinator = f.coordinator();

    bool thrown = false;
    try {
        coordinator.runPosition(f.ref, kT0);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(f.store->save_calls == 0);
    assert(f.journal->events.empty());
}

void testWriteRetries() {
    Fixture f;
    f.config.write_retries = 2;
    f.store->fail_saves = 2;
    auto coordinator = f.coordinator();

    auto report = coordinator.runPosition(f.ref, kT0);
    assert(report.outcome == CycleOutcome::UPDATED);
    assert(f.store->save_calls == 3);

    Fixture g;
    g.config.write_retries = 1;
    g.store->fail_saves = 10;
    auto failing = g.coordinator();
    bool thrown = false;
    try {
        failing.runPosition(g.ref, kT0);
    } catch (const PositionWriteError&) {
        thrown = true;
    }
    assert(thrown);
    assert(g.store->save_calls == 2);
    // 저장 실패 시 이벤트/점수 로그 없음
    assert(g.journal->events.empty());
    assert(g.score_log->rows.empty());
}

void testJournalFailureIsSwallowed() {
    Fixture f;
    f.journal->throw_on_append = true;
    auto coordinator = f.coordinator();

    auto report = coordinator.runPosition(f.ref, kT0);
    assert(report.outcome == CycleOutcome::UPDATED);
    assert(f.store->load(f.ref.id)->payload.has_value());
    assert(f.score_log->rows.size() == 1);
}

void testNullSinksAllowed() {
    Fixture f;
    PhaseCycleCoordinator coordinator(f.store, f.market, f.market, f.market, nullptr, nullptr, f.config);
    auto report = coordinator.runPosition(f.ref, kT0);
    assert(report.outcome == CycleOutcome::UPDATED);
}
} // namespace

int main() {
    testSkipsWithoutIndicators();
    testSkipsWithoutGeometry();
    testBootstrapWritesPayloadEventsAndScores();
    testMalformedBarThrows();
    testWriteRetries();
    testJournalFailureIsSwallowed();
    testNullSinksAllowed();

    std::cout << "[TEST] CycleCoordinator PASSED\n";
    return 0;
}
