#include "core/state/EventJournalJsonl.h"
#include "core/state/ScoreLogJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    using namespace trendphase::core;

    const auto path = std::filesystem::path("test_output/logs/test_event_journal.jsonl");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    EventJournalJsonl journal(path);

    JournalEvent first;
    first.ts_ms = 1000;
    first.type = PhaseEventType::S1_BREAKOUT;
    first.contract = "TOKEN";
    first.chain = "solana";
    first.payload["state"] = "S1";

    JournalEvent second;
    second.ts_ms = 2000;
    second.type = PhaseEventType::EMERGENCY_EXIT_ON;
    second.contract = "TOKEN";
    second.chain = "solana";
    second.payload["state"] = "S3";

    if (!journal.append(first)) {
        std::cerr << "[TEST] append(first) failed\n";
        return 1;
    }
    if (!journal.append(second)) {
        std::cerr << "[TEST] append(second) failed\n";
        return 1;
    }

    if (journal.lastSeq() != 2) {
        std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
        return 1;
    }

    const auto rows = journal.readFrom(2);
    if (rows.size() != 1) {
        std::cerr << "[TEST] readFrom(2) should return one row, got " << rows.size() << "\n";
        return 1;
    }
    if (rows.front().type != PhaseEventType::EMERGENCY_EXIT_ON || rows.front().chain != "solana") {
        std::cerr << "[TEST] unexpected row: " << eventTypeName(rows.front().type) << "\n";
        return 1;
    }

    // 이벤트 이름은 소문자 snake_case 로 기록
    {
        std::ifstream in(path);
        std::string line;
        std::getline(in, line);
        if (line.find("\"event\":\"s1_breakout\"") == std::string::npos) {
            std::cerr << "[TEST] unexpected event encoding: " << line << "\n";
            return 1;
        }
    }

    // 재시작 후 seq 이어서 증가
    EventJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }
    JournalEvent third = first;
    third.type = PhaseEventType::S3_EXIT;
    reopened.append(third);
    if (reopened.lastSeq() != 3 || reopened.readFrom(1).size() != 3) {
        std::cerr << "[TEST] seq did not continue after reopen\n";
        return 1;
    }

    // 점수 로그: 기본 행 / 전체 행
    const auto score_path = std::filesystem::path("test_output/logs/test_scores_log.jsonl");
    std::filesystem::remove(score_path, ec);
    ScoreLogJsonl score_log(score_path);

    ScoreLogRow base_row;
    base_row.ts_ms = 1000;
    base_row.contract = "TOKEN";
    base_row.chain = "solana";
    base_row.state = Phase::S3;
    base_row.scores = {{"ox", 0.4}, {"dx", 0.6}, {"edx", 0.3}};

    ScoreLogRow full_row = base_row;
    full_row.ts_ms = 2000;
    full_row.diagnostics = std::map<std::string, double>{{"edx_raw", 0.35}};
    full_row.event_type = "state_transition";

    if (!score_log.append(base_row) || !score_log.append(full_row)) {
        std::cerr << "[TEST] score log append failed\n";
        return 1;
    }
    const auto scores = score_log.readAll();
    if (scores.size() != 2 || scores[0].seq != 1 || scores[1].seq != 2) {
        std::cerr << "[TEST] unexpected score log rows\n";
        return 1;
    }
    if (scores[0].diagnostics.has_value() || !scores[1].diagnostics.has_value() ||
        scores[1].event_type != "state_transition" || scores[1].state != Phase::S3 ||
        scores[0].scores.at("dx") != 0.6) {
        std::cerr << "[TEST] score log round trip mismatch\n";
        return 1;
    }

    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
