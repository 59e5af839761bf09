#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace trendphase {
namespace core {

enum class Phase { S0, S1, S2, S3 };

const char* phaseName(Phase phase);
std::optional<Phase> parsePhase(const std::string& value);

// ===== 입력 계약 =====

// 1h 지표 스냅샷 (상류 파이프라인 산출물, 사이클 내 불변)
struct IndicatorSnapshot {
    bool valid = false;
    long long ts_ms = 0;

    double ema20 = 0.0;
    double ema30 = 0.0;
    double ema50 = 0.0;
    double ema60 = 0.0;
    double ema144 = 0.0;
    double ema250 = 0.0;
    double ema333 = 0.0;

    double ema20_slope = 0.0;
    double ema30_slope = 0.0;
    double ema60_slope = 0.0;
    double ema144_slope = 0.0;
    double ema250_slope = 0.0;
    double ema333_slope = 0.0;

    double d_ema20_slope = 0.0;
    double d_ema60_slope = 0.0;
    double d_ema144_slope = 0.0;
    double d_ema250_slope = 0.0;
    double d_ema333_slope = 0.0;

    double sep_fast = 0.0;
    double sep_mid = 0.0;
    double dsep_fast_5 = 0.0;
    double dsep_mid_5 = 0.0;

    double atr = 0.0;
    double atr_mean_20 = 0.0;
    double atr_peak_10 = 0.0;

    double adx = 0.0;
    double adx_slope_10 = 0.0;
    double rsi_slope_10 = 0.0;

    double vo_z = 0.0;
    bool vo_z_cluster = false;
};

struct SrLevel {
    std::string id;
    double price = 0.0;
    double strength = 0.0;
    double confidence = 0.0;
    std::string source;
};

// ===== 내부 메타 (비공개, 사이클 간 유지) =====

struct CompressionBaselines {
    double atr_norm_baseline = 0.0;
    double sep_fast_start = 0.0;
    double sep_mid_start = 0.0;
    double adx_baseline = 0.0;
    double compression_index = 0.5;
};

struct FlippedLevel {
    std::string id;
    double level = 0.0;
    double score = 0.0;
    int order = 0;
    long long flipped_at_ms = 0;
};

// S0→S1 전이 시점에 캡처되어 사이클 리셋 전까지 고정되는 값들
struct BreakoutArtifacts {
    double base_sr_level = 0.0;
    std::vector<FlippedLevel> flipped_sr_levels;
    double sr_flip_score = 0.0;
    double breakout_price = 0.0;
    long long breakout_ts_ms = 0;
    double breakout_high = 0.0;
    double atr_at_breakout = 0.0;
    double atr_peak = 0.0;
    double atr_norm_at_breakout = 0.0;
    double last_support_below_breakout = 0.0;
    CompressionBaselines frozen_s0;
    std::map<std::string, double> breakout_scores;
};

struct SupportLadderState {
    int tier_index = -1;        // -1: 비활성
    double current_sr = 0.0;
    long long t0_ms = 0;

    bool active() const { return tier_index >= 0; }
};

struct RegimeState {
    double edx_ema = 0.0;
    std::string asset_key;
};

struct EmergencyExitState {
    long long break_time_ms = 0;
    double break_low = 0.0;
    double ema333_at_break = 0.0;
};

struct HysteresisState {
    bool active = false;
    int on_count = 0;
    int off_count = 0;
    double last_value = 0.0;
};

struct EngineMeta {
    std::optional<CompressionBaselines> s0;
    std::optional<BreakoutArtifacts> s1;
    std::optional<SupportLadderState> s2;
    std::optional<RegimeState> s3;
    std::optional<EmergencyExitState> emergency_exit;
    std::map<std::string, HysteresisState> hysteresis;
};

// ===== 공개 페이로드 =====

struct EmergencyExitFlag {
    bool active = false;
    std::string reason;
    long long ts_ms = 0;
    long long break_time_ms = 0;
    double break_low = 0.0;
    double ema333_at_break = 0.0;
    double halo = 0.0;
    double bounce_low = 0.0;
    double bounce_high = 0.0;
    bool window_active = false;
    std::optional<long long> window_expires_ms;
    std::string suggested_action;
    int below_count = 0;
};

struct SrContext {
    double halo = 0.0;
    double base_sr_level = 0.0;
    std::vector<FlippedLevel> flipped_sr_levels;
};

struct SupportsBlock {
    bool active = false;
    int tier_index = -1;
    double current_sr_level = 0.0;
    double halo = 0.0;
};

struct EnginePayload {
    int schema_version = 1;
    Phase state = Phase::S0;
    std::string timeframe = "1h";
    long long ts_ms = 0;
    std::map<std::string, bool> flags;
    std::optional<EmergencyExitFlag> emergency_exit;
    std::map<std::string, double> scores;
    std::map<std::string, double> levels;
    std::map<std::string, double> diagnostics;
    std::optional<SrContext> sr_context;
    std::optional<SupportsBlock> supports;
    std::optional<CompressionBaselines> baselines;
};

// ===== 포지션 =====

struct PositionRef {
    std::string id;
    std::string contract;
    std::string chain;
};

struct PositionRecord {
    std::string id;
    std::string contract;
    std::string chain;
    std::string status = "active";
    std::optional<EnginePayload> payload;
    EngineMeta meta;
};

// ===== 출력: 이벤트 / 점수 로그 =====

enum class PhaseEventType {
    S1_BREAKOUT,
    S1_FAKEOUT,
    S2_SUPPORT_TOUCH,
    S2_FAKEOUT,
    S3_ACTIVE,
    S3_SR_RECLAIM,
    S3_EXIT,
    EMERGENCY_EXIT_ON,
    EMERGENCY_EXIT_OFF
};

const char* eventTypeName(PhaseEventType type);
std::optional<PhaseEventType> parseEventType(const std::string& value);

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    PhaseEventType type = PhaseEventType::S1_BREAKOUT;
    std::string contract;
    std::string chain;
    nlohmann::json payload;
};

struct ScoreLogRow {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    std::string contract;
    std::string chain;
    Phase state = Phase::S0;
    std::map<std::string, double> scores;
    std::optional<std::map<std::string, double>> diagnostics;
    std::string event_type;     // 전체 행에만: state_transition / emergency_exit_change
};

} // namespace core
} // namespace trendphase
