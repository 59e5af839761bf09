#pragma once

#include <string>

namespace trendphase {
namespace engine {

// 실행 모드
enum class RunMode {
    ONCE,           // 한 번의 tick 실행
    LOOP,           // scan_interval 마다 반복
    BACKTEST        // 과거 시점 재현
};

// Sigmoid 스케일 (k 파라미터)
struct SigmoidScales {
    double s1_curvature_k = 0.0008;
    double s1_comp_inv_k = 0.0015;
    double s1_expansion_k = 0.3;
    double s3_rail_fast_k = 1.5;
    double s3_rail_mid_k = 2.0;
    double s3_rail_144_k = 1.5;
    double s3_rail_250_k = 2.0;
    double s3_exp_fast_k = 0.0015;
    double s3_exp_mid_k = 0.0010;
    double rsi_k = 0.5;
    double adx_k = 0.3;
    double edx_slow_k = 0.00025;
    double edx_slow_333_k = 0.0002;
    double compression_atr_k = 0.05;
    double compression_sep_k = 0.0015;
    double compression_adx_k = 0.2;
    double sr_flip_scale = 5.0;
};

struct HysteresisConfig {
    double on_threshold = 0.70;
    double off_threshold = 0.60;
    int on_bars = 3;
    int off_bars = 3;
};

// 상태 머신 파라미터. 한 번 로드된 뒤에는 const& 로만 전달된다.
struct PhaseParams {
    double adx_floor = 18.0;
    SigmoidScales k;
    HysteresisConfig hysteresis;

    // 윈도우 판정 (N개 중 M개)
    int window_bars = 10;
    int window_threshold = 8;

    // S1 → S2
    double s1_atr_cooling_ratio = 0.90;
    double s1_slope_norm_flat = 0.1;
    double s1_dsep_flat = 0.005;
    double s1_min_pullback_pct = 0.06;

    // S2 → S3
    double s3_entry_trend_strength = 0.6;
    int s3_entry_slow_slopes_min = 2;

    // 지지 사다리
    double halo_atr_mult = 0.5;
    double halo_price_pct = 0.03;
    double dent_integrity_mult = 0.4;
    double dent_strength_mult = 0.6;
    double reclaim_integrity_mult = 1.3;
    double reclaim_strength_mult = 1.6;
    double tier_step_boost = 0.10;
    double base_tier_boost = 0.30;

    // EDX smoothing
    int edx_ema_span = 20;

    // emergency exit
    int bounce_window_bars = 6;
    long long bar_interval_ms = 3600LL * 1000LL;

    // fakeout
    int fakeout_votes_required = 2;
    int avwap_below_closes = 3;

    // 입력 윈도우
    int edx_lookback_bars = 50;
    int support_lookback_bars = 30;
    int compression_slope_bars = 24;
    int bootstrap_top_levels = 5;
};

// 엔진 설정
struct EngineConfig {
    RunMode mode;
    PhaseParams phase;

    // 배치 설정
    int worker_threads;
    int tick_timeout_seconds;
    int scan_interval_seconds;
    int write_retries;
    int bar_window;
    std::string timeframe = "1h";

    // 저장소 경로
    std::string positions_file = "data/positions.json";
    std::string market_data_dir = "data/market";
    std::string event_journal_file = "logs/uptrend_state_events.jsonl";
    std::string score_log_file = "logs/uptrend_scores_log.jsonl";

    // 로깅
    std::string log_dir = "logs";
    std::string log_level = "info";

    EngineConfig()
        : mode(RunMode::ONCE)
        , worker_threads(4)
        , tick_timeout_seconds(300)
        , scan_interval_seconds(3600)
        , write_retries(2)
        , bar_window(400)
    {}
};

} // namespace engine
} // namespace trendphase
