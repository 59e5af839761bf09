#include "engine/EmergencyExit.h"
#include "analytics/CompositeScorer.h"

namespace trendphase {
namespace engine {

EmergencyExit::Update EmergencyExit::evaluate(
    bool previously_active,
    const std::optional<core::EmergencyExitState>& previous_meta,
    const Candle& last,
    const core::IndicatorSnapshot& snap,
    long long as_of_ms,
    const PhaseParams& params
) {
    Update update;
    const double px = last.close;
    const double ema333 = snap.ema333;

    if (!(ema333 > 0.0 && px < ema333)) {
        // EMA333 위로 회복
        if (previously_active) {
            update.deactivated = true;
        }
        return update;
    }

    core::EmergencyExitState state;
    if (previously_active && previous_meta) {
        state = *previous_meta;
    } else {
        state.break_time_ms = as_of_ms;
        state.break_low = last.low > 0.0 ? last.low : px;
        state.ema333_at_break = ema333;
        update.activated = !previously_active;
    }
    update.meta = state;

    const long long window_expiry = state.break_time_ms +
        static_cast<long long>(params.bounce_window_bars) * params.bar_interval_ms;
    const bool window_active = as_of_ms < window_expiry;
    const double halo = analytics::CompositeScorer::halo(snap.atr, px, params);

    core::EmergencyExitFlag flag;
    flag.active = true;
    flag.reason = kReasonCloseBelow;
    flag.ts_ms = as_of_ms;
    flag.break_time_ms = state.break_time_ms;
    flag.break_low = state.break_low;
    flag.ema333_at_break = state.ema333_at_break;
    flag.halo = halo;
    flag.bounce_low = ema333 - halo;
    flag.bounce_high = ema333 + halo;
    flag.window_active = window_active;
    if (window_active) {
        flag.window_expires_ms = window_expiry;
    }

    // 행동 제안
    if (snap.atr > 0.0 && last.low < state.break_low - 0.5 * snap.atr) {
        flag.suggested_action = "exit_immediately_new_low";
    } else if (window_active) {
        bool bounced = snap.atr > 0.0 && (px - state.break_low) >= 0.5 * snap.atr;
        bool in_zone = flag.bounce_low <= px && px <= flag.bounce_high;
        flag.suggested_action = (in_zone && bounced) ? "exit_on_bounce_zone_touch" : "monitor";
    } else {
        flag.suggested_action = "window_expired_exit";
    }

    update.flag = flag;
    return update;
}

core::EmergencyExitFlag EmergencyExit::persistentDowntrend(
    const Candle& last,
    const core::IndicatorSnapshot& snap,
    long long as_of_ms,
    int below_count,
    const PhaseParams& params
) {
    const double px = last.close;
    const double halo = analytics::CompositeScorer::halo(snap.atr, px, params);

    core::EmergencyExitFlag flag;
    flag.active = true;
    flag.reason = kReasonPersistent;
    flag.ts_ms = as_of_ms;
    flag.break_time_ms = as_of_ms;
    flag.break_low = last.low > 0.0 ? last.low : px;
    flag.ema333_at_break = snap.ema333;
    flag.halo = halo;
    flag.bounce_low = snap.ema333 - halo;
    flag.bounce_high = snap.ema333 + halo;
    flag.below_count = below_count;
    return flag;
}

} // namespace engine
} // namespace trendphase
