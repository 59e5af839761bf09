#include "engine/Hysteresis.h"

namespace trendphase {
namespace engine {

core::HysteresisState updateHysteresis(
    const core::HysteresisState& previous,
    double value,
    const HysteresisConfig& config
) {
    core::HysteresisState next = previous;

    if (value >= config.on_threshold) {
        next.on_count = previous.on_count + 1;
        next.off_count = 0;
    } else if (value < config.off_threshold) {
        next.off_count = previous.off_count + 1;
        next.on_count = 0;
    }

    if (next.on_count >= config.on_bars) {
        next.active = true;
    } else if (next.off_count >= config.off_bars) {
        next.active = false;
    }

    next.last_value = value;
    return next;
}

} // namespace engine
} // namespace trendphase
