#include "core/model/PhaseTypes.h"

namespace trendphase {
namespace core {

const char* phaseName(Phase phase) {
    switch (phase) {
        case Phase::S0: return "S0";
        case Phase::S1: return "S1";
        case Phase::S2: return "S2";
        case Phase::S3: return "S3";
    }
    return "S0";
}

std::optional<Phase> parsePhase(const std::string& value) {
    if (value == "S0") return Phase::S0;
    if (value == "S1") return Phase::S1;
    if (value == "S2") return Phase::S2;
    if (value == "S3") return Phase::S3;
    return std::nullopt;
}

const char* eventTypeName(PhaseEventType type) {
    switch (type) {
        case PhaseEventType::S1_BREAKOUT: return "s1_breakout";
        case PhaseEventType::S1_FAKEOUT: return "s1_fakeout";
        case PhaseEventType::S2_SUPPORT_TOUCH: return "s2_support_touch";
        case PhaseEventType::S2_FAKEOUT: return "s2_fakeout";
        case PhaseEventType::S3_ACTIVE: return "s3_active";
        case PhaseEventType::S3_SR_RECLAIM: return "s3_sr_reclaim";
        case PhaseEventType::S3_EXIT: return "s3_exit";
        case PhaseEventType::EMERGENCY_EXIT_ON: return "emergency_exit_on";
        case PhaseEventType::EMERGENCY_EXIT_OFF: return "emergency_exit_off";
    }
    return "s1_breakout";
}

std::optional<PhaseEventType> parseEventType(const std::string& value) {
    if (value == "s1_breakout") return PhaseEventType::S1_BREAKOUT;
    if (value == "s1_fakeout") return PhaseEventType::S1_FAKEOUT;
    if (value == "s2_support_touch") return PhaseEventType::S2_SUPPORT_TOUCH;
    if (value == "s2_fakeout") return PhaseEventType::S2_FAKEOUT;
    if (value == "s3_active") return PhaseEventType::S3_ACTIVE;
    if (value == "s3_sr_reclaim") return PhaseEventType::S3_SR_RECLAIM;
    if (value == "s3_exit") return PhaseEventType::S3_EXIT;
    if (value == "emergency_exit_on") return PhaseEventType::EMERGENCY_EXIT_ON;
    if (value == "emergency_exit_off") return PhaseEventType::EMERGENCY_EXIT_OFF;
    return std::nullopt;
}

} // namespace core
} // namespace trendphase
