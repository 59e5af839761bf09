#include "core/model/PhaseJson.h"

namespace trendphase {
namespace core {

namespace {
using nlohmann::json;

const json& childOrEmpty(const json& parent, const char* key) {
    static const json empty = json::object();
    if (!parent.is_object()) {
        return empty;
    }
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

// 누락/null/비숫자 값은 기본값으로 처리
double numberOr(const json& obj, const char* key, double fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

long long integerOr(const json& obj, const char* key, long long fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<long long>();
}

bool boolOr(const json& obj, const char* key, bool fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

std::string stringOr(const json& obj, const char* key, const std::string& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

json doubleMapToJson(const std::map<std::string, double>& values) {
    json out = json::object();
    for (const auto& kv : values) {
        out[kv.first] = kv.second;
    }
    return out;
}

std::map<std::string, double> doubleMapFromJson(const json& raw) {
    std::map<std::string, double> out;
    if (!raw.is_object()) {
        return out;
    }
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        if (it.value().is_number()) {
            out[it.key()] = it.value().get<double>();
        }
    }
    return out;
}

json baselinesToJson(const CompressionBaselines& b) {
    return {
        {"atr_norm_baseline", b.atr_norm_baseline},
        {"sep_fast_start", b.sep_fast_start},
        {"sep_mid_start", b.sep_mid_start},
        {"adx_baseline", b.adx_baseline},
        {"compression_index", b.compression_index}
    };
}

CompressionBaselines baselinesFromJson(const json& raw) {
    CompressionBaselines b;
    b.atr_norm_baseline = numberOr(raw, "atr_norm_baseline", 0.0);
    b.sep_fast_start = numberOr(raw, "sep_fast_start", 0.0);
    b.sep_mid_start = numberOr(raw, "sep_mid_start", 0.0);
    b.adx_baseline = numberOr(raw, "adx_baseline", 0.0);
    b.compression_index = numberOr(raw, "compression_index", 0.5);
    return b;
}

json flippedToJson(const std::vector<FlippedLevel>& levels) {
    json out = json::array();
    for (const auto& f : levels) {
        out.push_back({
            {"id", f.id},
            {"level", f.level},
            {"score", f.score},
            {"order", f.order},
            {"flipped_at_ms", f.flipped_at_ms}
        });
    }
    return out;
}

std::vector<FlippedLevel> flippedFromJson(const json& raw) {
    std::vector<FlippedLevel> out;
    if (!raw.is_array()) {
        return out;
    }
    for (const auto& item : raw) {
        FlippedLevel f;
        f.id = stringOr(item, "id", "");
        f.level = numberOr(item, "level", 0.0);
        f.score = numberOr(item, "score", 0.0);
        f.order = static_cast<int>(integerOr(item, "order", 0));
        f.flipped_at_ms = integerOr(item, "flipped_at_ms", 0);
        out.push_back(f);
    }
    return out;
}

json emergencyFlagToJson(const EmergencyExitFlag& em) {
    json out = {
        {"active", em.active},
        {"reason", em.reason},
        {"ts_ms", em.ts_ms},
        {"break_time_ms", em.break_time_ms},
        {"break_low", em.break_low},
        {"ema333_at_break", em.ema333_at_break},
        {"halo", em.halo},
        {"bounce_zone", {{"low", em.bounce_low}, {"high", em.bounce_high}}},
        {"window_active", em.window_active},
        {"suggested_action", em.suggested_action},
        {"below_count", em.below_count}
    };
    out["window_expires_ms"] = em.window_expires_ms ? json(*em.window_expires_ms) : json(nullptr);
    return out;
}

EmergencyExitFlag emergencyFlagFromJson(const json& raw) {
    EmergencyExitFlag em;
    em.active = boolOr(raw, "active", false);
    em.reason = stringOr(raw, "reason", "");
    em.ts_ms = integerOr(raw, "ts_ms", 0);
    em.break_time_ms = integerOr(raw, "break_time_ms", 0);
    em.break_low = numberOr(raw, "break_low", 0.0);
    em.ema333_at_break = numberOr(raw, "ema333_at_break", 0.0);
    em.halo = numberOr(raw, "halo", 0.0);
    const json& zone = childOrEmpty(raw, "bounce_zone");
    em.bounce_low = numberOr(zone, "low", 0.0);
    em.bounce_high = numberOr(zone, "high", 0.0);
    em.window_active = boolOr(raw, "window_active", false);
    if (raw.is_object() && raw.contains("window_expires_ms") && raw["window_expires_ms"].is_number()) {
        em.window_expires_ms = raw["window_expires_ms"].get<long long>();
    }
    em.suggested_action = stringOr(raw, "suggested_action", "");
    em.below_count = static_cast<int>(integerOr(raw, "below_count", 0));
    return em;
}
} // namespace

nlohmann::json payloadToJson(const EnginePayload& payload) {
    json out;
    out["schema_version"] = payload.schema_version;
    out["state"] = phaseName(payload.state);
    out["timeframe"] = payload.timeframe;
    out["ts_ms"] = payload.ts_ms;

    json flags = json::object();
    for (const auto& kv : payload.flags) {
        flags[kv.first] = kv.second;
    }
    if (payload.emergency_exit) {
        flags["emergency_exit"] = emergencyFlagToJson(*payload.emergency_exit);
    }
    out["flags"] = flags;
    out["scores"] = doubleMapToJson(payload.scores);
    out["levels"] = doubleMapToJson(payload.levels);
    out["diagnostics"] = doubleMapToJson(payload.diagnostics);

    if (payload.sr_context) {
        out["sr_context"] = {
            {"halo", payload.sr_context->halo},
            {"base_sr_level", payload.sr_context->base_sr_level},
            {"flipped_sr_levels", flippedToJson(payload.sr_context->flipped_sr_levels)}
        };
    }
    if (payload.supports) {
        out["supports"] = {
            {"active", payload.supports->active},
            {"tier_index", payload.supports->tier_index},
            {"current_sr_level", payload.supports->current_sr_level},
            {"halo", payload.supports->halo}
        };
    }
    if (payload.baselines) {
        out["baselines"] = baselinesToJson(*payload.baselines);
    }
    return out;
}

EnginePayload payloadFromJson(const nlohmann::json& raw) {
    EnginePayload payload;
    payload.schema_version = static_cast<int>(integerOr(raw, "schema_version", 1));
    payload.state = parsePhase(stringOr(raw, "state", "S0")).value_or(Phase::S0);
    payload.timeframe = stringOr(raw, "timeframe", "1h");
    payload.ts_ms = integerOr(raw, "ts_ms", 0);

    const json& flags = childOrEmpty(raw, "flags");
    for (auto it = flags.begin(); it != flags.end(); ++it) {
        if (it.key() == "emergency_exit") {
            payload.emergency_exit = emergencyFlagFromJson(it.value());
        } else if (it.value().is_boolean()) {
            payload.flags[it.key()] = it.value().get<bool>();
        }
    }

    payload.scores = doubleMapFromJson(childOrEmpty(raw, "scores"));
    payload.levels = doubleMapFromJson(childOrEmpty(raw, "levels"));
    payload.diagnostics = doubleMapFromJson(childOrEmpty(raw, "diagnostics"));

    if (raw.is_object() && raw.contains("sr_context") && raw["sr_context"].is_object()) {
        const json& sr = raw["sr_context"];
        SrContext ctx;
        ctx.halo = numberOr(sr, "halo", 0.0);
        ctx.base_sr_level = numberOr(sr, "base_sr_level", 0.0);
        ctx.flipped_sr_levels = flippedFromJson(sr.value("flipped_sr_levels", json::array()));
        payload.sr_context = ctx;
    }
    if (raw.is_object() && raw.contains("supports") && raw["supports"].is_object()) {
        const json& sp = raw["supports"];
        SupportsBlock supports;
        supports.active = boolOr(sp, "active", false);
        supports.tier_index = static_cast<int>(integerOr(sp, "tier_index", -1));
        supports.current_sr_level = numberOr(sp, "current_sr_level", 0.0);
        supports.halo = numberOr(sp, "halo", 0.0);
        payload.supports = supports;
    }
    if (raw.is_object() && raw.contains("baselines") && raw["baselines"].is_object()) {
        payload.baselines = baselinesFromJson(raw["baselines"]);
    }
    return payload;
}

nlohmann::json metaToJson(const EngineMeta& meta) {
    json out = json::object();
    if (meta.s0) {
        out["s0"] = baselinesToJson(*meta.s0);
    }
    if (meta.s1) {
        const auto& s1 = *meta.s1;
        out["s1"] = {
            {"base_sr_level", s1.base_sr_level},
            {"flipped_sr_levels", flippedToJson(s1.flipped_sr_levels)},
            {"sr_flip_score", s1.sr_flip_score},
            {"breakout_price", s1.breakout_price},
            {"breakout_ts_ms", s1.breakout_ts_ms},
            {"breakout_high", s1.breakout_high},
            {"atr_1h_at_breakout", s1.atr_at_breakout},
            {"atr_1h_peak", s1.atr_peak},
            {"atr_norm_at_breakout", s1.atr_norm_at_breakout},
            {"last_support_below_breakout", s1.last_support_below_breakout},
            {"frozen_s0", baselinesToJson(s1.frozen_s0)},
            {"breakout_scores", doubleMapToJson(s1.breakout_scores)}
        };
    }
    if (meta.s2) {
        out["s2"] = {
            {"tier_index", meta.s2->tier_index},
            {"current_sr", meta.s2->current_sr},
            {"t0_ms", meta.s2->t0_ms}
        };
    }
    if (meta.s3) {
        out["s3"] = {
            {"edx_ema", meta.s3->edx_ema},
            {"asset_key", meta.s3->asset_key}
        };
    }
    if (meta.emergency_exit) {
        out["emergency_exit"] = {
            {"break_time_ms", meta.emergency_exit->break_time_ms},
            {"break_low", meta.emergency_exit->break_low},
            {"ema333_at_break", meta.emergency_exit->ema333_at_break}
        };
    }
    if (!meta.hysteresis.empty()) {
        json hyst = json::object();
        for (const auto& kv : meta.hysteresis) {
            hyst[kv.first] = {
                {"active", kv.second.active},
                {"on_count", kv.second.on_count},
                {"off_count", kv.second.off_count},
                {"last_value", kv.second.last_value}
            };
        }
        out["hysteresis"] = hyst;
    }
    return out;
}

EngineMeta metaFromJson(const nlohmann::json& raw) {
    EngineMeta meta;
    if (!raw.is_object()) {
        return meta;
    }

    if (raw.contains("s0") && raw["s0"].is_object()) {
        meta.s0 = baselinesFromJson(raw["s0"]);
    }
    if (raw.contains("s1") && raw["s1"].is_object()) {
        const json& s1raw = raw["s1"];
        BreakoutArtifacts s1;
        s1.base_sr_level = numberOr(s1raw, "base_sr_level", 0.0);
        s1.flipped_sr_levels = flippedFromJson(s1raw.value("flipped_sr_levels", json::array()));
        s1.sr_flip_score = numberOr(s1raw, "sr_flip_score", 0.0);
        s1.breakout_price = numberOr(s1raw, "breakout_price", 0.0);
        s1.breakout_ts_ms = integerOr(s1raw, "breakout_ts_ms", 0);
        s1.breakout_high = numberOr(s1raw, "breakout_high", s1.breakout_price);
        s1.atr_at_breakout = numberOr(s1raw, "atr_1h_at_breakout", 0.0);
        s1.atr_peak = numberOr(s1raw, "atr_1h_peak", s1.atr_at_breakout);
        s1.atr_norm_at_breakout = numberOr(s1raw, "atr_norm_at_breakout", 0.0);
        s1.last_support_below_breakout = numberOr(s1raw, "last_support_below_breakout", 0.0);
        s1.frozen_s0 = baselinesFromJson(childOrEmpty(s1raw, "frozen_s0"));
        s1.breakout_scores = doubleMapFromJson(childOrEmpty(s1raw, "breakout_scores"));
        meta.s1 = s1;
    }
    if (raw.contains("s2") && raw["s2"].is_object()) {
        SupportLadderState s2;
        s2.tier_index = static_cast<int>(integerOr(raw["s2"], "tier_index", -1));
        s2.current_sr = numberOr(raw["s2"], "current_sr", 0.0);
        s2.t0_ms = integerOr(raw["s2"], "t0_ms", 0);
        meta.s2 = s2;
    }
    if (raw.contains("s3") && raw["s3"].is_object()) {
        RegimeState s3;
        s3.edx_ema = numberOr(raw["s3"], "edx_ema", 0.0);
        s3.asset_key = stringOr(raw["s3"], "asset_key", "");
        meta.s3 = s3;
    }
    if (raw.contains("emergency_exit") && raw["emergency_exit"].is_object()) {
        EmergencyExitState em;
        em.break_time_ms = integerOr(raw["emergency_exit"], "break_time_ms", 0);
        em.break_low = numberOr(raw["emergency_exit"], "break_low", 0.0);
        em.ema333_at_break = numberOr(raw["emergency_exit"], "ema333_at_break", 0.0);
        meta.emergency_exit = em;
    }
    const json& hyst = childOrEmpty(raw, "hysteresis");
    for (auto it = hyst.begin(); it != hyst.end(); ++it) {
        HysteresisState h;
        h.active = boolOr(it.value(), "active", false);
        h.on_count = static_cast<int>(integerOr(it.value(), "on_count", 0));
        h.off_count = static_cast<int>(integerOr(it.value(), "off_count", 0));
        h.last_value = numberOr(it.value(), "last_value", 0.0);
        meta.hysteresis[it.key()] = h;
    }
    return meta;
}

IndicatorSnapshot indicatorsFromJson(const nlohmann::json& ta) {
    IndicatorSnapshot s;
    if (!ta.is_object() || ta.empty()) {
        return s;
    }

    const json& ema = childOrEmpty(ta, "ema");
    const json& slopes = childOrEmpty(ta, "ema_slopes");
    const json& sep = childOrEmpty(ta, "separations");
    const json& atr = childOrEmpty(ta, "atr");
    const json& mom = childOrEmpty(ta, "momentum");
    const json& vol = childOrEmpty(ta, "volume");

    s.ts_ms = integerOr(ta, "ts_ms", 0);

    s.ema20 = numberOr(ema, "ema20_1h", 0.0);
    s.ema30 = numberOr(ema, "ema30_1h", 0.0);
    s.ema50 = numberOr(ema, "ema50_1h", 0.0);
    s.ema60 = numberOr(ema, "ema60_1h", 0.0);
    s.ema144 = numberOr(ema, "ema144_1h", 0.0);
    s.ema250 = numberOr(ema, "ema250_1h", 0.0);
    s.ema333 = numberOr(ema, "ema333_1h", 0.0);

    s.ema20_slope = numberOr(slopes, "ema20_slope", 0.0);
    s.ema30_slope = numberOr(slopes, "ema30_slope", 0.0);
    s.ema60_slope = numberOr(slopes, "ema60_slope", 0.0);
    s.ema144_slope = numberOr(slopes, "ema144_slope", 0.0);
    s.ema250_slope = numberOr(slopes, "ema250_slope", 0.0);
    s.ema333_slope = numberOr(slopes, "ema333_slope", 0.0);
    s.d_ema20_slope = numberOr(slopes, "d_ema20_slope", 0.0);
    s.d_ema60_slope = numberOr(slopes, "d_ema60_slope", 0.0);
    s.d_ema144_slope = numberOr(slopes, "d_ema144_slope", 0.0);
    s.d_ema250_slope = numberOr(slopes, "d_ema250_slope", 0.0);
    s.d_ema333_slope = numberOr(slopes, "d_ema333_slope", 0.0);

    s.sep_fast = numberOr(sep, "sep_fast", 0.0);
    s.sep_mid = numberOr(sep, "sep_mid", 0.0);
    s.dsep_fast_5 = numberOr(sep, "dsep_fast_5", 0.0);
    s.dsep_mid_5 = numberOr(sep, "dsep_mid_5", 0.0);

    s.atr = numberOr(atr, "atr_1h", 0.0);
    s.atr_mean_20 = numberOr(atr, "atr_mean_20", s.atr);
    s.atr_peak_10 = numberOr(atr, "atr_peak_10", s.atr);

    s.adx = numberOr(mom, "adx_1h", 0.0);
    s.adx_slope_10 = numberOr(mom, "adx_slope_10", 0.0);
    s.rsi_slope_10 = numberOr(mom, "rsi_slope_10", 0.0);

    s.vo_z = numberOr(vol, "vo_z_1h", 0.0);
    s.vo_z_cluster = boolOr(vol, "vo_z_cluster_1h", false);

    s.valid = true;
    return s;
}

nlohmann::json indicatorsToJson(const IndicatorSnapshot& s) {
    json ta;
    ta["ts_ms"] = s.ts_ms;
    ta["ema"] = {
        {"ema20_1h", s.ema20}, {"ema30_1h", s.ema30}, {"ema50_1h", s.ema50},
        {"ema60_1h", s.ema60}, {"ema144_1h", s.ema144}, {"ema250_1h", s.ema250},
        {"ema333_1h", s.ema333}
    };
    ta["ema_slopes"] = {
        {"ema20_slope", s.ema20_slope}, {"ema30_slope", s.ema30_slope},
        {"ema60_slope", s.ema60_slope}, {"ema144_slope", s.ema144_slope},
        {"ema250_slope", s.ema250_slope}, {"ema333_slope", s.ema333_slope},
        {"d_ema20_slope", s.d_ema20_slope}, {"d_ema60_slope", s.d_ema60_slope},
        {"d_ema144_slope", s.d_ema144_slope}, {"d_ema250_slope", s.d_ema250_slope},
        {"d_ema333_slope", s.d_ema333_slope}
    };
    ta["separations"] = {
        {"sep_fast", s.sep_fast}, {"sep_mid", s.sep_mid},
        {"dsep_fast_5", s.dsep_fast_5}, {"dsep_mid_5", s.dsep_mid_5}
    };
    ta["atr"] = {
        {"atr_1h", s.atr}, {"atr_mean_20", s.atr_mean_20}, {"atr_peak_10", s.atr_peak_10}
    };
    ta["momentum"] = {
        {"adx_1h", s.adx}, {"adx_slope_10", s.adx_slope_10}, {"rsi_slope_10", s.rsi_slope_10}
    };
    ta["volume"] = {
        {"vo_z_1h", s.vo_z}, {"vo_z_cluster_1h", s.vo_z_cluster}
    };
    return ta;
}

std::vector<SrLevel> levelsFromJson(const nlohmann::json& sr_levels) {
    std::vector<SrLevel> out;
    if (!sr_levels.is_array()) {
        return out;
    }
    for (const auto& item : sr_levels) {
        SrLevel lvl;
        // price_native_raw 우선, 없으면 price
        lvl.price = numberOr(item, "price_native_raw", numberOr(item, "price", 0.0));
        lvl.strength = numberOr(item, "strength", 0.0);
        lvl.confidence = numberOr(item, "confidence", 0.0);
        lvl.source = stringOr(item, "source", "");
        if (item.is_object() && item.contains("id")) {
            lvl.id = item["id"].is_string() ? item["id"].get<std::string>() : item["id"].dump();
        }
        if (lvl.price > 0.0) {
            out.push_back(lvl);
        }
    }
    return out;
}

} // namespace core
} // namespace trendphase
