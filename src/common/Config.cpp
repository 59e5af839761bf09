#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace trendphase {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
#ifdef _WIN32
    char* value = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value, &len, name) != 0 || value == nullptr || len == 0) {
        if (value != nullptr) {
            free(value);
        }
        return "";
    }
    std::string out = trimCopy(value);
    free(value);
    return out;
#else
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
#endif
}

engine::RunMode parseMode(std::string mode) {
    std::transform(mode.begin(), mode.end(), mode.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (mode == "LOOP") {
        return engine::RunMode::LOOP;
    }
    if (mode == "BACKTEST") {
        return engine::RunMode::BACKTEST;
    }
    return engine::RunMode::ONCE;
}

// 상대 경로는 base 아래로
std::string rebase(const std::filesystem::path& base, const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (base / p.filename()).string();
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    engine_config_ = engine::EngineConfig();
    loaded_ = false;
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else if (std::filesystem::exists(path)) {
            config_path = std::filesystem::absolute(path);
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::clog << "Config path: " << config_path.string() << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::clog << "Warning: config file not found, using defaults." << std::endl;
            applyDataDirOverride();
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::clog << "Warning: cannot open config file, using defaults." << std::endl;
            applyDataDirOverride();
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);
        loaded_ = true;

        std::clog << "Config loaded: workers=" << engine_config_.worker_threads
                  << ", adx_floor=" << engine_config_.phase.adx_floor
                  << ", positions=" << engine_config_.positions_file << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("engine")) {
        const auto& e = j["engine"];
        auto& p = engine_config_.phase;

        engine_config_.mode = parseMode(e.value("mode", std::string("ONCE")));
        p.adx_floor = e.value("adx_floor", p.adx_floor);
        p.window_bars = e.value("window_bars", p.window_bars);
        p.window_threshold = e.value("window_threshold", p.window_threshold);
        p.s1_atr_cooling_ratio = e.value("s1_atr_cooling_ratio", p.s1_atr_cooling_ratio);
        p.s1_slope_norm_flat = e.value("s1_slope_norm_flat", p.s1_slope_norm_flat);
        p.s1_dsep_flat = e.value("s1_dsep_flat", p.s1_dsep_flat);
        p.s1_min_pullback_pct = e.value("s1_min_pullback_pct", p.s1_min_pullback_pct);
        p.s3_entry_trend_strength = e.value("s3_entry_trend_strength", p.s3_entry_trend_strength);
        p.s3_entry_slow_slopes_min = e.value("s3_entry_slow_slopes_min", p.s3_entry_slow_slopes_min);
        p.halo_atr_mult = e.value("halo_atr_mult", p.halo_atr_mult);
        p.halo_price_pct = e.value("halo_price_pct", p.halo_price_pct);
        p.edx_ema_span = e.value("edx_ema_span", p.edx_ema_span);
        p.bounce_window_bars = e.value("bounce_window_bars", p.bounce_window_bars);
        p.bar_interval_ms = e.value("bar_interval_ms", p.bar_interval_ms);
        p.fakeout_votes_required = e.value("fakeout_votes_required", p.fakeout_votes_required);

        if (e.contains("hysteresis")) {
            const auto& h = e["hysteresis"];
            p.hysteresis.on_threshold = h.value("on_threshold", p.hysteresis.on_threshold);
            p.hysteresis.off_threshold = h.value("off_threshold", p.hysteresis.off_threshold);
            p.hysteresis.on_bars = h.value("on_bars", p.hysteresis.on_bars);
            p.hysteresis.off_bars = h.value("off_bars", p.hysteresis.off_bars);
        }

        if (e.contains("sigmoid_scales")) {
            const auto& k = e["sigmoid_scales"];
            p.k.s1_curvature_k = k.value("s1_curvature_k", p.k.s1_curvature_k);
            p.k.s1_comp_inv_k = k.value("s1_comp_inv_k", p.k.s1_comp_inv_k);
            p.k.s1_expansion_k = k.value("s1_expansion_k", p.k.s1_expansion_k);
            p.k.s3_rail_fast_k = k.value("s3_rail_fast_k", p.k.s3_rail_fast_k);
            p.k.s3_rail_mid_k = k.value("s3_rail_mid_k", p.k.s3_rail_mid_k);
            p.k.s3_rail_144_k = k.value("s3_rail_144_k", p.k.s3_rail_144_k);
            p.k.s3_rail_250_k = k.value("s3_rail_250_k", p.k.s3_rail_250_k);
            p.k.s3_exp_fast_k = k.value("s3_exp_fast_k", p.k.s3_exp_fast_k);
            p.k.s3_exp_mid_k = k.value("s3_exp_mid_k", p.k.s3_exp_mid_k);
            p.k.rsi_k = k.value("rsi_k", p.k.rsi_k);
            p.k.adx_k = k.value("adx_k", p.k.adx_k);
            p.k.edx_slow_k = k.value("edx_slow_k", p.k.edx_slow_k);
            p.k.edx_slow_333_k = k.value("edx_slow_333_k", p.k.edx_slow_333_k);
            p.k.compression_atr_k = k.value("compression_atr_k", p.k.compression_atr_k);
            p.k.compression_sep_k = k.value("compression_sep_k", p.k.compression_sep_k);
            p.k.compression_adx_k = k.value("compression_adx_k", p.k.compression_adx_k);
            p.k.sr_flip_scale = k.value("sr_flip_scale", p.k.sr_flip_scale);
        }
    }

    if (j.contains("batch")) {
        const auto& b = j["batch"];
        engine_config_.worker_threads = (std::max)(1, b.value("worker_threads", engine_config_.worker_threads));
        engine_config_.tick_timeout_seconds = b.value("tick_timeout_seconds", engine_config_.tick_timeout_seconds);
        engine_config_.scan_interval_seconds = b.value("scan_interval_seconds", engine_config_.scan_interval_seconds);
        engine_config_.write_retries = (std::max)(0, b.value("write_retries", engine_config_.write_retries));
        engine_config_.bar_window = b.value("bar_window", engine_config_.bar_window);
        engine_config_.timeframe = b.value("timeframe", engine_config_.timeframe);
    }

    if (j.contains("storage")) {
        const auto& s = j["storage"];
        engine_config_.positions_file = s.value("positions_file", engine_config_.positions_file);
        engine_config_.market_data_dir = s.value("market_data_dir", engine_config_.market_data_dir);
        engine_config_.event_journal_file = s.value("event_journal_file", engine_config_.event_journal_file);
        engine_config_.score_log_file = s.value("score_log_file", engine_config_.score_log_file);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        engine_config_.log_dir = l.value("dir", engine_config_.log_dir);
        engine_config_.log_level = l.value("level", engine_config_.log_level);
    }

    applyDataDirOverride();
}

void Config::applyDataDirOverride() {
    const std::string data_dir = readEnvVar("TRENDPHASE_DATA_DIR");
    if (data_dir.empty()) {
        return;
    }

    const std::filesystem::path base(data_dir);
    engine_config_.positions_file = rebase(base, engine_config_.positions_file);
    engine_config_.market_data_dir = rebase(base, engine_config_.market_data_dir);
    engine_config_.event_journal_file = rebase(base, engine_config_.event_journal_file);
    engine_config_.score_log_file = rebase(base, engine_config_.score_log_file);
}

} // namespace trendphase
