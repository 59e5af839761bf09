#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestRunner.h"
#include "core/orchestration/PhaseCycleCoordinator.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/MarketDataStoreFiles.h"
#include "core/state/PositionStoreJson.h"
#include "core/state/ScoreLogJsonl.h"
#include "engine/PhaseBatchRunner.h"

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace trendphase;

namespace {

std::shared_ptr<engine::PhaseBatchRunner> g_runner;

void signalHandler(int signal) {
    if (signal == SIGINT && g_runner) {
        g_runner->stop();
    }
}

void printUsage() {
    std::cout << "Usage:\n"
              << "  trendphase [--config <path>] --once [--as-of <ms>]\n"
              << "  trendphase [--config <path>] --loop\n"
              << "  trendphase [--config <path>] --backtest <chain> <contract> --from <ms> --to <ms>"
                 " [--step <ms>] [--json]\n";
}

struct CliOptions {
    std::string config_path = "config/config.json";
    engine::RunMode mode = engine::RunMode::ONCE;
    bool mode_given = false;
    long long as_of_ms = 0;

    std::string chain;
    std::string contract;
    long long from_ms = 0;
    long long to_ms = 0;
    long long step_ms = 0;
    bool json_mode = false;
};

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string("missing value for ") + name);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            opts.config_path = next("--config");
        } else if (arg == "--once") {
            opts.mode = engine::RunMode::ONCE;
            opts.mode_given = true;
        } else if (arg == "--loop") {
            opts.mode = engine::RunMode::LOOP;
            opts.mode_given = true;
        } else if (arg == "--as-of") {
            opts.as_of_ms = std::stoll(next("--as-of"));
        } else if (arg == "--backtest") {
            opts.mode = engine::RunMode::BACKTEST;
            opts.mode_given = true;
            opts.chain = next("--backtest");
            opts.contract = next("--backtest");
        } else if (arg == "--from") {
            opts.from_ms = std::stoll(next("--from"));
        } else if (arg == "--to") {
            opts.to_ms = std::stoll(next("--to"));
        } else if (arg == "--step") {
            opts.step_ms = std::stoll(next("--step"));
        } else if (arg == "--json") {
            opts.json_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    return opts;
}

int runBacktest(const CliOptions& opts, const engine::EngineConfig& config) {
    if (opts.to_ms <= 0 || opts.from_ms <= 0) {
        throw std::invalid_argument("--backtest requires --from and --to");
    }

    auto market = std::make_shared<core::MarketDataStoreFiles>(config.market_data_dir);
    backtest::BacktestRunner runner(market, market, market, config);
    auto result = runner.run(opts.chain, opts.contract, opts.from_ms, opts.to_ms, opts.step_ms);

    if (opts.json_mode) {
        std::cout << backtest::BacktestRunner::toJson(result).dump() << "\n";
        return 0;
    }

    std::cout << "\nBacktest result " << result.chain << ":" << result.contract << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Cycles:          " << result.cycles << "\n";
    std::cout << "Updated:         " << result.updated << "\n";
    std::cout << "Skipped no data: " << result.skipped_no_data << "\n";
    std::cout << "Transitions:     " << result.transitions << "\n";
    std::cout << "Final state:     " << (result.final_state ? core::phaseName(*result.final_state) : "-") << "\n";
    std::cout << "State counts:\n";
    for (const auto& kv : result.state_counts) {
        std::cout << "  - " << kv.first << ": " << kv.second << "\n";
    }
    if (!result.event_counts.empty()) {
        std::cout << "Events:\n";
        for (const auto& kv : result.event_counts) {
            std::cout << "  - " << kv.first << ": " << kv.second << "\n";
        }
    }
    std::cout << "---------------------------------------------\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage();
        return 2;
    }

    try {
        auto& cfg = Config::getInstance();
        cfg.load(opts.config_path);
        auto config = cfg.getEngineConfig();
        if (opts.mode_given) {
            config.mode = opts.mode;
        }

        // --json 출력은 stdout 만 사용
        if (!opts.json_mode) {
            Logger::getInstance().initialize(config.log_dir, config.log_level);
        }

        if (config.mode == engine::RunMode::BACKTEST) {
            return runBacktest(opts, config);
        }

        auto positions = std::make_shared<core::PositionStoreJson>(config.positions_file);
        auto market = std::make_shared<core::MarketDataStoreFiles>(config.market_data_dir);
        auto journal = std::make_shared<core::EventJournalJsonl>(config.event_journal_file);
        auto score_log = std::make_shared<core::ScoreLogJsonl>(config.score_log_file);

        auto coordinator = std::make_shared<core::PhaseCycleCoordinator>(
            positions, market, market, market, journal, score_log, config
        );
        g_runner = std::make_shared<engine::PhaseBatchRunner>(coordinator, config);

        if (config.mode == engine::RunMode::LOOP) {
            LOG_INFO("========================================");
            LOG_INFO("TrendPhase loop mode");
            LOG_INFO("========================================");
            std::signal(SIGINT, signalHandler);
            g_runner->runLoop();
            LOG_INFO("Program terminated");
            return 0;
        }

        const long long as_of = opts.as_of_ms > 0 ? opts.as_of_ms : nowMs();
        auto summary = g_runner->runTick(as_of);
        std::cout << "total=" << summary.total
                  << " updated=" << summary.updated
                  << " skipped_no_data=" << summary.skipped_no_data
                  << " failed=" << summary.failed
                  << " timed_out=" << summary.timed_out
                  << " duration_ms=" << summary.duration_ms << "\n";
        return summary.failed > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
