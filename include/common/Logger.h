#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace trendphase {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // 초기화 전에는 모든 호출이 no-op (라이브러리/테스트에서 안전)
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // 상태 전이 CSV 기록: contract,chain,from,to,ts_ms
    void logTransition(const std::string& contract, const std::string& chain,
                       const std::string& from_state, const std::string& to_state,
                       long long ts_ms);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> transition_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) trendphase::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) trendphase::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) trendphase::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) trendphase::Logger::getInstance().error(__VA_ARGS__)

} // namespace trendphase
