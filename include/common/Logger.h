#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace capsim {

class Logger {
public:
    static Logger& getInstance();
    // console_to_stderr: stdout 을 결과(JSON) 전용으로 쓸 때 콘솔 로그를 stderr 로
    void initialize(const std::string& log_dir = "logs",
                    const std::string& level = "info",
                    bool console_to_stderr = false);
    void setLevel(const std::string& level);
    bool isInitialized() const { return initialized_; }

    // 초기화 전 호출은 무시됨 (라이브러리/테스트 코드에서 안전)
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
    
    // trades.log: market,entry_time,exit_time,entry_price,exit_price,quantity,pnl,return_pct,reason
    void logTrade(const std::string& market,
                  const std::string& entry_time, const std::string& exit_time,
                  double entry_price, double exit_price, double quantity,
                  double pnl, double return_pct, const std::string& reason);
    
private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> trade_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) capsim::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) capsim::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) capsim::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) capsim::Logger::getInstance().error(__VA_ARGS__)

} // namespace capsim
