#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace padlock::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::once_flag Logger::default_init_;

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

void Logger::init(const std::string& level, bool log_to_file) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink on stderr; stdout carries command output
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "padlock.log",
            1024 * 1024 * 10,  // 10MB
            3                   // 3 rotating files
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("padlock", sinks.begin(), sinks.end());
    logger_->set_level(parse_level(level));
    logger_->flush_on(spdlog::level::err);

    spdlog::set_default_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::call_once(default_init_, [] {
        if (!logger_) {
            init();
        }
    });
    return logger_;
}

} // namespace padlock::utils
