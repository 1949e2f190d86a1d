#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace padlock::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system.
     * Not synchronized with other init() calls; call it before starting threads.
     * @param level Log level (trace, debug, info, warn, error, critical)
     * @param log_to_file Whether to log to padlock.log in addition to stderr
     */
    static void init(const std::string& level = "warn", bool log_to_file = false);

    /**
     * Get the logger instance, creating a default one on first use.
     * Safe to call concurrently.
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Map a level name to spdlog; unknown names map to info
     */
    static spdlog::level::level_enum parse_level(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::once_flag default_init_;
};

} // namespace padlock::utils

// Convenience macros
#define PADLOCK_LOG_TRACE(...)    padlock::utils::Logger::get()->trace(__VA_ARGS__)
#define PADLOCK_LOG_DEBUG(...)    padlock::utils::Logger::get()->debug(__VA_ARGS__)
#define PADLOCK_LOG_INFO(...)     padlock::utils::Logger::get()->info(__VA_ARGS__)
#define PADLOCK_LOG_WARN(...)     padlock::utils::Logger::get()->warn(__VA_ARGS__)
#define PADLOCK_LOG_ERROR(...)    padlock::utils::Logger::get()->error(__VA_ARGS__)
#define PADLOCK_LOG_CRITICAL(...) padlock::utils::Logger::get()->critical(__VA_ARGS__)
