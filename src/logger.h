#ifndef MONEX_LOGGER_H
#define MONEX_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>

namespace Monex {

/**
 * @brief Centralized logger utility using spdlog
 *
 * Provides named loggers for the two components:
 * - core: rounding, arithmetic and allocation decisions (debug level)
 * - cli: the monex command-line tool
 *
 * Each logger writes to stderr (with colors) and, when a log directory is
 * given, to a rotating file as well. The loggers are private to Monex: they
 * are not registered with spdlog and never change spdlog's global settings.
 */
class Logger {
public:
    /**
     * @brief Initialize all loggers with specified directory and level
     * @param logDir Directory for log files; empty disables file output (default: "")
     * @param level Log level: "trace", "debug", "info", "warn", "error", "critical", "off" (default: "info")
     */
    static void init(const std::string& logDir = "", const std::string& level = "info");

    /**
     * @brief Get the core logger
     */
    static std::shared_ptr<spdlog::logger> core();

    /**
     * @brief Get the cli logger
     */
    static std::shared_ptr<spdlog::logger> cli();

    /**
     * @brief Shutdown all loggers and flush pending messages
     */
    static void shutdown();

    /**
     * @brief Parse log level string to spdlog level enum
     */
    static spdlog::level::level_enum parseLogLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> coreLogger;
    static std::shared_ptr<spdlog::logger> cliLogger;
    static bool initialized;
    static std::mutex initMutex;

    // Caller holds initMutex
    static void initLocked(const std::string& logDir, const std::string& level);

    static std::shared_ptr<spdlog::logger> createLogger(
        const std::string& name,
        const std::string& logDir,
        spdlog::level::level_enum level
    );
};

// Convenience macros for cleaner code. Arguments are only evaluated when the
// level is enabled, so BigInt renderings cost nothing with debug logging off.
#define MONEX_LOG_AT(logger, lvl, ...)                     \
    do {                                                   \
        auto monexLogger_ = (logger);                      \
        if (monexLogger_->should_log(lvl)) {               \
            monexLogger_->log(lvl, __VA_ARGS__);           \
        }                                                  \
    } while (0)

#define LOG_TRACE(logger, ...) MONEX_LOG_AT(logger, spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(logger, ...) MONEX_LOG_AT(logger, spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(logger, ...) MONEX_LOG_AT(logger, spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(logger, ...) MONEX_LOG_AT(logger, spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(logger, ...) MONEX_LOG_AT(logger, spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(logger, ...) MONEX_LOG_AT(logger, spdlog::level::critical, __VA_ARGS__)

} // namespace Monex

#endif // MONEX_LOGGER_H
