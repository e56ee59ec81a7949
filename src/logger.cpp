#include "logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace Monex {

// Static member initialization
std::shared_ptr<spdlog::logger> Logger::coreLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::cliLogger = nullptr;
bool Logger::initialized = false;
std::mutex Logger::initMutex;

void Logger::init(const std::string& logDir, const std::string& level) {
    std::lock_guard<std::mutex> lock(initMutex);
    initLocked(logDir, level);
}

void Logger::initLocked(const std::string& logDir, const std::string& level) {
    if (initialized) {
        return; // Already initialized
    }

    if (!logDir.empty()) {
        std::filesystem::create_directories(logDir);
    }

    spdlog::level::level_enum logLevel = parseLogLevel(level);

    coreLogger = createLogger("core", logDir, logLevel);
    cliLogger = createLogger("cli", logDir, logLevel);

    initialized = true;

    if (cliLogger->should_log(spdlog::level::debug)) {
        cliLogger->debug("Monex Logger initialized - Log directory: {}, Level: {}",
                         logDir.empty() ? "<none>" : logDir, level);
    }
}

std::shared_ptr<spdlog::logger> Logger::core() {
    std::lock_guard<std::mutex> lock(initMutex);
    initLocked("", "info"); // Defaults if not done yet
    return coreLogger;
}

std::shared_ptr<spdlog::logger> Logger::cli() {
    std::lock_guard<std::mutex> lock(initMutex);
    initLocked("", "info");
    return cliLogger;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(initMutex);
    if (!initialized) {
        return;
    }

    if (coreLogger) coreLogger->flush();
    if (cliLogger) cliLogger->flush();

    coreLogger = nullptr;
    cliLogger = nullptr;
    initialized = false;
}

std::shared_ptr<spdlog::logger> Logger::createLogger(
    const std::string& name,
    const std::string& logDir,
    spdlog::level::level_enum level
) {
    std::vector<spdlog::sink_ptr> sinks;

    // stderr keeps stdout free for command results
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(level);
    sinks.push_back(consoleSink);

    if (!logDir.empty()) {
        // Rotating file sink (10MB max, 3 backup files)
        std::string logFilePath = logDir + "/" + name + ".log";
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath,
            1024 * 1024 * 10,
            3
        );
        fileSink->set_level(level);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    // [timestamp] [logger_name] [level] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    return logger;
}

spdlog::level::level_enum Logger::parseLogLevel(const std::string& level) {
    std::string lowerLevel = level;
    std::transform(lowerLevel.begin(), lowerLevel.end(), lowerLevel.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerLevel == "trace") return spdlog::level::trace;
    if (lowerLevel == "debug") return spdlog::level::debug;
    if (lowerLevel == "info") return spdlog::level::info;
    if (lowerLevel == "warn" || lowerLevel == "warning") return spdlog::level::warn;
    if (lowerLevel == "error" || lowerLevel == "err") return spdlog::level::err;
    if (lowerLevel == "critical" || lowerLevel == "crit") return spdlog::level::critical;
    if (lowerLevel == "off") return spdlog::level::off;

    // Default to info if unrecognized
    return spdlog::level::info;
}

} // namespace Monex
