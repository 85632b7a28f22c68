/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with standardized configuration. The console sink writes
 * to stderr so log lines never interleave with program output on stdout.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "exceptions.h"

namespace fizzbuzz::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to an spdlog level
     * @param logLevel trace, debug, info, warn, error, critical or off
     * @throws ConfigException if the name is not recognized
     */
    static spdlog::level::level_enum parseLevel(const std::string& logLevel) {
        if (logLevel == "trace") return spdlog::level::trace;
        if (logLevel == "debug") return spdlog::level::debug;
        if (logLevel == "info") return spdlog::level::info;
        if (logLevel == "warn") return spdlog::level::warn;
        if (logLevel == "error") return spdlog::level::err;
        if (logLevel == "critical") return spdlog::level::critical;
        if (logLevel == "off") return spdlog::level::off;
        throw ConfigException("unknown log level '" + logLevel + "'");
    }

    /**
     * @brief Initialize the default logger
     * @param name Logger name (e.g., "fizzbuzz")
     * @param logLevel Log level; unknown names fall back to warn
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "warn",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink (colored, stderr)
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            // File sink (if enabled); an unopenable file leaves the console sink alone
            std::string fileError;
            if (logToFile && !logFile.empty()) {
                try {
                    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                    );
                    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                    sinks.push_back(fileSink);
                } catch (const spdlog::spdlog_ex& ex) {
                    fileError = ex.what();
                }
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());

            bool levelRecognized = true;
            try {
                logger->set_level(parseLevel(logLevel));
            } catch (const ConfigException&) {
                logger->set_level(spdlog::level::warn);
                levelRecognized = false;
            }

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            if (!levelRecognized) {
                spdlog::warn("Unknown log level '{}', using warn", logLevel);
            }
            if (!fileError.empty()) {
                spdlog::warn("File logging disabled, cannot open '{}': {}", logFile, fileError);
            }
            spdlog::info("Logger initialized: name={}, level={}, file={}",
                         name, logLevel, fileError.empty() && logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Set log level at runtime
     * @throws ConfigException if the name is not recognized
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace fizzbuzz::common
