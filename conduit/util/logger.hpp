#ifndef CONDUIT_LOGGER_HPP
#define CONDUIT_LOGGER_HPP
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <memory>

namespace conduit {
    namespace logging {
        // Get/set the logger instance used by the library
        inline std::shared_ptr<spdlog::logger>& get_logger() {
            static std::shared_ptr<spdlog::logger> logger;
            return logger;
        }

        // Set a custom logger for the library
        inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
            get_logger() = logger;
        }

        // Enable logging with default console logger
        inline void enable() {
            auto& logger = get_logger();
            if (!logger) {
                // Reuse the registered logger if enable() was called before a disable()
                logger = spdlog::get("conduit");
                if (!logger) {
                    logger = spdlog::stdout_color_mt("conduit");
                }
                logger->set_level(spdlog::level::info);
                // Pattern: time [level:8] [thread_id] message
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%-8l%$] [%t] %v");
            }
        }

        // Set log level for the library logger
        inline void set_log_level(spdlog::level::level_enum level) {
            if (auto logger = get_logger()) {
                logger->set_level(level);
            }
        }

        // Set log level from its name ("trace", "debug", "info", "warn", "error", "critical", "off")
        inline void set_log_level(const std::string& level) {
            set_log_level(spdlog::level::from_str(level));
        }

        // Disable logging completely
        inline void disable() {
            set_logger(nullptr);
        }
    }
}

// Internal macro that only logs when a logger is installed
#define CONDUIT_LOG_IMPL(level, ...) \
    do { \
        if (auto _logger = conduit::logging::get_logger()) { \
            _logger->log(level, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...)     CONDUIT_LOG_IMPL(spdlog::level::info, __VA_ARGS__)
#define LOG_ERROR(...)    CONDUIT_LOG_IMPL(spdlog::level::err, __VA_ARGS__)
#define LOG_WARNING(...)  CONDUIT_LOG_IMPL(spdlog::level::warn, __VA_ARGS__)
#define LOG_DEBUG(...)    CONDUIT_LOG_IMPL(spdlog::level::debug, __VA_ARGS__)
#define LOG_TRACE(...)    CONDUIT_LOG_IMPL(spdlog::level::trace, __VA_ARGS__)

#define CONDUIT_LOG(...)                LOG_INFO(__VA_ARGS__)
#define CONDUIT_LOG_ERROR(...)          LOG_ERROR(__VA_ARGS__)

#endif
