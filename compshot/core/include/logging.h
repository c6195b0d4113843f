/*
 * File:        logging.h
 * Module:      compshot-core
 * Purpose:     Logging system and diagnostics collaborator
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace compshot {

/// Initialize the logging system
/// Should be called once at application startup
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern Optional custom pattern (default: "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v")
/// @param log_file Optional file path to write logs to (in addition to console).
///                 Replaces the file of an earlier call; empty removes it
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Get the default logger
std::shared_ptr<spdlog::logger> get_logger();

/// Set log level at runtime
void set_log_level(const std::string& level);

/**
 * @brief Human-readable decision channel handed to the core components
 *
 * Every rescale, crop, fallback and tonemap attempt is reported through the
 * Diagnostics instance the component was given.
 *
 * warn_once() suppresses repeats of the same key for the lifetime of this
 * instance only.
 *
 * The default constructor writes to the process logger (and so to the log
 * file, when one is configured); tests pass their own logger.
 */
class Diagnostics {
public:
    Diagnostics();
    explicit Diagnostics(std::shared_ptr<spdlog::logger> logger);

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger_->error(fmt, std::forward<Args>(args)...);
    }

    /// Emit a warning unless one with the same key was already emitted
    /// @return true if the warning was emitted
    template<typename... Args>
    bool warn_once(const std::string& key, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!emitted_.insert(key).second) {
            return false;
        }
        logger_->warn(fmt, std::forward<Args>(args)...);
        return true;
    }

    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::set<std::string> emitted_;
};

} // namespace compshot

// Convenient logging macros
#define COMPSHOT_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(compshot::get_logger(), __VA_ARGS__)
#define COMPSHOT_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(compshot::get_logger(), __VA_ARGS__)
#define COMPSHOT_LOG_INFO(...)     SPDLOG_LOGGER_INFO(compshot::get_logger(), __VA_ARGS__)
#define COMPSHOT_LOG_WARN(...)     SPDLOG_LOGGER_WARN(compshot::get_logger(), __VA_ARGS__)
#define COMPSHOT_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(compshot::get_logger(), __VA_ARGS__)
#define COMPSHOT_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(compshot::get_logger(), __VA_ARGS__)

#define LOG_TRACE(...)    COMPSHOT_LOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...)    COMPSHOT_LOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)     COMPSHOT_LOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)     COMPSHOT_LOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...)    COMPSHOT_LOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) COMPSHOT_LOG_CRITICAL(__VA_ARGS__)
