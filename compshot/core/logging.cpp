/*
 * File:        logging.cpp
 * Module:      compshot-core
 * Purpose:     Logging system implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cctype>

namespace compshot {

static std::shared_ptr<spdlog::logger> g_logger;

namespace {

/**
 * @brief Point the process logger's file output at @p log_file
 *
 * The console sink always stays first. A file sink from an earlier call is
 * replaced, so re-initializing never duplicates lines. The file is
 * truncated on open; if it cannot be opened the logger stays console-only
 * and says so.
 */
void attach_file_sink(spdlog::logger& logger, const std::string& pattern, const std::string& log_file) {
    auto& sinks = logger.sinks();
    if (sinks.size() > 1) {
        sinks.resize(1);
    }
    if (log_file.empty()) {
        return;
    }

    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
        file_sink->set_pattern(pattern);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
        logger.warn("Unable to open log file '{}': {}. Logging to console only", log_file, e.what());
    }
}

} // anonymous namespace

void init_logging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    if (!g_logger) {
        // Create console logger with color
        g_logger = spdlog::stdout_color_mt("compshot");
    }
    g_logger->set_pattern(pattern);
    attach_file_sink(*g_logger, pattern, log_file);

    // Set log level
    set_log_level(level);
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!g_logger) {
        // Auto-initialize if not done yet
        init_logging();
    }
    return g_logger;
}

void set_log_level(const std::string& level) {
    auto logger = get_logger();

    std::string l = level;
    for (auto& c : l) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));

    if (l == "trace") {
        logger->set_level(spdlog::level::trace);
    } else if (l == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (l == "info") {
        logger->set_level(spdlog::level::info);
    } else if (l == "warn" || l == "warning") {
        logger->set_level(spdlog::level::warn);
    } else if (l == "error") {
        logger->set_level(spdlog::level::err);
    } else if (l == "critical") {
        logger->set_level(spdlog::level::critical);
    } else if (l == "off") {
        logger->set_level(spdlog::level::off);
    } else {
        logger->warn("Unknown log level '{}', using 'info'", level);
        logger->set_level(spdlog::level::info);
    }
}

// Diagnostics

Diagnostics::Diagnostics()
    : logger_(get_logger())
{
}

// A null logger means the process logger
Diagnostics::Diagnostics(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : get_logger())
{
}

} // namespace compshot
