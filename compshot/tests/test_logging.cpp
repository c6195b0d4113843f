/*
 * File:        test_logging.cpp
 * Module:      compshot-core/tests
 * Purpose:     Process logger file output and Diagnostics
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#undef NDEBUG
#include <cassert>
#include <fstream>
#include <iostream>
#include <iterator>

#include "logging.h"
#include "test_support.h"

using namespace compshot;
using compshot::test::LogCapture;
using compshot::test::TempDir;

static std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void test_log_file_replaced() {
    TempDir dir("compshot-logging");
    const auto first = dir.path() / "first.log";
    const auto second = dir.path() / "second.log";

    init_logging("info", "%l %v", first.string());
    assert(get_logger()->sinks().size() == 2);
    COMPSHOT_LOG_INFO("written to the first file");
    get_logger()->flush();

    // A second call swaps the file instead of adding another one
    init_logging("info", "%l %v", second.string());
    assert(get_logger()->sinks().size() == 2);
    COMPSHOT_LOG_WARN("written to the second file");
    get_logger()->flush();

    const std::string first_text = read_file(first);
    const std::string second_text = read_file(second);
    assert(first_text.find("written to the first file") != std::string::npos);
    assert(first_text.find("second file") == std::string::npos);
    assert(second_text.find("warning written to the second file") != std::string::npos);
    assert(second_text.find("first file") == std::string::npos);

    // No file: console only
    init_logging("info", "%l %v", "");
    assert(get_logger()->sinks().size() == 1);

    // An unwritable path keeps the console sink
    const auto blocker = dir.touch("blocker");
    init_logging("info", "%l %v", (blocker / "x.log").string());
    assert(get_logger()->sinks().size() == 1);

    std::cout << "test_log_file_replaced: PASSED\n";
}

static void test_log_levels() {
    set_log_level("WARNING");
    assert(get_logger()->level() == spdlog::level::warn);
    set_log_level("error");
    assert(get_logger()->level() == spdlog::level::err);
    set_log_level("off");
    assert(get_logger()->level() == spdlog::level::off);
    set_log_level("chatty");
    assert(get_logger()->level() == spdlog::level::info);

    std::cout << "test_log_levels: PASSED\n";
}

static void test_diagnostics() {
    LogCapture log;
    Diagnostics& diag = log.diag();

    assert(diag.warn_once("key-a", "first {}", 1));
    assert(!diag.warn_once("key-a", "first {}", 2));
    assert(diag.warn_once("key-b", "second {}", 3));
    assert(log.count("first") == 1);
    assert(log.contains("warning first 1"));
    assert(log.contains("warning second 3"));

    // Suppression belongs to one instance
    LogCapture other;
    assert(other.diag().warn_once("key-a", "first {}", 4));

    diag.info("crop {}x{}", 1920, 800);
    assert(log.contains("info crop 1920x800"));

    Diagnostics fallback(nullptr);
    assert(fallback.logger() == get_logger());

    std::cout << "test_diagnostics: PASSED\n";
}

int main() {
    test_log_file_replaced();
    test_log_levels();
    test_diagnostics();

    std::cout << "\nAll logging tests passed!\n";
    return 0;
}
