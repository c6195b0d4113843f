/*
 * File:        compshot_cli.cpp
 * Module:      compshot-cli
 * Purpose:     Comparison screenshot command line tool
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "version.h"
#include "command_screenshots.h"
#include "errors.h"
#include "geometry.h"
#include "logging.h"
#include "run_config.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace compshot;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "compshot " << COMPSHOT_VERSION << "\n";
    std::cerr << "Usage: " << program_name << " [--source FILE] [--encodes FILE...] [options]\n";
    std::cerr << "\n";
    std::cerr << "Generate comparison screenshots of a source and its encodes. Clips are cropped to\n";
    std::cerr << "shared dimensions, HDR sources are tonemapped and each frame gets an info overlay.\n";
    std::cerr << "\n";
    std::cerr << "Inputs:\n";
    std::cerr << "  --source, -s FILE              Source file\n";
    std::cerr << "  --encodes, -e FILE...          Encoded file(s) to screenshot\n";
    std::cerr << "  --input-directory, -d DIR      Folder containing the encodes (replaces --encodes)\n";
    std::cerr << "\n";
    std::cerr << "Frames:\n";
    std::cerr << "  --frames, -f N...              Screenshot frames\n";
    std::cerr << "  --random-frames, -r START STOP COUNT\n";
    std::cerr << "                                 Pick COUNT random frames from [START, STOP)\n";
    std::cerr << "  --seed N                       Seed for --random-frames\n";
    std::cerr << "  --offset, -o N                 Frame offset of the source relative to the encodes\n";
    std::cerr << "\n";
    std::cerr << "Output:\n";
    std::cerr << "  --crop, -c WIDTH HEIGHT | RES  Output dimensions (e.g. 1920 800, or 1080p)\n";
    std::cerr << "                                 Default: first encode's dimensions\n";
    std::cerr << "  --titles, -t TITLE...          Overlay titles, in file order\n";
    std::cerr << "  --output-directory, -od DIR    Where screenshots are written\n";
    std::cerr << "                                 Default: 'screens t<N>-offset_<offset>' next to the inputs\n";
    std::cerr << "  --resize-kernel, -k NAME       bilinear, bicubic, point, lanczos, spline16, spline36,\n";
    std::cerr << "                                 spline64. Default: spline36\n";
    std::cerr << "  --load-filter, -lf NAME        ffms2 or lsmas. Default: ffms2\n";
    std::cerr << "  --no-frame-info, -ni           Don't draw the frame info overlay\n";
    std::cerr << "\n";
    std::cerr << "General:\n";
    std::cerr << "  --config FILE                  YAML run configuration (tonemap, screenshots, logging)\n";
    std::cerr << "  --log-level LEVEL              Set logging verbosity\n";
    std::cerr << "                                 (trace, debug, info, warn, error, critical, off)\n";
    std::cerr << "                                 Default: info\n";
    std::cerr << "  --log-file FILE                Write logs to specified file\n";
    std::cerr << "  --help, -h                     Show this help\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " -s src.mkv -e t1.mkv t2.mkv -f 1000 2000 --offset 2000\n";
    std::cerr << "  " << program_name << " -s src.mkv -e t1.mkv -r 100 25000 25 --seed 7\n";
    std::cerr << "  " << program_name << " -s movie/src.mkv -d movie --crop 1080p\n";
}

bool parse_int(const std::string& text, int64_t& value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return false;
    }
    value = parsed;
    return true;
}

/// Values following option argv[i]: everything up to the next option.
/// Negative numbers count as values.
std::vector<std::string> collect_values(int argc, char* argv[], int& i) {
    std::vector<std::string> values;
    while (i + 1 < argc) {
        const std::string next = argv[i + 1];
        int64_t number = 0;
        if (!next.empty() && next[0] == '-' && !parse_int(next, number)) {
            break;
        }
        values.push_back(next);
        ++i;
    }
    return values;
}

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

int64_t require_int(const std::string& option, const std::string& text) {
    int64_t value = 0;
    if (!parse_int(text, value)) {
        throw UsageError(option + " expects an integer, got '" + text + "'");
    }
    return value;
}

std::string require_path(const std::string& option, const std::string& text) {
    std::error_code ec;
    if (!std::filesystem::exists(text, ec)) {
        throw UsageError(option + ": path does not exist: " + text);
    }
    return text;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    cli::ScreenshotOptions options;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Parse all arguments
    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "--source" || arg == "-s") && i + 1 < argc) {
                options.source = require_path(arg, argv[++i]);
            } else if (arg == "--encodes" || arg == "-e") {
                for (const auto& value : collect_values(argc, argv, i)) {
                    options.encodes.push_back(require_path(arg, value));
                }
                if (options.encodes.empty()) {
                    throw UsageError(arg + " expects at least one file");
                }
            } else if ((arg == "--input-directory" || arg == "-d") && i + 1 < argc) {
                options.input_directory = require_path(arg, argv[++i]);
            } else if (arg == "--frames" || arg == "-f") {
                for (const auto& value : collect_values(argc, argv, i)) {
                    options.frames.push_back(require_int(arg, value));
                }
                if (options.frames.empty()) {
                    throw UsageError(arg + " expects at least one frame number");
                }
            } else if (arg == "--random-frames" || arg == "-r") {
                const auto values = collect_values(argc, argv, i);
                if (values.size() != 3) {
                    throw UsageError(arg + " expects START STOP COUNT");
                }
                options.random_frames = cli::RandomFrameRange{
                    require_int(arg, values[0]), require_int(arg, values[1]), require_int(arg, values[2])};
            } else if (arg == "--seed" && i + 1 < argc) {
                options.seed = static_cast<uint64_t>(require_int(arg, argv[++i]));
            } else if ((arg == "--offset" || arg == "-o") && i + 1 < argc) {
                options.offset = require_int(arg, argv[++i]);
            } else if (arg == "--crop" || arg == "-c") {
                const auto values = collect_values(argc, argv, i);
                if (values.size() == 2) {
                    options.crop = checked_dimensions(require_int(arg, values[0]),
                                                      require_int(arg, values[1]));
                } else if (values.size() == 1) {
                    options.crop = standard_dimensions(values[0]);
                } else {
                    throw UsageError(arg + " expects WIDTH HEIGHT or a resolution such as 1080p");
                }
            } else if (arg == "--titles" || arg == "-t") {
                options.titles = collect_values(argc, argv, i);
            } else if ((arg == "--output-directory" || arg == "-od") && i + 1 < argc) {
                options.output_directory = argv[++i];
            } else if ((arg == "--resize-kernel" || arg == "-k") && i + 1 < argc) {
                options.resize_kernel = argv[++i];
            } else if ((arg == "--load-filter" || arg == "-lf") && i + 1 < argc) {
                options.load_filter = argv[++i];
            } else if (arg == "--no-frame-info" || arg == "-ni") {
                options.no_frame_info = true;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = require_path(arg, argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                log_file = argv[++i];
            } else {
                throw UsageError("Unknown option or missing value: " + arg);
            }
        }

        if (options.frames.empty() && !options.random_frames) {
            throw UsageError("No frames were provided. Use --frames or --random-frames");
        }
        if (!options.source && options.encodes.empty() && !options.input_directory) {
            throw UsageError("No files or directories were provided");
        }
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    try {
        RunConfig config;
        if (config_path) {
            config = load_run_config(*config_path);
        }

        // Command line overrides the configuration file
        compshot::init_logging(log_level.value_or(config.logging.level),
                               "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                               log_file.value_or(config.logging.file));

        return cli::screenshots_command(options, config);
    } catch (const std::exception& e) {
        std::cerr << "\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
