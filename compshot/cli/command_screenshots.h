/*
 * File:        command_screenshots.h
 * Module:      compshot-cli
 * Purpose:     Screenshot command header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "geometry.h"
#include "run_config.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace compshot {
namespace cli {

struct RandomFrameRange {
    int64_t start = 0;
    int64_t stop = 0;
    int64_t count = 0;
};

struct ScreenshotOptions {
    std::optional<std::string> source;
    std::vector<std::string> encodes;
    std::optional<std::string> input_directory;
    std::vector<int64_t> frames;
    std::optional<RandomFrameRange> random_frames;
    std::optional<uint64_t> seed;
    int64_t offset = 0;
    std::optional<Dimensions> crop;
    std::vector<std::string> titles;
    std::optional<std::string> output_directory;
    std::optional<std::string> resize_kernel;
    std::optional<std::string> load_filter;
    bool no_frame_info = false;
};

/// Run the whole screenshot job; exceptions propagate to the caller
int screenshots_command(const ScreenshotOptions& options, const RunConfig& config);

} // namespace cli
} // namespace compshot
