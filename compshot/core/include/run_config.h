/*
 * File:        run_config.h
 * Module:      compshot-core
 * Purpose:     YAML run configuration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "tonemap_settings.h"
#include "video_backend.h"
#include <string>

namespace compshot {

struct ScreenshotSettings {
    ResizeKernel resize_kernel = ResizeKernel::Spline36;
    SourceFilter load_filter = SourceFilter::FFMS2;
    int crop_modulus = 2;
    bool frame_info = true;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;
};

/**
 * @brief Everything a run can be configured with besides its inputs
 *
 * Command-line options are applied on top of this.
 */
struct RunConfig {
    TonemapSettings tonemap;
    ScreenshotSettings screenshots;
    LoggingSettings logging;
};

/**
 * @brief Load a run configuration file
 *
 * Sections and keys are all optional; missing ones keep their defaults.
 *
 * @throws ConfigurationError on parse errors and out-of-range values
 * @throws UnknownKernelError / UnknownLoaderError for bad names
 */
RunConfig load_run_config(const std::string& filename);

/**
 * @brief Parse configuration text
 * @param origin Name used in error messages
 */
RunConfig parse_run_config(const std::string& yaml_text, const std::string& origin = "<string>");

/// Reject settings no tonemap backend can honour
/// @throws ConfigurationError naming @p origin and the offending key
void validate_tonemap_settings(const TonemapSettings& settings, const std::string& origin);

} // namespace compshot
