/*
 * File:        tonemap_settings.h
 * Module:      compshot-core
 * Purpose:     Process-wide tonemap configuration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "parameter_value.h"
#include <string>

namespace compshot {

/**
 * @brief libplacebo-style tonemap configuration
 *
 * Built once (defaults or run configuration) and only read afterwards.
 */
struct TonemapSettings {
    std::string function = "bt2390";      ///< Tone mapping function name
    double dst_max = 120.0;               ///< Destination peak luminance (nits)
    double dst_min = 0.1;                 ///< Destination black luminance (nits)
    bool dynamic_peak_detection = true;
    int gamut_mode = 1;                   ///< 0 clip, 1 perceptual, 2 relative, ...
    int tone_mapping_mode = 0;            ///< 0 auto, 1 rgb, 2 max, 3 hybrid, 4 luma
    int smoothing_period = 200;           ///< Scene-change smoothing window (frames)
    double min_dynamic_peak = 1.0;
    double scene_threshold_low = 1.8;
    double scene_threshold_high = 5.0;
    bool use_dovi = true;

    /// Destination colourspace (0 = SDR) and primaries (1 = BT.709)
    int dst_csp = 0;
    int dst_prim = 1;
};

// Keyword names understood by tonemap backends
namespace tonemap_key {
    inline constexpr const char* DST_CSP = "dst_csp";
    inline constexpr const char* DST_PRIM = "dst_prim";
    inline constexpr const char* DST_MAX = "dst_max";
    inline constexpr const char* DST_MIN = "dst_min";
    inline constexpr const char* DYNAMIC_PEAK_DETECTION = "dynamic_peak_detection";
    inline constexpr const char* GAMUT_MODE = "gamut_mode";
    inline constexpr const char* TONE_MAPPING_MODE = "tone_mapping_mode";
    inline constexpr const char* TONE_MAPPING_FUNCTION = "tone_mapping_function_s";
    inline constexpr const char* USE_DOVI = "use_dovi";
    inline constexpr const char* SMOOTHING_PERIOD = "smoothing_period";
    inline constexpr const char* MIN_DYNAMIC_PEAK = "min_dynamic_peak";
    inline constexpr const char* SCENE_THRESHOLD_LOW = "scene_threshold_low";
    inline constexpr const char* SCENE_THRESHOLD_HIGH = "scene_threshold_high";
    inline constexpr const char* SRC_CSP = "src_csp";
}

/// Full keyword set derived from the settings (no src_csp)
ParameterSet base_tonemap_parameters(const TonemapSettings& settings);

/**
 * @brief Diagnostic marker stored in _Tonemapped
 *
 * e.g. "placebo:bt2390,dpd=true,dst_max=120.0"
 */
std::string tonemap_marker(const TonemapSettings& settings);

} // namespace compshot
