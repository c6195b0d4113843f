/*
 * File:        tonemap_settings.cpp
 * Module:      compshot-core
 * Purpose:     Process-wide tonemap configuration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "tonemap_settings.h"
#include <fmt/format.h>
#include <cmath>

namespace compshot {

ParameterSet base_tonemap_parameters(const TonemapSettings& settings) {
    ParameterSet params;
    params[tonemap_key::DST_CSP] = static_cast<int32_t>(settings.dst_csp);
    params[tonemap_key::DST_PRIM] = static_cast<int32_t>(settings.dst_prim);
    params[tonemap_key::DST_MAX] = settings.dst_max;
    params[tonemap_key::DST_MIN] = settings.dst_min;
    params[tonemap_key::DYNAMIC_PEAK_DETECTION] = settings.dynamic_peak_detection;
    params[tonemap_key::GAMUT_MODE] = static_cast<int32_t>(settings.gamut_mode);
    params[tonemap_key::TONE_MAPPING_MODE] = static_cast<int32_t>(settings.tone_mapping_mode);
    params[tonemap_key::TONE_MAPPING_FUNCTION] = settings.function;
    params[tonemap_key::USE_DOVI] = settings.use_dovi;
    params[tonemap_key::SMOOTHING_PERIOD] = static_cast<int32_t>(settings.smoothing_period);
    params[tonemap_key::MIN_DYNAMIC_PEAK] = settings.min_dynamic_peak;
    params[tonemap_key::SCENE_THRESHOLD_LOW] = settings.scene_threshold_low;
    params[tonemap_key::SCENE_THRESHOLD_HIGH] = settings.scene_threshold_high;
    return params;
}

std::string tonemap_marker(const TonemapSettings& settings) {
    // Whole numbers keep one decimal place (120 -> "120.0")
    const std::string peak = std::floor(settings.dst_max) == settings.dst_max
        ? fmt::format("{:.1f}", settings.dst_max)
        : fmt::format("{}", settings.dst_max);
    return fmt::format("placebo:{},dpd={},dst_max={}",
                       settings.function,
                       settings.dynamic_peak_detection ? "true" : "false",
                       peak);
}

} // namespace compshot
