/*
 * File:        geometry.cpp
 * Module:      compshot-core
 * Purpose:     Frame dimensions, standard resolutions and crop margins
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "geometry.h"
#include "errors.h"
#include <fmt/format.h>
#include <limits>

namespace compshot {

std::string to_string(const Dimensions& dims) {
    return fmt::format("{}x{}", dims.width, dims.height);
}

Dimensions standard_dimensions(StandardResolution resolution) {
    switch (resolution) {
        case StandardResolution::R720p: return {1280, 720};
        case StandardResolution::R1080p: return {1920, 1080};
        case StandardResolution::R1440p: return {2560, 1440};
        case StandardResolution::R2160p: return {3840, 2160};
    }
    return {1920, 1080};
}

const char* resolution_name(StandardResolution resolution) {
    switch (resolution) {
        case StandardResolution::R720p: return "720p";
        case StandardResolution::R1080p: return "1080p";
        case StandardResolution::R1440p: return "1440p";
        case StandardResolution::R2160p: return "2160p";
    }
    return "unknown";
}

Dimensions standard_dimensions(const std::string& label) {
    if (label.find("720") != std::string::npos) {
        return standard_dimensions(StandardResolution::R720p);
    }
    if (label.find("1080") != std::string::npos) {
        return standard_dimensions(StandardResolution::R1080p);
    }
    if (label.find("1440") != std::string::npos) {
        return standard_dimensions(StandardResolution::R1440p);
    }
    if (label.find("2160") != std::string::npos) {
        return standard_dimensions(StandardResolution::R2160p);
    }
    throw ConfigurationError("Unknown resolution: " + label);
}

Dimensions checked_dimensions(int64_t width, int64_t height) {
    constexpr int64_t max_value = std::numeric_limits<int>::max();
    if (width < 1 || width > max_value || height < 1 || height > max_value) {
        throw ConfigurationError(fmt::format("Invalid dimensions {}x{}: both must be between 1 and {}",
                                             width, height, max_value));
    }
    return Dimensions{static_cast<int>(width), static_cast<int>(height)};
}

} // namespace compshot
