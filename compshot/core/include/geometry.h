/*
 * File:        geometry.h
 * Module:      compshot-core
 * Purpose:     Frame dimensions, standard resolutions and crop margins
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include <cstdint>
#include <string>

namespace compshot {

/**
 * @brief Width and height in pixels
 */
struct Dimensions {
    int width = 0;
    int height = 0;

    bool operator==(const Dimensions& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Dimensions& other) const { return !(*this == other); }
};

std::string to_string(const Dimensions& dims);

/**
 * @brief Standard output resolutions used as rescale targets
 */
enum class StandardResolution {
    R720p,
    R1080p,
    R1440p,
    R2160p
};

/// 720p -> 1280x720, 1080p -> 1920x1080, 1440p -> 2560x1440, 2160p -> 3840x2160
Dimensions standard_dimensions(StandardResolution resolution);

/// "720p", "1080p", ...
const char* resolution_name(StandardResolution resolution);

/**
 * @brief Look up a standard resolution from a label such as "1080p" or "2160"
 *
 * The first of 720, 1080, 1440, 2160 found in the label wins.
 * @throws ConfigurationError if no known resolution is named
 */
Dimensions standard_dimensions(const std::string& label);

/**
 * @brief Dimensions from user supplied numbers
 *
 * @throws ConfigurationError unless both values lie in [1, INT_MAX]
 */
Dimensions checked_dimensions(int64_t width, int64_t height);

/**
 * @brief Crop margins
 *
 * left == right and top == bottom; each pair is a multiple of the modulus
 * the geometry was computed with.
 */
struct CropGeometry {
    int left = 0;
    int right = 0;
    int top = 0;
    int bottom = 0;

    /// Size of a width x height frame after applying the margins
    Dimensions apply(int width, int height) const {
        return Dimensions{width - (left + right), height - (top + bottom)};
    }
};

} // namespace compshot
