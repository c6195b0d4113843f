/*
 * File:        crop_calculator.cpp
 * Module:      compshot-core
 * Purpose:     Symmetric, modulus-aligned cropping
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "crop_calculator.h"
#include "errors.h"
#include <fmt/format.h>

namespace compshot {

namespace {

// Ceiling of a non-negative difference divided by two
int half_margin(int source, int target) {
    return (source - target + 1) / 2;
}

} // anonymous namespace

CropGeometry compute_crop(int src_width, int src_height, int width, int height, int modulus) {
    if (modulus < 1) {
        throw ConfigurationError(fmt::format("Crop modulus must be at least 1 (got {})", modulus));
    }
    if (src_width <= 0 || src_height <= 0 || width <= 0 || height <= 0) {
        throw ConfigurationError(fmt::format(
            "Crop dimensions must be positive (source {}x{}, target {}x{})",
            src_width, src_height, width, height));
    }
    if (width > src_width || height > src_height) {
        throw DegenerateCropError(fmt::format(
            "Crop target {}x{} is larger than the clip ({}x{})",
            width, height, src_width, src_height));
    }

    CropGeometry crop;
    crop.top = crop.bottom = half_margin(src_height, height);
    crop.left = crop.right = half_margin(src_width, width);

    // Only top and right are tested; bottom and left track them
    while (crop.top % modulus != 0) {
        crop.top += 1;
        crop.bottom += 1;
    }
    while (crop.right % modulus != 0) {
        crop.right += 1;
        crop.left += 1;
    }

    const Dimensions result = crop.apply(src_width, src_height);
    if (result.width <= 0 || result.height <= 0) {
        throw DegenerateCropError(fmt::format(
            "Cropping {}x{} to {}x{} with modulus {} leaves {}x{}",
            src_width, src_height, width, height, modulus, result.width, result.height));
    }
    return crop;
}

Clip crop_clip(const VideoBackend& backend, Diagnostics& diag, const Clip& clip,
               const Dimensions& target, int modulus) {
    const CropGeometry crop = compute_crop(clip.width(), clip.height(), target.width, target.height, modulus);
    const Dimensions cropped = crop.apply(clip.width(), clip.height());

    diag.info("Crop values: left {}, right {}, top {}, bottom {}", crop.left, crop.right, crop.top, crop.bottom);
    diag.info("Input dimensions: {}x{}", clip.width(), clip.height());
    diag.info("Cropped dimensions: {}x{}", cropped.width, cropped.height);

    return backend.crop(clip, crop);
}

} // namespace compshot
