/*
 * File:        resize_inference.h
 * Module:      compshot-core
 * Purpose:     Infer whether the source must be rescaled to match the encodes
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "geometry.h"
#include "logging.h"
#include "parameter_value.h"
#include "video_backend.h"
#include <optional>
#include <vector>

namespace compshot {

/// Width difference beyond which a rescale is assumed rather than column cropping
inline constexpr int RESCALE_WIDTH_THRESHOLD = 600;

enum class ScaleDirection {
    None,
    Downscale,
    Upscale
};

const char* scale_direction_name(ScaleDirection direction);

/**
 * @brief Outcome of comparing source and reference dimensions
 */
struct ResizeDecision {
    ScaleDirection direction = ScaleDirection::None;
    std::optional<StandardResolution> target;   ///< Set unless direction is None

    bool requires_resize() const { return direction != ScaleDirection::None; }
};

/**
 * @brief Decide the rescale target from dimensions alone
 *
 * Downscale when source_width - ref_width > 600: width ratio 2 -> 1080p,
 * 1 or 3 -> 720p. Upscale when ref_width - source_width > 600: ratio 2 or 3
 * -> 2160p, 1 -> 1080p. Otherwise no rescale. Only the first reference is
 * measured; the others only take part in the aspect-ratio check.
 *
 * @param references Encode dimensions, first one is measured
 * @throws ConfigurationError if references is empty, a dimension is not
 *         positive, or more than one reference is given and their aspect
 *         ratios differ
 * @throws AmbiguousRatioError if the integer width ratio is not recognised
 */
ResizeDecision infer_resize(const Dimensions& source, const std::vector<Dimensions>& references);

/**
 * @brief Rescale the source (clips[0]) to match the encodes if required
 *
 * Reports the scale direction, both dimension pairs and the kernel before
 * delegating to the backend's resize. Returns clips[0] untouched when no
 * rescale is needed.
 *
 * @param clips Source followed by at least one encode
 * @param options Passed through to the resize kernel
 */
Clip verify_resize(const VideoBackend& backend, Diagnostics& diag,
                   const std::vector<Clip>& clips,
                   ResizeKernel kernel = ResizeKernel::Spline36,
                   const ParameterSet& options = {});

} // namespace compshot
