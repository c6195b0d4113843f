/*
 * File:        crop_calculator.h
 * Module:      compshot-core
 * Purpose:     Symmetric, modulus-aligned cropping
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "geometry.h"
#include "logging.h"
#include "video_backend.h"

namespace compshot {

/**
 * @brief Compute symmetric, modulus-aligned margins
 *
 * top = bottom = ceil((src_height - height) / 2), left = right likewise;
 * then top/bottom and right/left are each grown by one until top (resp.
 * right) is a multiple of @p modulus.
 *
 * @throws ConfigurationError if modulus < 1 or a dimension is not positive
 * @throws DegenerateCropError if the target exceeds the source on an axis or
 *         the cropped width or height would be <= 0
 */
CropGeometry compute_crop(int src_width, int src_height, int width, int height, int modulus = 2);

/**
 * @brief Crop a clip to the target dimensions
 *
 * Reports the margins and the input/output dimensions before returning the
 * cropped clip.
 */
Clip crop_clip(const VideoBackend& backend, Diagnostics& diag, const Clip& clip,
               const Dimensions& target, int modulus = 2);

} // namespace compshot
