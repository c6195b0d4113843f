/*
 * File:        color_conversion.h
 * Module:      compshot-core
 * Purpose:     RGB conversions around the tonemap step
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "frame_props.h"
#include "video_backend.h"

namespace compshot {

/**
 * @brief Convert to 16-bit RGB for the tonemap backend
 *
 * No-op if the clip is already RGB48. Otherwise a spline36 resize to RGB48,
 * passing matrix_in / transfer_in / primaries_in / range_in for every code
 * present in @p desc.
 */
Clip convert_to_rgb48(const VideoBackend& backend, const Clip& clip, const ColorspaceDescriptor& desc);

/**
 * @brief Convert to 8-bit display-ready RGB without tonemapping
 *
 * No-op if the clip is already RGB24. Uses error diffusion dithering and the
 * same *_in codes as convert_to_rgb48().
 */
Clip convert_to_rgb24(const VideoBackend& backend, const Clip& clip, const ColorspaceDescriptor& desc);

/// convert_to_rgb24() with the descriptor read from the clip's first frame
Clip convert_to_rgb24(const VideoBackend& backend, const Clip& clip);

/**
 * @brief Re-tag an RGB48 clip so the tonemap backend sees unambiguous input
 *
 * _Matrix and _ColorRange become 0 (RGB, full range); _Transfer and
 * _Primaries are restated from @p desc when present.
 */
Clip normalize_props_for_tonemap(const VideoBackend& backend, const Clip& clip, const ColorspaceDescriptor& desc);

/// Final tonemapped RGB48 -> RGB24 conversion
Clip finalize_rgb24(const VideoBackend& backend, const Clip& clip);

} // namespace compshot
