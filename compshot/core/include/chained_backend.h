/*
 * File:        chained_backend.h
 * Module:      compshot-core
 * Purpose:     Backend base that records operations as clip steps
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "video_backend.h"

namespace compshot {

// Step operation names
namespace step {
    inline constexpr const char* CROP = "crop";
    inline constexpr const char* RESIZE = "resize";
    inline constexpr const char* SET_PROPS = "set_props";
    inline constexpr const char* TONEMAP = "tonemap";
    inline constexpr const char* FRAME_INFO = "frame_info";
}

// Step parameter names
namespace step_param {
    inline constexpr const char* LEFT = "left";
    inline constexpr const char* RIGHT = "right";
    inline constexpr const char* TOP = "top";
    inline constexpr const char* BOTTOM = "bottom";
    inline constexpr const char* KERNEL = "kernel";
    inline constexpr const char* WIDTH = "width";
    inline constexpr const char* HEIGHT = "height";
    inline constexpr const char* FORMAT_FAMILY = "format_family";
    inline constexpr const char* FORMAT_BITS = "format_bits";
    inline constexpr const char* TITLE = "title";
}

const char* color_family_name(ColorFamily family);

/// @throws ConfigurationError for anything but "Gray", "YUV" or "RGB"
ColorFamily color_family_from_string(const std::string& name);

/**
 * @brief VideoBackend whose transformations only append steps
 *
 * crop, resize, set_frame_props and frame_info are implemented here and
 * update the clip's geometry, format and first-frame metadata the way the
 * operation would. Concrete backends supply loading, tonemap support and
 * frame rendering, and evaluate the recorded chain in write_frame().
 */
class ChainedBackend : public VideoBackend {
public:
    Clip crop(const Clip& clip, const CropGeometry& crop) const override;
    Clip resize(const Clip& clip, const ResizeRequest& request) const override;
    Clip set_frame_props(const Clip& clip, const FrameProps& updates) const override;
    Clip frame_info(const Clip& clip, const std::string& title) const override;

protected:
    /**
     * @brief Append an accepted tonemap call
     *
     * The result is RGB48 tagged with the destination transfer and
     * primaries (BT.709 unless dst_prim says otherwise).
     */
    Clip tonemap_step(const Clip& clip, const ParameterSet& parameters) const;
};

} // namespace compshot
