/*
 * File:        clip.h
 * Module:      compshot-core
 * Purpose:     Immutable clip value and its transformation chain
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "frame_props.h"
#include "parameter_value.h"
#include <cstdint>
#include <string>
#include <vector>

namespace compshot {

/**
 * @brief Colour family of the clip's sample format
 */
enum class ColorFamily {
    Gray,
    YUV,
    RGB
};

/**
 * @brief Sample format (family and bit depth per channel)
 */
struct VideoFormat {
    ColorFamily family = ColorFamily::YUV;
    int bits_per_sample = 8;

    bool operator==(const VideoFormat& other) const {
        return family == other.family && bits_per_sample == other.bits_per_sample;
    }
    bool operator!=(const VideoFormat& other) const { return !(*this == other); }
};

// Display-ready and intermediate RGB formats
inline constexpr VideoFormat RGB24{ColorFamily::RGB, 8};
inline constexpr VideoFormat RGB48{ColorFamily::RGB, 16};

std::string to_string(const VideoFormat& format);

/**
 * @brief Static description of a clip
 */
struct ClipInfo {
    int width = 0;
    int height = 0;
    int64_t num_frames = 0;
    int fps_num = 0;
    int fps_den = 1;
    VideoFormat format;
};

/**
 * @brief One deferred operation in a clip's transformation chain
 *
 * Operation names are backend neutral ("crop", "resize", "set_props",
 * "tonemap", "frame_info"); the parameters are the keyword arguments the
 * operation was built with.
 */
struct ClipStep {
    std::string operation;
    ParameterSet parameters;
};

/**
 * @brief Ordered, finite, indexable sequence of frames
 *
 * A Clip never changes once built. Every transformation returns a new Clip
 * whose chain is the parent's chain plus one step; the backend evaluates the
 * chain only when a frame is requested. Frame metadata describes the first
 * frame of the clip after all steps.
 */
class Clip {
public:
    Clip() = default;
    Clip(std::string source_path, std::string loader, ClipInfo info, FrameProps props);

    const std::string& source_path() const { return source_path_; }
    const std::string& loader() const { return loader_; }
    const ClipInfo& info() const { return info_; }

    int width() const { return info_.width; }
    int height() const { return info_.height; }
    int64_t num_frames() const { return info_.num_frames; }
    const VideoFormat& format() const { return info_.format; }

    /// Metadata of frame 0
    const FrameProps& frame_props() const { return props_; }

    const std::vector<ClipStep>& steps() const { return steps_; }

    bool is_valid() const { return info_.width > 0 && info_.height > 0; }

    /// New clip with one more step, new geometry/format and new metadata
    Clip derive(ClipStep step, ClipInfo info, FrameProps props) const;

    /// New clip with one more step; geometry and metadata unchanged
    Clip derive(ClipStep step) const;

    /// Title of the most recent frame_info step, empty when none
    std::string overlay_title() const;

private:
    std::string source_path_;
    std::string loader_;
    ClipInfo info_;
    FrameProps props_;
    std::vector<ClipStep> steps_;
};

} // namespace compshot
