/*
 * File:        clip.cpp
 * Module:      compshot-core
 * Purpose:     Immutable clip value
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "clip.h"
#include <fmt/format.h>

namespace compshot {

std::string to_string(const VideoFormat& format) {
    const char* family = "YUV";
    switch (format.family) {
        case ColorFamily::Gray: family = "Gray"; break;
        case ColorFamily::YUV: family = "YUV"; break;
        case ColorFamily::RGB: family = "RGB"; break;
    }
    return fmt::format("{}{}", family, format.bits_per_sample);
}

Clip::Clip(std::string source_path, std::string loader, ClipInfo info, FrameProps props)
    : source_path_(std::move(source_path))
    , loader_(std::move(loader))
    , info_(info)
    , props_(std::move(props))
{
}

Clip Clip::derive(ClipStep step, ClipInfo info, FrameProps props) const {
    Clip result = *this;
    result.info_ = info;
    result.props_ = std::move(props);
    result.steps_.push_back(std::move(step));
    return result;
}

Clip Clip::derive(ClipStep step) const {
    return derive(std::move(step), info_, props_);
}

std::string Clip::overlay_title() const {
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
        if (it->operation != "frame_info") continue;
        auto title = it->parameters.find("title");
        if (title != it->parameters.end()) {
            return parameter_util::value_to_string(title->second);
        }
    }
    return {};
}

} // namespace compshot
