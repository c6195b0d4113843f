/*
 * File:        color_conversion.cpp
 * Module:      compshot-core
 * Purpose:     RGB conversions around the tonemap step
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "color_conversion.h"

namespace compshot {

namespace {

void add_input_codes(ParameterSet& options, const ColorspaceDescriptor& desc) {
    if (desc.matrix) options["matrix_in"] = static_cast<int32_t>(*desc.matrix);
    if (desc.transfer) options["transfer_in"] = static_cast<int32_t>(*desc.transfer);
    if (desc.primaries) options["primaries_in"] = static_cast<int32_t>(*desc.primaries);
    if (desc.range) options["range_in"] = static_cast<int32_t>(*desc.range);
}

} // anonymous namespace

Clip convert_to_rgb48(const VideoBackend& backend, const Clip& clip, const ColorspaceDescriptor& desc) {
    if (clip.format() == RGB48) {
        return clip;
    }

    ResizeRequest request;
    request.kernel = ResizeKernel::Spline36;
    request.format = RGB48;
    add_input_codes(request.options, desc);
    return backend.resize(clip, request);
}

Clip convert_to_rgb24(const VideoBackend& backend, const Clip& clip, const ColorspaceDescriptor& desc) {
    if (clip.format() == RGB24) {
        return clip;
    }

    ResizeRequest request;
    request.kernel = ResizeKernel::Spline36;
    request.format = RGB24;
    request.options["dither_type"] = std::string("error_diffusion");
    add_input_codes(request.options, desc);
    return backend.resize(clip, request);
}

Clip convert_to_rgb24(const VideoBackend& backend, const Clip& clip) {
    return convert_to_rgb24(backend, clip, ColorspaceDescriptor::from_props(clip.frame_props()));
}

Clip normalize_props_for_tonemap(const VideoBackend& backend, const Clip& clip, const ColorspaceDescriptor& desc) {
    FrameProps updates;
    updates[prop::MATRIX] = static_cast<int64_t>(code::MATRIX_RGB);
    updates[prop::COLOR_RANGE] = static_cast<int64_t>(code::RANGE_FULL);
    if (desc.transfer) updates[prop::TRANSFER] = static_cast<int64_t>(*desc.transfer);
    if (desc.primaries) updates[prop::PRIMARIES] = static_cast<int64_t>(*desc.primaries);
    return backend.set_frame_props(clip, updates);
}

Clip finalize_rgb24(const VideoBackend& backend, const Clip& clip) {
    ResizeRequest request;
    request.kernel = ResizeKernel::Spline36;
    request.format = RGB24;
    request.options["dither_type"] = std::string("error_diffusion");
    return backend.resize(clip, request);
}

} // namespace compshot
