/*
 * File:        chained_backend.cpp
 * Module:      compshot-core
 * Purpose:     Backend base that records operations as clip steps
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "chained_backend.h"
#include "errors.h"
#include "tonemap_settings.h"
#include <fmt/format.h>

namespace compshot {

namespace {

ParameterValue to_parameter(const PropValue& value) {
    if (auto i = std::get_if<int64_t>(&value)) {
        return static_cast<int32_t>(*i);
    }
    if (auto d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::get<PropBytes>(value).data;
}

} // anonymous namespace

const char* color_family_name(ColorFamily family) {
    switch (family) {
        case ColorFamily::Gray: return "Gray";
        case ColorFamily::YUV: return "YUV";
        case ColorFamily::RGB: return "RGB";
    }
    return "YUV";
}

ColorFamily color_family_from_string(const std::string& name) {
    if (name == "Gray") return ColorFamily::Gray;
    if (name == "YUV") return ColorFamily::YUV;
    if (name == "RGB") return ColorFamily::RGB;
    throw ConfigurationError("Unknown colour family: " + name);
}

Clip ChainedBackend::crop(const Clip& clip, const CropGeometry& crop) const {
    ClipStep s{step::CROP, {}};
    s.parameters[step_param::LEFT] = static_cast<int32_t>(crop.left);
    s.parameters[step_param::RIGHT] = static_cast<int32_t>(crop.right);
    s.parameters[step_param::TOP] = static_cast<int32_t>(crop.top);
    s.parameters[step_param::BOTTOM] = static_cast<int32_t>(crop.bottom);

    const Dimensions out = crop.apply(clip.width(), clip.height());
    if (out.width <= 0 || out.height <= 0) {
        throw DegenerateCropError(fmt::format("Crop leaves {}x{} of a {}x{} clip",
                                              out.width, out.height, clip.width(), clip.height()));
    }

    ClipInfo info = clip.info();
    info.width = out.width;
    info.height = out.height;
    return clip.derive(std::move(s), info, clip.frame_props());
}

Clip ChainedBackend::resize(const Clip& clip, const ResizeRequest& request) const {
    ClipInfo info = clip.info();
    if (request.width) info.width = *request.width;
    if (request.height) info.height = *request.height;
    if (request.format) info.format = *request.format;

    if (info.width <= 0 || info.height <= 0) {
        throw ConfigurationError(fmt::format("Cannot resize to {}x{}", info.width, info.height));
    }

    ClipStep s{step::RESIZE, request.options};
    s.parameters[step_param::KERNEL] = std::string(resize_kernel_name(request.kernel));
    s.parameters[step_param::WIDTH] = static_cast<int32_t>(info.width);
    s.parameters[step_param::HEIGHT] = static_cast<int32_t>(info.height);
    s.parameters[step_param::FORMAT_FAMILY] = std::string(color_family_name(info.format.family));
    s.parameters[step_param::FORMAT_BITS] = static_cast<int32_t>(info.format.bits_per_sample);

    FrameProps props = clip.frame_props();
    if (info.format.family == ColorFamily::RGB && clip.format().family != ColorFamily::RGB) {
        props[prop::MATRIX] = static_cast<int64_t>(code::MATRIX_RGB);
        props[prop::COLOR_RANGE] = static_cast<int64_t>(code::RANGE_FULL);
    }

    return clip.derive(std::move(s), info, std::move(props));
}

Clip ChainedBackend::set_frame_props(const Clip& clip, const FrameProps& updates) const {
    ClipStep s{step::SET_PROPS, {}};
    FrameProps props = clip.frame_props();
    for (const auto& [key, value] : updates) {
        props[key] = value;
        s.parameters[key] = to_parameter(value);
    }
    return clip.derive(std::move(s), clip.info(), std::move(props));
}

Clip ChainedBackend::frame_info(const Clip& clip, const std::string& title) const {
    ClipStep s{step::FRAME_INFO, {}};
    s.parameters[step_param::TITLE] = title;
    return clip.derive(std::move(s));
}

Clip ChainedBackend::tonemap_step(const Clip& clip, const ParameterSet& parameters) const {
    ClipInfo info = clip.info();
    info.format = RGB48;

    int64_t primaries = code::PRIMARIES_BT709;
    auto prim = parameters.find(tonemap_key::DST_PRIM);
    if (prim != parameters.end()) {
        if (auto value = parameter_util::as_number(prim->second)) {
            primaries = static_cast<int64_t>(*value);
        }
    }

    FrameProps props = clip.frame_props();
    props[prop::MATRIX] = static_cast<int64_t>(code::MATRIX_RGB);
    props[prop::COLOR_RANGE] = static_cast<int64_t>(code::RANGE_FULL);
    props[prop::TRANSFER] = static_cast<int64_t>(code::TRANSFER_BT709);
    props[prop::PRIMARIES] = primaries;

    return clip.derive(ClipStep{step::TONEMAP, parameters}, info, std::move(props));
}

} // namespace compshot
