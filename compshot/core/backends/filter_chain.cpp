/*
 * File:        filter_chain.cpp
 * Module:      compshot-core
 * Purpose:     Translate clip steps into libavfilter filter specifications
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "filter_chain.h"
#include "chained_backend.h"
#include "errors.h"
#include "frame_props.h"
#include "logging.h"
#include "tonemap_settings.h"
#include <fmt/format.h>
#include <iterator>
#include <map>

namespace compshot {

namespace {

// ISO/IEC 23091-4 codes to libavfilter names. Codes missing here are
// left for the filter to infer.
const std::map<int, const char*> ZSCALE_MATRIX = {
    {1, "709"}, {5, "470bg"}, {6, "170m"}, {9, "2020_ncl"}, {10, "2020_cl"},
};
const std::map<int, const char*> ZSCALE_TRANSFER = {
    {1, "709"}, {6, "601"}, {8, "linear"}, {13, "iec61966-2-1"}, {14, "2020_10"},
    {15, "2020_12"}, {16, "smpte2084"}, {18, "arib-std-b67"},
};
const std::map<int, const char*> ZSCALE_PRIMARIES = {
    {1, "709"}, {6, "170m"}, {7, "240m"}, {9, "2020"}, {11, "smpte431"}, {12, "smpte432"},
};
const std::map<int, const char*> AV_COLORSPACE = {
    {0, "gbr"}, {1, "bt709"}, {5, "bt470bg"}, {6, "smpte170m"}, {9, "bt2020nc"}, {10, "bt2020c"},
};
const std::map<int, const char*> AV_TRANSFER = {
    {1, "bt709"}, {6, "smpte170m"}, {8, "linear"}, {13, "iec61966-2-1"}, {14, "bt2020-10"},
    {15, "bt2020-12"}, {16, "smpte2084"}, {18, "arib-std-b67"},
};
const std::map<int, const char*> AV_PRIMARIES = {
    {1, "bt709"}, {5, "bt470bg"}, {6, "smpte170m"}, {7, "smpte240m"}, {9, "bt2020"},
    {11, "smpte431"}, {12, "smpte432"},
};

// libplacebo filter option names
const std::map<std::string, const char*> PLACEBO_OPTIONS = {
    {tonemap_key::TONE_MAPPING_FUNCTION, "tonemapping"},
    {tonemap_key::DYNAMIC_PEAK_DETECTION, "peak_detect"},
    {tonemap_key::MIN_DYNAMIC_PEAK, "minimum_peak"},
    {tonemap_key::GAMUT_MODE, "gamut_mode"},
    {tonemap_key::TONE_MAPPING_MODE, "tonemapping_mode"},
    {tonemap_key::USE_DOVI, "apply_dolbyvision"},
    {tonemap_key::SMOOTHING_PERIOD, "smoothing_period"},
    {tonemap_key::SCENE_THRESHOLD_LOW, "scene_threshold_low"},
    {tonemap_key::SCENE_THRESHOLD_HIGH, "scene_threshold_high"},
    {tonemap_key::DST_CSP, "color_trc"},
    {tonemap_key::DST_PRIM, "color_primaries"},
};

const char* const GAMUT_MODES[] = {
    "clip", "perceptual", "relative", "saturation", "absolute", "desaturate", "darken", "warn", "linear",
};
const char* const TONEMAPPING_MODES[] = {"auto", "rgb", "max", "hybrid", "luma"};

const std::map<std::string, const char*> TONEMAPPING_FUNCTIONS = {
    {"bt2390", "bt.2390"}, {"bt2446a", "bt.2446a"}, {"st2094_40", "st2094-40"}, {"st2094_10", "st2094-10"},
};

std::optional<int> int_param(const ParameterSet& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    auto value = parameter_util::as_number(it->second);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::string string_param(const ParameterSet& params, const std::string& key) {
    auto it = params.find(key);
    return it == params.end() ? std::string() : parameter_util::value_to_string(it->second);
}

void add_code(FilterSpec& spec, const std::string& option, const std::map<int, const char*>& table,
              std::optional<int> code) {
    if (!code) {
        return;
    }
    auto it = table.find(*code);
    if (it == table.end()) {
        COMPSHOT_LOG_DEBUG("No {} name for code {}, leaving it to the filter", option, *code);
        return;
    }
    spec.options.emplace_back(option, it->second);
}

std::string zscale_kernel(const std::string& kernel) {
    if (kernel == "spline64") {
        // zscale stops at spline36
        return "spline36";
    }
    if (kernel == "bilinear" || kernel == "bicubic" || kernel == "point" || kernel == "lanczos" ||
        kernel == "spline16" || kernel == "spline36") {
        return kernel;
    }
    throw UnknownKernelError("No zscale filter for kernel '" + kernel + "'");
}

void add_crop(FilterChain& chain, const ParameterSet& p) {
    const int left = int_param(p, step_param::LEFT).value_or(0);
    const int right = int_param(p, step_param::RIGHT).value_or(0);
    const int top = int_param(p, step_param::TOP).value_or(0);
    const int bottom = int_param(p, step_param::BOTTOM).value_or(0);

    FilterSpec spec{"crop", {}};
    spec.options.emplace_back("w", fmt::format("iw-{}", left + right));
    spec.options.emplace_back("h", fmt::format("ih-{}", top + bottom));
    spec.options.emplace_back("x", std::to_string(left));
    spec.options.emplace_back("y", std::to_string(top));
    spec.options.emplace_back("exact", "1");
    chain.push_back(std::move(spec));
}

void add_resize(FilterChain& chain, const ParameterSet& p) {
    FilterSpec spec{"zscale", {}};
    spec.options.emplace_back("w", std::to_string(int_param(p, step_param::WIDTH).value_or(0)));
    spec.options.emplace_back("h", std::to_string(int_param(p, step_param::HEIGHT).value_or(0)));
    spec.options.emplace_back("filter", zscale_kernel(string_param(p, step_param::KERNEL)));
    add_code(spec, "matrixin", ZSCALE_MATRIX, int_param(p, "matrix_in"));
    add_code(spec, "transferin", ZSCALE_TRANSFER, int_param(p, "transfer_in"));
    add_code(spec, "primariesin", ZSCALE_PRIMARIES, int_param(p, "primaries_in"));
    if (auto range = int_param(p, "range_in")) {
        spec.options.emplace_back("rangein", *range == code::RANGE_FULL ? "full" : "limited");
    }
    const std::string dither = string_param(p, "dither_type");
    if (!dither.empty()) {
        spec.options.emplace_back("dither", dither);
    }

    VideoFormat format;
    format.family = color_family_from_string(string_param(p, step_param::FORMAT_FAMILY));
    format.bits_per_sample = int_param(p, step_param::FORMAT_BITS).value_or(8);
    if (format.family == ColorFamily::RGB) {
        spec.options.emplace_back("range", "full");
    }
    chain.push_back(std::move(spec));
    chain.push_back(FilterSpec{"format", {{"pix_fmts", pixel_format_name(format)}}});
}

void add_setparams(FilterChain& chain, const ParameterSet& p) {
    FilterSpec spec{"setparams", {}};
    add_code(spec, "colorspace", AV_COLORSPACE, int_param(p, prop::MATRIX));
    add_code(spec, "color_trc", AV_TRANSFER, int_param(p, prop::TRANSFER));
    add_code(spec, "color_primaries", AV_PRIMARIES, int_param(p, prop::PRIMARIES));
    if (auto range = int_param(p, prop::COLOR_RANGE)) {
        spec.options.emplace_back("range", *range == code::RANGE_FULL ? "pc" : "tv");
    }
    if (!spec.options.empty()) {
        chain.push_back(std::move(spec));
    }
}

std::string placebo_value(const std::string& key, const ParameterValue& value) {
    if (key == tonemap_key::TONE_MAPPING_FUNCTION) {
        const std::string name = parameter_util::value_to_string(value);
        auto it = TONEMAPPING_FUNCTIONS.find(name);
        return it == TONEMAPPING_FUNCTIONS.end() ? name : it->second;
    }
    if (key == tonemap_key::GAMUT_MODE || key == tonemap_key::TONE_MAPPING_MODE) {
        const auto number = parameter_util::as_number(value);
        const int index = number ? static_cast<int>(*number) : -1;
        if (key == tonemap_key::GAMUT_MODE && index >= 0 && index < static_cast<int>(std::size(GAMUT_MODES))) {
            return GAMUT_MODES[index];
        }
        if (key == tonemap_key::TONE_MAPPING_MODE && index >= 0 &&
            index < static_cast<int>(std::size(TONEMAPPING_MODES))) {
            return TONEMAPPING_MODES[index];
        }
        throw ConfigurationError(fmt::format("{} value {} has no libplacebo equivalent",
                                             key, parameter_util::value_to_string(value)));
    }
    if (key == tonemap_key::DST_CSP) {
        // 0 SDR, 1 HDR10, 2 HLG
        const auto number = parameter_util::as_number(value);
        const int csp = number ? static_cast<int>(*number) : 0;
        return csp == 1 ? "smpte2084" : csp == 2 ? "arib-std-b67" : "bt709";
    }
    if (key == tonemap_key::DST_PRIM) {
        const auto number = parameter_util::as_number(value);
        auto it = AV_PRIMARIES.find(number ? static_cast<int>(*number) : code::PRIMARIES_BT709);
        return it == AV_PRIMARIES.end() ? "bt709" : it->second;
    }
    if (const bool* flag = std::get_if<bool>(&value)) {
        return *flag ? "1" : "0";
    }
    return parameter_util::value_to_string(value);
}

void add_tonemap(FilterChain& chain, const ParameterSet& p) {
    if (auto hint = int_param(p, tonemap_key::SRC_CSP)) {
        FilterSpec source{"setparams", {}};
        source.options.emplace_back("color_trc", *hint == 2 ? "arib-std-b67" : "smpte2084");
        source.options.emplace_back("color_primaries", "bt2020");
        chain.push_back(std::move(source));
    }

    FilterSpec spec{"libplacebo", {}};
    for (const auto& [key, value] : p) {
        auto option = PLACEBO_OPTIONS.find(key);
        if (option == PLACEBO_OPTIONS.end()) {
            continue;
        }
        spec.options.emplace_back(option->second, placebo_value(key, value));
    }

    const int dst_csp = int_param(p, tonemap_key::DST_CSP).value_or(0);
    spec.options.emplace_back("colorspace", dst_csp == 0 ? "bt709" : "bt2020nc");
    spec.options.emplace_back("range", "pc");
    spec.options.emplace_back("format", pixel_format_name(RGB48));
    chain.push_back(std::move(spec));
}

void add_frame_info(FilterChain& chain, const ParameterSet& p, const FrameStamp& stamp) {
    std::string text = fmt::format("Frame Number: {} of {}\nPicture Type: {}",
                                   stamp.frame, stamp.total_frames, stamp.picture_type);
    const std::string title = string_param(p, step_param::TITLE);
    if (!title.empty()) {
        text += "\n" + title;
    }

    FilterSpec spec{"drawtext", {}};
    spec.options.emplace_back("expansion", "none");
    spec.options.emplace_back("text", text);
    spec.options.emplace_back("fontcolor", "white");
    spec.options.emplace_back("fontsize", "28");
    spec.options.emplace_back("borderw", "2");
    spec.options.emplace_back("bordercolor", "black");
    spec.options.emplace_back("line_spacing", "4");
    spec.options.emplace_back("x", "10");
    spec.options.emplace_back("y", "10");
    chain.push_back(std::move(spec));
}

} // anonymous namespace

std::string FilterSpec::option(const std::string& key) const {
    for (const auto& [k, v] : options) {
        if (k == key) return v;
    }
    return {};
}

std::string pixel_format_name(const VideoFormat& format) {
    switch (format.family) {
        case ColorFamily::RGB:
            return format.bits_per_sample > 8 ? "gbrp16le" : "rgb24";
        case ColorFamily::Gray:
            return format.bits_per_sample > 8 ? "gray16le" : "gray";
        case ColorFamily::YUV:
            if (format.bits_per_sample <= 8) return "yuv420p";
            if (format.bits_per_sample <= 10) return "yuv420p10le";
            return "yuv444p16le";
    }
    return "yuv420p";
}

std::optional<std::string> libplacebo_option(const std::string& key) {
    auto it = PLACEBO_OPTIONS.find(key);
    if (it == PLACEBO_OPTIONS.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::vector<std::string> unmapped_tonemap_keys(const ParameterSet& parameters) {
    std::vector<std::string> keys;
    for (const auto& [key, value] : parameters) {
        if (key == tonemap_key::SRC_CSP) {
            continue;
        }
        if (!libplacebo_option(key)) {
            keys.push_back(key);
        }
    }
    return keys;
}

FilterChain build_filter_chain(const std::vector<ClipStep>& steps, const FrameStamp& stamp) {
    FilterChain chain;
    for (const auto& s : steps) {
        if (s.operation == step::CROP) {
            add_crop(chain, s.parameters);
        } else if (s.operation == step::RESIZE) {
            add_resize(chain, s.parameters);
        } else if (s.operation == step::SET_PROPS) {
            add_setparams(chain, s.parameters);
        } else if (s.operation == step::TONEMAP) {
            add_tonemap(chain, s.parameters);
        } else if (s.operation == step::FRAME_INFO) {
            add_frame_info(chain, s.parameters, stamp);
        } else {
            throw ConfigurationError("No filter translation for step '" + s.operation + "'");
        }
    }
    return chain;
}

std::string to_string(const FilterChain& chain) {
    std::string out;
    for (const auto& spec : chain) {
        if (!out.empty()) out += ",";
        out += spec.name;
        char sep = '=';
        for (const auto& [key, value] : spec.options) {
            out += sep;
            out += key + "=" + value;
            sep = ':';
        }
    }
    return out;
}

} // namespace compshot
