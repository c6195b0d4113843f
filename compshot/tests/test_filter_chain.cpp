/*
 * File:        test_filter_chain.cpp
 * Module:      compshot-core/tests
 * Purpose:     Clip step chains and their libavfilter translation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#undef NDEBUG
#include <cassert>
#include <iostream>

#include "color_conversion.h"
#include "errors.h"
#include "filter_chain.h"
#include "test_support.h"
#include "tonemap_settings.h"

using namespace compshot;
using compshot::test::RecordingBackend;
using compshot::test::hdr_props;
using compshot::test::make_clip;

static const FilterSpec& find_filter(const FilterChain& chain, const std::string& name, size_t nth = 0) {
    for (const auto& spec : chain) {
        if (spec.name == name && nth-- == 0) {
            return spec;
        }
    }
    std::cerr << "missing filter " << name << " in " << to_string(chain) << "\n";
    assert(false && "filter not found");
    return chain.front();
}

static void test_chained_backend_steps() {
    RecordingBackend backend;
    const Clip source = make_clip(3840, 2160, 100, hdr_props());

    CropGeometry crop;
    crop.top = crop.bottom = 280;
    const Clip cropped = backend.crop(source, crop);
    assert(cropped.width() == 3840 && cropped.height() == 1600);
    assert(source.steps().empty());

    // Converting into RGB marks the metadata as full range RGB
    const Clip rgb = convert_to_rgb48(backend, cropped, ColorspaceDescriptor::from_props(cropped.frame_props()));
    assert(rgb.format() == RGB48);
    const auto desc = ColorspaceDescriptor::from_props(rgb.frame_props());
    assert(desc.matrix == code::MATRIX_RGB && desc.range == code::RANGE_FULL);
    assert(desc.transfer == code::TRANSFER_PQ);

    const Clip titled = backend.frame_info(rgb, "Source");
    assert(titled.overlay_title() == "Source");

    bool raised = false;
    try {
        CropGeometry everything;
        everything.left = everything.right = 1920;
        backend.crop(source, everything);
    } catch (const DegenerateCropError&) {
        raised = true;
    }
    assert(raised);

    raised = false;
    try {
        ResizeRequest request;
        request.width = 0;
        backend.resize(source, request);
    } catch (const ConfigurationError&) {
        raised = true;
    }
    assert(raised);

    assert(color_family_from_string("RGB") == ColorFamily::RGB);
    assert(std::string(color_family_name(ColorFamily::Gray)) == "Gray");

    std::cout << "test_chained_backend_steps: PASSED\n";
}

static void test_sdr_chain() {
    RecordingBackend backend;
    CropGeometry crop;
    crop.top = crop.bottom = 140;

    Clip clip = backend.crop(make_clip(1920, 1080), crop);
    clip = convert_to_rgb24(backend, clip);
    clip = backend.frame_info(clip, "Encode");

    FrameStamp stamp;
    stamp.frame = 3;
    stamp.total_frames = 10;
    stamp.picture_type = 'I';
    const FilterChain chain = build_filter_chain(clip.steps(), stamp);
    assert(chain.size() == 4);

    const auto& c = find_filter(chain, "crop");
    assert(c.option("w") == "iw-0");
    assert(c.option("h") == "ih-280");
    assert(c.option("x") == "0");
    assert(c.option("y") == "140");

    const auto& z = find_filter(chain, "zscale");
    assert(z.option("w") == "1920" && z.option("h") == "800");
    assert(z.option("filter") == "spline36");
    assert(z.option("matrixin") == "709");
    assert(z.option("transferin") == "709");
    assert(z.option("primariesin") == "709");
    assert(z.option("rangein") == "limited");
    assert(z.option("dither") == "error_diffusion");
    assert(z.option("range") == "full");

    assert(find_filter(chain, "format").option("pix_fmts") == "rgb24");

    const auto& text = find_filter(chain, "drawtext");
    assert(text.option("text") == "Frame Number: 3 of 10\nPicture Type: I\nEncode");
    assert(text.option("expansion") == "none");

    assert(to_string(chain).rfind("crop=w=iw-0:h=ih-280:x=0:y=140", 0) == 0);

    std::cout << "test_sdr_chain: PASSED\n";
}

static void test_tonemap_chain() {
    RecordingBackend backend;
    TonemapSettings settings;
    ParameterSet params = base_tonemap_parameters(settings);
    params[tonemap_key::SRC_CSP] = int32_t{2};

    const Clip clip = backend.tonemap(make_clip(1920, 1080, 100, hdr_props()), params);
    const FilterChain chain = build_filter_chain(clip.steps(), FrameStamp{});

    const auto& hint = find_filter(chain, "setparams");
    assert(hint.option("color_trc") == "arib-std-b67");
    assert(hint.option("color_primaries") == "bt2020");

    const auto& placebo = find_filter(chain, "libplacebo");
    assert(placebo.option("tonemapping") == "bt.2390");
    assert(placebo.option("peak_detect") == "1");
    assert(placebo.option("gamut_mode") == "perceptual");
    assert(placebo.option("tonemapping_mode") == "auto");
    assert(placebo.option("apply_dolbyvision") == "1");
    assert(placebo.option("smoothing_period") == "200");
    assert(placebo.option("color_trc") == "bt709");
    assert(placebo.option("color_primaries") == "bt709");
    assert(placebo.option("colorspace") == "bt709");
    assert(placebo.option("range") == "pc");
    assert(placebo.option("format") == "gbrp16le");

    // Luminance targets have no libplacebo option
    const auto unmapped = unmapped_tonemap_keys(params);
    assert((unmapped == std::vector<std::string>{"dst_max", "dst_min"}));
    assert(libplacebo_option(tonemap_key::GAMUT_MODE) == std::string("gamut_mode"));
    assert(!libplacebo_option(tonemap_key::SRC_CSP));

    // Mode indices outside the libplacebo tables are rejected
    params[tonemap_key::GAMUT_MODE] = int32_t{42};
    const Clip bad = backend.tonemap(make_clip(1920, 1080, 100, hdr_props()), params);
    bool raised = false;
    try {
        build_filter_chain(bad.steps(), FrameStamp{});
    } catch (const ConfigurationError&) {
        raised = true;
    }
    assert(raised);

    std::cout << "test_tonemap_chain: PASSED\n";
}

static void test_props_and_kernels() {
    RecordingBackend backend;
    FrameProps updates{
        {prop::MATRIX, int64_t{0}},
        {prop::COLOR_RANGE, int64_t{0}},
        {prop::TRANSFER, int64_t{16}},
        {prop::PRIMARIES, int64_t{9}},
    };
    Clip clip = backend.set_frame_props(make_clip(1920, 1080), updates);

    ResizeRequest request;
    request.kernel = ResizeKernel::Spline64;
    request.width = 1280;
    request.height = 720;
    clip = backend.resize(clip, request);

    const FilterChain chain = build_filter_chain(clip.steps(), FrameStamp{});
    const auto& params = find_filter(chain, "setparams");
    assert(params.option("colorspace") == "gbr");
    assert(params.option("range") == "pc");
    assert(params.option("color_trc") == "smpte2084");
    assert(params.option("color_primaries") == "bt2020");

    assert(find_filter(chain, "zscale").option("filter") == "spline36");
    assert(find_filter(chain, "format").option("pix_fmts") == "yuv420p10le");

    // A set_props step with nothing recognisable adds no filter
    const Clip tagged = backend.set_frame_props(make_clip(1920, 1080), {{prop::TONEMAPPED, PropBytes{"x"}}});
    assert(build_filter_chain(tagged.steps(), FrameStamp{}).empty());

    bool raised = false;
    try {
        build_filter_chain({ClipStep{"sharpen", {}}}, FrameStamp{});
    } catch (const ConfigurationError&) {
        raised = true;
    }
    assert(raised);

    assert(pixel_format_name(RGB48) == "gbrp16le");
    assert(pixel_format_name(VideoFormat{ColorFamily::Gray, 8}) == "gray");
    assert(pixel_format_name(VideoFormat{ColorFamily::YUV, 16}) == "yuv444p16le");

    std::cout << "test_props_and_kernels: PASSED\n";
}

int main() {
    test_chained_backend_steps();
    test_sdr_chain();
    test_tonemap_chain();
    test_props_and_kernels();

    std::cout << "\nAll filter chain tests passed!\n";
    return 0;
}
