/*
 * File:        test_clip_preparation.cpp
 * Module:      compshot-core/tests
 * Purpose:     Crop, colour and overlay pipeline over a comparison set
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#undef NDEBUG
#include <cassert>
#include <iostream>

#include "clip_preparation.h"
#include "errors.h"
#include "test_support.h"

using namespace compshot;
using compshot::test::LogCapture;
using compshot::test::RecordingBackend;
using compshot::test::hdr_props;
using compshot::test::make_clip;
using compshot::test::sdr_props;

static PreparationOptions options_for(Dimensions crop, std::vector<std::string> titles = {}) {
    PreparationOptions options;
    options.crop = crop;
    options.titles = std::move(titles);
    return options;
}

static void test_sdr_batch() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    const std::vector<Clip> clips = {make_clip(1920, 1080), make_clip(1920, 1040)};
    const auto prepared = pipeline.prepare(clips, options_for({1920, 800}, {"Source", "Encode"}));

    assert(prepared.size() == 2);
    for (const auto& clip : prepared) {
        assert(clip.width() == 1920 && clip.height() == 800);
        assert(clip.format() == RGB24);
        assert(test::step_names(clip) == "crop,resize,frame_info");
    }
    assert(prepared[0].overlay_title() == "Source");
    assert(prepared[1].overlay_title() == "Encode");
    assert(backend.tonemap_calls.empty());

    // The RGB conversion dithers and carries the input colour codes
    const auto& resize = prepared[0].steps()[1].parameters;
    assert(parameter_util::value_to_string(resize.at("dither_type")) == "error_diffusion");
    assert(test::number_param(resize, "matrix_in") == 1);

    std::cout << "test_sdr_batch: PASSED\n";
}

static void test_hdr_batch() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    const std::vector<Clip> clips = {make_clip(3840, 2160, 100, hdr_props()),
                                     make_clip(3840, 2160, 100, hdr_props())};
    const auto prepared = pipeline.prepare(clips, options_for({3840, 1600}));

    assert(backend.tonemap_calls.size() == 2);
    for (const auto& clip : prepared) {
        assert(clip.format() == RGB24);
        assert(clip.frame_props().count(prop::TONEMAPPED) == 1);
        assert(clip.height() == 1600);
    }
    // Without titles each clip is numbered
    assert(prepared[0].overlay_title() == "Clip 0");
    assert(prepared[1].overlay_title() == "Clip 1");
    assert(log.contains("HDR source detected"));

    std::cout << "test_hdr_batch: PASSED\n";
}

static void test_first_clip_decides() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    // SDR first: the HDR encode is only converted
    const std::vector<Clip> clips = {make_clip(1920, 1080), make_clip(1920, 1080, 100, hdr_props())};
    const auto prepared = pipeline.prepare(clips, options_for({1920, 1080}));
    assert(backend.tonemap_calls.empty());
    assert(prepared[1].format() == RGB24);
    assert(prepared[1].frame_props().count(prop::TONEMAPPED) == 0);

    // HDR first: every clip goes through the tonemap path
    const std::vector<Clip> mixed = {make_clip(1920, 1080, 100, hdr_props()), make_clip(1920, 1080)};
    pipeline.prepare(mixed, options_for({1920, 1080}));
    assert(backend.tonemap_calls.size() == 2);

    std::cout << "test_first_clip_decides: PASSED\n";
}

static void test_title_mismatch() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    const std::vector<Clip> clips = {make_clip(1920, 1080), make_clip(1920, 1080)};
    const auto prepared = pipeline.prepare(clips, options_for({1920, 1080}, {"Only one"}));
    assert(log.contains("The number of titles (1) does not match the number of clips (2)"));
    assert(prepared[0].overlay_title() == "Clip 0");
    assert(prepared[1].overlay_title() == "Clip 1");

    std::cout << "test_title_mismatch: PASSED\n";
}

static void test_overlay_disabled() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    auto options = options_for({1920, 800}, {"A"});
    options.add_frame_info = false;
    const auto prepared = pipeline.prepare({make_clip(1920, 1080)}, options);
    assert(test::step_names(prepared[0]) == "crop,resize");
    assert(prepared[0].overlay_title().empty());
    assert(log.contains("Frame overlay disabled"));

    std::cout << "test_overlay_disabled: PASSED\n";
}

static void test_unsupported_shared_across_clips() {
    RecordingBackend backend;
    backend.reject = [](const ParameterSet& params, size_t) {
        return params.count(tonemap_key::GAMUT_MODE)
            ? std::string("Tonemap: Function does not take argument(s) named gamut_mode")
            : std::string();
    };
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    const std::vector<Clip> clips = {make_clip(3840, 2160, 100, hdr_props()),
                                     make_clip(3840, 2160, 100, hdr_props())};
    pipeline.prepare(clips, options_for({3840, 2160}));

    // One rejected call, one retry, then the second clip succeeds directly
    assert(backend.tonemap_calls.size() == 3);
    assert(pipeline.unsupported_parameters().count("gamut_mode") == 1);

    std::cout << "test_unsupported_shared_across_clips: PASSED\n";
}

static void test_hdr_batch_falls_back() {
    RecordingBackend backend;
    backend.reject = [](const ParameterSet&, size_t index) {
        return "Tonemap: backend failure " + std::to_string(index);
    };
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    const std::vector<Clip> clips = {make_clip(3840, 2160, 100, hdr_props())};
    const auto prepared = pipeline.prepare(clips, options_for({3840, 1600}, {"Source"}));

    // Every attempt ran and failed, the clip is still usable
    assert(backend.tonemap_calls.size() == 3);
    assert(prepared.size() == 1);
    assert(prepared[0].format() == RGB24);
    assert(prepared[0].height() == 1600);
    assert(prepared[0].frame_props().count(prop::TONEMAPPED) == 0);
    assert(test::step_names(prepared[0]) == "crop,resize,frame_info");
    assert(prepared[0].overlay_title() == "Source");
    assert(log.contains("Falling back to SDR conversion"));

    std::cout << "test_hdr_batch_falls_back: PASSED\n";
}

static void test_hdr_batch_partial_fallback() {
    RecordingBackend backend;
    // The first clip uses calls 0-2 and exhausts its attempts
    backend.reject = [](const ParameterSet&, size_t index) {
        return index < 3 ? "Tonemap: backend failure " + std::to_string(index) : std::string();
    };
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    const std::vector<Clip> clips = {make_clip(3840, 2160, 100, hdr_props(), "src.mkv"),
                                     make_clip(3840, 2160, 100, hdr_props(), "enc.mkv")};
    const auto prepared = pipeline.prepare(clips, options_for({3840, 2160}));

    assert(backend.tonemap_calls.size() == 4);
    assert(prepared.size() == 2);
    assert(prepared[0].format() == RGB24 && prepared[1].format() == RGB24);
    assert(prepared[0].frame_props().count(prop::TONEMAPPED) == 0);
    assert(prepared[1].frame_props().count(prop::TONEMAPPED) == 1);
    assert(prepared[0].source_path() == "src.mkv");
    assert(prepared[1].source_path() == "enc.mkv");
    assert(log.count("Falling back to SDR conversion") == 1);
    assert(log.contains("HDR->SDR tonemap applied"));

    std::cout << "test_hdr_batch_partial_fallback: PASSED\n";
}

static void test_errors() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    ClipPreparationPipeline pipeline(backend, settings, log.diag());

    bool raised = false;
    try {
        pipeline.prepare({}, options_for({1920, 1080}));
    } catch (const ConfigurationError&) {
        raised = true;
    }
    assert(raised);

    raised = false;
    try {
        pipeline.prepare({make_clip(1280, 720)}, options_for({1920, 1080}));
    } catch (const DegenerateCropError&) {
        raised = true;
    }
    assert(raised);

    backend.tonemap_available = false;
    raised = false;
    try {
        pipeline.prepare({make_clip(1920, 1080, 100, hdr_props())}, options_for({1920, 1080}));
    } catch (const BackendUnavailableError&) {
        raised = true;
    }
    assert(raised);

    // SDR batches do not need a tonemapper
    const auto prepared = pipeline.prepare({make_clip(1920, 1080, 100, sdr_props())}, options_for({1920, 1080}));
    assert(prepared.size() == 1);

    std::cout << "test_errors: PASSED\n";
}

int main() {
    test_sdr_batch();
    test_hdr_batch();
    test_first_clip_decides();
    test_title_mismatch();
    test_overlay_disabled();
    test_unsupported_shared_across_clips();
    test_hdr_batch_falls_back();
    test_hdr_batch_partial_fallback();
    test_errors();

    std::cout << "\nAll clip preparation tests passed!\n";
    return 0;
}
