/*
 * File:        test_tonemap_sequencer.cpp
 * Module:      compshot-core/tests
 * Purpose:     Tonemap attempt plan, retries and SDR fallback
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#undef NDEBUG
#include <cassert>
#include <iostream>

#include "color_conversion.h"
#include "errors.h"
#include "tonemap_sequencer.h"
#include "test_support.h"

using namespace compshot;
using compshot::test::LogCapture;
using compshot::test::RecordingBackend;
using compshot::test::hdr_props;
using compshot::test::make_clip;
using compshot::test::number_param;

static const char* const REJECT_MODES =
    "Tonemap: Function does not take argument(s) named gamut_mode, tone_mapping_mode";

static std::string marker_of(const Clip& clip) {
    auto it = clip.frame_props().find(prop::TONEMAPPED);
    if (it == clip.frame_props().end()) {
        return {};
    }
    return std::get<PropBytes>(it->second).data;
}

static void test_attempt_plan() {
    TonemapSettings settings;

    const auto hinted = AttemptPlan::build(settings, SourceColorspaceHint::HLG);
    assert(hinted.size() == 3);
    assert(hinted.attempts()[0].kind == AttemptKind::Hinted);
    assert(number_param(hinted.attempts()[0].parameters, tonemap_key::SRC_CSP) == 2);
    assert(hinted.attempts()[1].kind == AttemptKind::Baseline);
    assert(hinted.attempts()[1].parameters.count(tonemap_key::SRC_CSP) == 0);
    assert(hinted.attempts()[2].kind == AttemptKind::ForcedSource);
    assert(number_param(hinted.attempts()[2].parameters, tonemap_key::SRC_CSP) == 1);

    const auto plain = AttemptPlan::build(settings, std::nullopt);
    assert(plain.size() == 2);
    assert(plain.attempts()[0].kind == AttemptKind::Baseline);
    assert(plain.attempts()[1].kind == AttemptKind::ForcedSource);

    // Baseline carries every setting
    const auto& base = plain.attempts()[0].parameters;
    assert(number_param(base, tonemap_key::DST_CSP) == 0);
    assert(number_param(base, tonemap_key::DST_PRIM) == 1);
    assert(number_param(base, tonemap_key::DST_MAX) == 120.0);
    assert(number_param(base, tonemap_key::GAMUT_MODE) == 1);
    assert(number_param(base, tonemap_key::SMOOTHING_PERIOD) == 200);
    assert(parameter_util::value_to_string(base.at(tonemap_key::TONE_MAPPING_FUNCTION)) == "bt2390");
    assert(std::get<bool>(base.at(tonemap_key::DYNAMIC_PEAK_DETECTION)));

    std::cout << "test_attempt_plan: PASSED\n";
}

static void test_extract_unsupported() {
    auto names = extract_unsupported_parameters(REJECT_MODES);
    assert(names.size() == 2);
    assert(names.count("gamut_mode") && names.count("tone_mapping_mode"));

    names = extract_unsupported_parameters("Tonemap: Function does not take argument named 'use_dovi'");
    assert(names.size() == 1 && names.count("use_dovi"));

    names = extract_unsupported_parameters("Tonemap: Function does not take argument(s) named (dst_max,\n dst_min)");
    assert(names.size() == 2 && names.count("dst_max") && names.count("dst_min"));

    assert(extract_unsupported_parameters("Tonemap: out of GPU memory").empty());

    std::cout << "test_extract_unsupported: PASSED\n";
}

static void test_tonemap_marker() {
    TonemapSettings settings;
    assert(tonemap_marker(settings) == "placebo:bt2390,dpd=true,dst_max=120.0");

    settings.function = "mobius";
    settings.dynamic_peak_detection = false;
    settings.dst_max = 203.5;
    assert(tonemap_marker(settings) == "placebo:mobius,dpd=false,dst_max=203.5");

    std::cout << "test_tonemap_marker: PASSED\n";
}

static void test_first_attempt_succeeds() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    TonemapAttemptSequencer sequencer(backend, settings, log.diag());

    const Clip result = sequencer.process(make_clip(3840, 2160, 100, hdr_props()));
    assert(backend.tonemap_calls.size() == 1);
    assert(number_param(backend.tonemap_calls[0], tonemap_key::SRC_CSP) == 1);

    assert(result.format() == RGB24);
    assert(marker_of(result) == "placebo:bt2390,dpd=true,dst_max=120.0");
    assert(test::step_names(result) == "resize,set_props,tonemap,set_props,resize");

    // Output is tagged as SDR
    const auto desc = ColorspaceDescriptor::from_props(result.frame_props());
    assert(desc.transfer == code::TRANSFER_BT709);
    assert(desc.primaries == code::PRIMARIES_BT709);
    assert(desc.matrix == code::MATRIX_RGB);

    assert(log.contains("HDR->SDR tonemap applied using function 'bt2390'"));

    std::cout << "test_first_attempt_succeeds: PASSED\n";
}

static void test_attempts_run_in_order() {
    RecordingBackend backend;
    backend.reject = [](const ParameterSet&, size_t index) {
        return index < 2 ? std::string("Tonemap: invalid source colourspace") : std::string();
    };
    LogCapture log;
    TonemapSettings settings;
    TonemapAttemptSequencer sequencer(backend, settings, log.diag());

    const Clip result = sequencer.process(make_clip(3840, 2160, 100, hdr_props()));
    assert(backend.tonemap_calls.size() == 3);
    assert(number_param(backend.tonemap_calls[0], tonemap_key::SRC_CSP) == 1);
    assert(backend.tonemap_calls[1].count(tonemap_key::SRC_CSP) == 0);
    assert(number_param(backend.tonemap_calls[2], tonemap_key::SRC_CSP) == 1);
    assert(!marker_of(result).empty());

    assert(log.contains("[Tonemap attempt 1 failed]"));
    assert(log.contains("[Tonemap attempt 2 failed]"));
    assert(!log.contains("[Tonemap attempt 3 failed]"));

    std::cout << "test_attempts_run_in_order: PASSED\n";
}

static void test_all_attempts_fail() {
    RecordingBackend backend;
    backend.reject = [](const ParameterSet&, size_t index) {
        return "Tonemap: attempt " + std::to_string(index) + " rejected";
    };
    LogCapture log;
    TonemapSettings settings;
    TonemapAttemptSequencer sequencer(backend, settings, log.diag());

    const Clip original = make_clip(3840, 2160, 100, hdr_props());

    // tonemap() surfaces the last failure
    try {
        const Clip normalized = normalize_props_for_tonemap(
            backend, convert_to_rgb48(backend, original, ColorspaceDescriptor::from_props(original.frame_props())),
            ColorspaceDescriptor::from_props(original.frame_props()));
        sequencer.tonemap(normalized, std::nullopt);
        assert(false && "tonemap should have failed");
    } catch (const TonemapAttemptError& e) {
        assert(std::string(e.what()) == "Tonemap: attempt 1 rejected");
    }
    assert(backend.tonemap_calls.size() == 2);

    // process() falls back to a plain conversion of the original clip
    backend.tonemap_calls.clear();
    const Clip result = sequencer.process(original);
    assert(backend.tonemap_calls.size() == 3);
    assert(result.format() == RGB24);
    assert(marker_of(result).empty());
    assert(test::step_names(result) == "resize");
    assert(log.contains("Falling back to SDR conversion"));

    std::cout << "test_all_attempts_fail: PASSED\n";
}

static void test_unsupported_parameters_relaxed() {
    RecordingBackend backend;
    backend.reject = [](const ParameterSet& params, size_t) {
        if (params.count(tonemap_key::GAMUT_MODE) || params.count(tonemap_key::TONE_MAPPING_MODE)) {
            return std::string(REJECT_MODES);
        }
        return std::string();
    };
    LogCapture log;
    TonemapSettings settings;
    TonemapAttemptSequencer sequencer(backend, settings, log.diag());

    const Clip first = sequencer.process(make_clip(3840, 2160, 100, hdr_props()));
    assert(backend.tonemap_calls.size() == 2);
    assert(backend.tonemap_calls[1].count(tonemap_key::GAMUT_MODE) == 0);
    assert(backend.tonemap_calls[1].count(tonemap_key::TONE_MAPPING_MODE) == 0);
    assert(backend.tonemap_calls[1].count(tonemap_key::DST_MAX) == 1);
    assert(!marker_of(first).empty());

    const auto& unsupported = sequencer.unsupported_parameters();
    assert(unsupported.size() == 2);
    assert(unsupported.count("gamut_mode") && unsupported.count("tone_mapping_mode"));

    // Later clips skip the rejected keys up front
    const Clip second = sequencer.process(make_clip(3840, 2160, 100, hdr_props()));
    assert(backend.tonemap_calls.size() == 3);
    assert(backend.tonemap_calls[2].count(tonemap_key::GAMUT_MODE) == 0);
    assert(!marker_of(second).empty());

    assert(log.count("Ignoring unsupported tonemap arguments") == 1);

    std::cout << "test_unsupported_parameters_relaxed: PASSED\n";
}

static void test_shared_unsupported_set() {
    RecordingBackend backend;
    LogCapture log;
    TonemapSettings settings;
    std::set<std::string> shared = {tonemap_key::USE_DOVI};
    TonemapAttemptSequencer sequencer(backend, settings, log.diag(), &shared);

    sequencer.process(make_clip(3840, 2160, 100, hdr_props()));
    assert(backend.tonemap_calls.size() == 1);
    assert(backend.tonemap_calls[0].count(tonemap_key::USE_DOVI) == 0);
    assert(&sequencer.unsupported_parameters() == &shared);

    std::cout << "test_shared_unsupported_set: PASSED\n";
}

static void test_no_tonemap_backend() {
    RecordingBackend backend;
    backend.tonemap_available = false;
    LogCapture log;
    TonemapSettings settings;
    TonemapAttemptSequencer sequencer(backend, settings, log.diag());

    bool raised = false;
    try {
        sequencer.process(make_clip(3840, 2160, 100, hdr_props()));
    } catch (const BackendUnavailableError& e) {
        raised = std::string(e.what()).find("recording") != std::string::npos;
    }
    assert(raised);
    assert(backend.tonemap_calls.empty());

    std::cout << "test_no_tonemap_backend: PASSED\n";
}

int main() {
    test_attempt_plan();
    test_extract_unsupported();
    test_tonemap_marker();
    test_first_attempt_succeeds();
    test_attempts_run_in_order();
    test_all_attempts_fail();
    test_unsupported_parameters_relaxed();
    test_shared_unsupported_set();
    test_no_tonemap_backend();

    std::cout << "\nAll tonemap sequencer tests passed!\n";
    return 0;
}
