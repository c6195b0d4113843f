/*
 * File:        clip_preparation.cpp
 * Module:      compshot-core
 * Purpose:     Crop, colour normalization and overlay for a comparison set
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "clip_preparation.h"
#include "color_conversion.h"
#include "colorspace.h"
#include "crop_calculator.h"
#include "errors.h"
#include "tonemap_sequencer.h"
#include <fmt/format.h>

namespace compshot {

ClipPreparationPipeline::ClipPreparationPipeline(const VideoBackend& backend,
                                                 const TonemapSettings& settings,
                                                 Diagnostics& diag)
    : backend_(backend)
    , settings_(settings)
    , diag_(diag)
{
}

std::vector<Clip> ClipPreparationPipeline::prepare(const std::vector<Clip>& clips, const PreparationOptions& options) {
    if (clips.empty()) {
        throw ConfigurationError("No clips to prepare");
    }

    // Crop
    std::vector<Clip> prepared;
    prepared.reserve(clips.size());
    for (const auto& clip : clips) {
        prepared.push_back(crop_clip(backend_, diag_, clip, options.crop, options.modulus));
    }

    // Colour: the first clip decides for the whole batch
    if (is_hdr(prepared.front())) {
        diag_.info("HDR source detected, tonemapping {} clip(s)", prepared.size());
        TonemapAttemptSequencer sequencer(backend_, settings_, diag_, &unsupported_parameters_);
        for (auto& clip : prepared) {
            clip = sequencer.process(clip);
        }
    } else {
        for (auto& clip : prepared) {
            clip = convert_to_rgb24(backend_, clip);
        }
    }

    // Titles
    std::vector<std::string> titles;
    if (!options.titles.empty()) {
        if (options.titles.size() != prepared.size()) {
            diag_.warn("The number of titles ({}) does not match the number of clips ({})",
                       options.titles.size(), prepared.size());
        } else {
            titles = options.titles;
        }
    }

    if (!options.add_frame_info) {
        diag_.info("Frame overlay disabled");
        return prepared;
    }

    return add_overlays(prepared, titles);
}

std::vector<Clip> ClipPreparationPipeline::add_overlays(const std::vector<Clip>& clips,
                                                        const std::vector<std::string>& titles) {
    std::vector<Clip> result;
    result.reserve(clips.size());
    for (size_t i = 0; i < clips.size(); ++i) {
        const std::string title = titles.empty() ? fmt::format("Clip {}", i) : titles[i];
        result.push_back(backend_.frame_info(clips[i], title));
    }
    return result;
}

} // namespace compshot
