/*
 * File:        resize_inference.cpp
 * Module:      compshot-core
 * Purpose:     Infer whether the source must be rescaled to match the encodes
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "resize_inference.h"
#include "errors.h"
#include <fmt/format.h>

namespace compshot {

const char* scale_direction_name(ScaleDirection direction) {
    switch (direction) {
        case ScaleDirection::None: return "None";
        case ScaleDirection::Downscale: return "Downscale";
        case ScaleDirection::Upscale: return "Upscale";
    }
    return "unknown";
}

namespace {

bool same_aspect_ratio(const Dimensions& a, const Dimensions& b) {
    return static_cast<int64_t>(a.width) * b.height == static_cast<int64_t>(b.width) * a.height;
}

} // anonymous namespace

ResizeDecision infer_resize(const Dimensions& source, const std::vector<Dimensions>& references) {
    if (references.empty()) {
        throw ConfigurationError("Resize inference needs at least one encode to compare against");
    }
    if (source.width <= 0 || source.height <= 0) {
        throw ConfigurationError("Invalid source dimensions " + to_string(source));
    }
    for (const auto& ref : references) {
        if (ref.width <= 0 || ref.height <= 0) {
            throw ConfigurationError("Invalid encode dimensions " + to_string(ref));
        }
    }

    if (references.size() > 1) {
        for (size_t i = 1; i < references.size(); ++i) {
            if (!same_aspect_ratio(references[0], references[i])) {
                throw ConfigurationError(fmt::format(
                    "Inconsistent aspect ratios across encodes ({} vs {})",
                    to_string(references[0]), to_string(references[i])));
            }
        }
    }

    const Dimensions& ref = references[0];
    ResizeDecision decision;

    // Downscale. Tolerates column cropping on the encode
    if (source.width - ref.width > RESCALE_WIDTH_THRESHOLD) {
        decision.direction = ScaleDirection::Downscale;
        const int ratio = source.width / ref.width;
        if (ratio == 2) {
            decision.target = StandardResolution::R1080p;
        } else if (ratio == 1 || ratio == 3) {
            decision.target = StandardResolution::R720p;
        } else {
            throw AmbiguousRatioError(fmt::format(
                "Unable to determine downscale resizing ratio for dimensions '{}' (source {})",
                to_string(ref), to_string(source)));
        }
    }
    // Upscale
    else if (ref.width - source.width > RESCALE_WIDTH_THRESHOLD) {
        decision.direction = ScaleDirection::Upscale;
        const int ratio = ref.width / source.width;
        if (ratio == 2 || ratio == 3) {
            decision.target = StandardResolution::R2160p;
        } else if (ratio == 1) {
            decision.target = StandardResolution::R1080p;
        } else {
            throw AmbiguousRatioError(fmt::format(
                "Unable to determine upscale resizing ratio for dimensions '{}' (source {})",
                to_string(ref), to_string(source)));
        }
    }

    return decision;
}

Clip verify_resize(const VideoBackend& backend, Diagnostics& diag,
                   const std::vector<Clip>& clips,
                   ResizeKernel kernel,
                   const ParameterSet& options) {
    if (clips.size() < 2) {
        throw ConfigurationError("Resize verification needs the source and at least one encode");
    }

    const Clip& source = clips[0];
    std::vector<Dimensions> references;
    references.reserve(clips.size() - 1);
    for (size_t i = 1; i < clips.size(); ++i) {
        references.push_back({clips[i].width(), clips[i].height()});
    }

    const ResizeDecision decision = infer_resize({source.width(), source.height()}, references);
    if (!decision.requires_resize()) {
        diag.debug("No rescale needed ({} vs {})",
                   to_string(Dimensions{source.width(), source.height()}), to_string(references[0]));
        return source;
    }

    const Dimensions target = standard_dimensions(*decision.target);
    diag.info("{} detected", scale_direction_name(decision.direction));
    diag.info("Source dimensions: {}x{}", source.width(), source.height());
    diag.info("Encode dimensions: {}", to_string(references[0]));
    diag.info("Resizing kernel: {} (target {} {})", resize_kernel_name(kernel),
              resolution_name(*decision.target), to_string(target));

    ResizeRequest request;
    request.kernel = kernel;
    request.width = target.width;
    request.height = target.height;
    request.options = options;
    return backend.resize(source, request);
}

} // namespace compshot
