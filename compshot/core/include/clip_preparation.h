/*
 * File:        clip_preparation.h
 * Module:      compshot-core
 * Purpose:     Crop, colour normalization and overlay for a comparison set
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "geometry.h"
#include "logging.h"
#include "tonemap_settings.h"
#include "video_backend.h"
#include <set>
#include <string>
#include <vector>

namespace compshot {

struct PreparationOptions {
    Dimensions crop;                    ///< Shared output dimensions
    int modulus = 2;                    ///< Crop margin alignment
    std::vector<std::string> titles;    ///< Overlay titles, one per clip (optional)
    bool add_frame_info = true;         ///< Draw the frame info overlay
};

/**
 * @brief Turns loaded clips into render-ready RGB24 clips
 *
 * Steps: crop every clip, classify the batch, tonemap (HDR) or convert
 * (SDR) every clip, then optionally add the frame info overlay.
 *
 * The batch is classified from the first clip's metadata only: all clips in
 * one comparison set are assumed to share the source's dynamic range. Each
 * clip may still fall back to plain SDR conversion on its own.
 */
class ClipPreparationPipeline {
public:
    ClipPreparationPipeline(const VideoBackend& backend,
                            const TonemapSettings& settings,
                            Diagnostics& diag);

    /**
     * @param clips Clip 0 is conventionally the source
     * @throws ConfigurationError if @p clips is empty
     * @throws DegenerateCropError from cropping
     * @throws BackendUnavailableError if the batch is HDR and the backend
     *         cannot tonemap
     */
    std::vector<Clip> prepare(const std::vector<Clip>& clips, const PreparationOptions& options);

    /// Tonemap keys found unsupported so far (shared by every clip prepared here)
    const std::set<std::string>& unsupported_parameters() const { return unsupported_parameters_; }

private:
    std::vector<Clip> add_overlays(const std::vector<Clip>& clips, const std::vector<std::string>& titles);

    const VideoBackend& backend_;
    const TonemapSettings& settings_;
    Diagnostics& diag_;
    std::set<std::string> unsupported_parameters_;
};

} // namespace compshot
