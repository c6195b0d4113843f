/*
 * File:        video_backend.h
 * Module:      compshot-core
 * Purpose:     Abstract decode/filter backend used by clip preparation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "geometry.h"
#include "parameter_value.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace compshot {

/**
 * @brief Named source loaders
 */
enum class SourceFilter {
    FFMS2,
    LSMAS
};

/// @throws UnknownLoaderError for anything other than "ffms2" / "lsmas"
SourceFilter source_filter_from_string(const std::string& name);
const char* source_filter_name(SourceFilter filter);

/// Index cache suffix written next to the source (".ffindex" / ".lwi")
const char* index_cache_suffix(SourceFilter filter);

/**
 * @brief Resampling kernels available to the resize backend
 */
enum class ResizeKernel {
    Bilinear,
    Bicubic,
    Point,
    Lanczos,
    Spline16,
    Spline36,
    Spline64
};

/// Case-insensitive lookup
/// @throws UnknownKernelError if the name is not a supported kernel
ResizeKernel resize_kernel_from_string(const std::string& name);
const char* resize_kernel_name(ResizeKernel kernel);

/**
 * @brief One call into the resize backend
 *
 * Width/height/format left unset keep the clip's current value. Options are
 * passed through to the kernel unchanged (matrix_in, transfer_in,
 * primaries_in, range_in, dither_type, ...).
 */
struct ResizeRequest {
    ResizeKernel kernel = ResizeKernel::Spline36;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<VideoFormat> format;
    ParameterSet options;
};

/**
 * @brief External colour/video processing backend
 *
 * Implementations build clips lazily: each operation returns a new Clip with
 * one more step and only write_frame() computes pixels.
 */
class VideoBackend {
public:
    virtual ~VideoBackend() = default;

    /// Backend name for diagnostics
    virtual std::string name() const = 0;

    /// Open a source with the given loader
    /// @param cache_path Index cache file used by the loader
    virtual Clip load(SourceFilter filter,
                      const std::filesystem::path& path,
                      const std::filesystem::path& cache_path) const = 0;

    virtual Clip crop(const Clip& clip, const CropGeometry& crop) const = 0;

    virtual Clip resize(const Clip& clip, const ResizeRequest& request) const = 0;

    /// Overwrite frame properties; keys not in @p updates are kept
    virtual Clip set_frame_props(const Clip& clip, const FrameProps& updates) const = 0;

    /// Whether a tonemap implementation is installed
    virtual bool has_tonemap() const = 0;

    /**
     * @brief Tonemap a clip
     *
     * @throws TonemapAttemptError if the backend rejects the call; the
     *         message may name unsupported parameters
     * @throws BackendUnavailableError if has_tonemap() is false
     */
    virtual Clip tonemap(const Clip& clip, const ParameterSet& parameters) const = 0;

    /// Annotate every frame with frame number, picture type and @p title
    virtual Clip frame_info(const Clip& clip, const std::string& title) const = 0;

    /// Render one frame of the clip to an image file
    virtual void write_frame(const Clip& clip, int64_t frame, const std::filesystem::path& path) const = 0;
};

using VideoBackendPtr = std::shared_ptr<VideoBackend>;

} // namespace compshot
