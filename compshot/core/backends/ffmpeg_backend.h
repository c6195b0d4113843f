/*
 * File:        ffmpeg_backend.h
 * Module:      compshot-core
 * Purpose:     FFmpeg/libavfilter implementation of the video backend
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#ifndef COMPSHOT_CORE_FFMPEG_BACKEND_H
#define COMPSHOT_CORE_FFMPEG_BACKEND_H

#include "chained_backend.h"

#ifdef HAVE_FFMPEG

#include "png_writer.h"

namespace compshot {

/**
 * @brief Video backend built on libavformat, libavcodec and libavfilter
 *
 * Sources are probed with libavformat. Transformations are recorded as clip
 * steps and only evaluated in write_frame(), which decodes the requested
 * frame, runs it through a filter graph built from the steps (crop, zscale,
 * setparams, libplacebo, drawtext) and saves the result as PNG.
 *
 * Tonemapping needs FFmpeg's libplacebo filter; resizing needs zscale.
 */
class FFmpegBackend : public ChainedBackend {
public:
    FFmpegBackend();

    std::string name() const override { return "ffmpeg"; }

    Clip load(SourceFilter filter,
              const std::filesystem::path& path,
              const std::filesystem::path& cache_path) const override;

    Clip resize(const Clip& clip, const ResizeRequest& request) const override;

    bool has_tonemap() const override;

    /**
     * Keywords with no libplacebo option, or whose option the installed
     * filter lacks, are rejected with "does not take argument(s) named ...".
     */
    Clip tonemap(const Clip& clip, const ParameterSet& parameters) const override;

    void write_frame(const Clip& clip, int64_t frame, const std::filesystem::path& path) const override;

private:
    RgbImage render(const Clip& clip, int64_t frame) const;
};

} // namespace compshot

#endif // HAVE_FFMPEG

#endif // COMPSHOT_CORE_FFMPEG_BACKEND_H
