/*
 * File:        backend_factory.cpp
 * Module:      compshot-core
 * Purpose:     Create the video backend this build supports
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "backend_factory.h"
#include "errors.h"

#ifdef HAVE_FFMPEG
#include "ffmpeg_backend.h"
#endif

namespace compshot {

VideoBackendPtr create_video_backend() {
#ifdef HAVE_FFMPEG
    return std::make_shared<FFmpegBackend>();
#else
    throw BackendUnavailableError(
        "This build has no video backend. Rebuild with FFmpeg (libavformat, libavcodec, libavfilter) installed.");
#endif
}

} // namespace compshot
