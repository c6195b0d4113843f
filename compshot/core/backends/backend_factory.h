/*
 * File:        backend_factory.h
 * Module:      compshot-core
 * Purpose:     Create the video backend this build supports
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#ifndef COMPSHOT_CORE_BACKEND_FACTORY_H
#define COMPSHOT_CORE_BACKEND_FACTORY_H

#include "video_backend.h"

namespace compshot {

/**
 * @brief The FFmpeg backend when the build found FFmpeg
 *
 * @throws BackendUnavailableError in builds without FFmpeg
 */
VideoBackendPtr create_video_backend();

} // namespace compshot

#endif // COMPSHOT_CORE_BACKEND_FACTORY_H
