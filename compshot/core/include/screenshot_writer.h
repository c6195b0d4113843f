/*
 * File:        screenshot_writer.h
 * Module:      compshot-core
 * Purpose:     Render prepared clips to tagged image files
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "logging.h"
#include "tag_allocator.h"
#include "video_backend.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace compshot {

/// File name of the @p position'th (1-based) screenshot of a clip
std::string screenshot_file_name(size_t position, Tag tag);

/**
 * @brief Write every requested frame of every clip into @p folder
 *
 * Tags are allocated against the images already in the folder. When
 * @p has_source is set, clip 0 is the source: it takes the first tag and its
 * frames are shifted by @p offset. All other clips use the frames as given.
 *
 * @return Paths of the written files, clip by clip
 * @throws ConfigurationError for an empty clip list or a frame outside a clip
 */
std::vector<std::filesystem::path> generate_screenshots(const VideoBackend& backend,
                                                        Diagnostics& diag,
                                                        const std::vector<Clip>& clips,
                                                        const std::filesystem::path& folder,
                                                        const std::vector<int64_t>& frames,
                                                        int64_t offset,
                                                        bool has_source);

} // namespace compshot
