/*
 * File:        source_loader.h
 * Module:      compshot-core
 * Purpose:     Locate and open the source and encode files of a comparison
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "logging.h"
#include "video_backend.h"
#include <filesystem>
#include <string>
#include <vector>

namespace compshot {

/// Container suffixes picked up when scanning a folder for encodes
bool is_video_file(const std::filesystem::path& path);

/// Index cache written by @p filter for @p source
std::filesystem::path index_cache_path(const std::filesystem::path& source, SourceFilter filter);

/**
 * @brief Largest regular file in @p folder
 *
 * Used when no source was named; the guess is only as good as the
 * assumption that the untouched source is the biggest file.
 *
 * @throws ConfigurationError if the folder holds no regular file
 */
std::filesystem::path guess_source(const std::filesystem::path& folder);

/**
 * @brief Video files in @p folder whose stem differs from @p source_stem
 *
 * Returned in name order.
 */
std::vector<std::filesystem::path> discover_encodes(const std::filesystem::path& folder,
                                                    const std::string& source_stem);

/**
 * @brief Open every file with the given loader
 *
 * @throws ConfigurationError if @p files is empty
 */
std::vector<Clip> load_clips(const VideoBackend& backend,
                             Diagnostics& diag,
                             const std::vector<std::filesystem::path>& files,
                             SourceFilter filter);

} // namespace compshot
