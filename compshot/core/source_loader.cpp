/*
 * File:        source_loader.cpp
 * Module:      compshot-core
 * Purpose:     Locate and open the source and encode files of a comparison
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "source_loader.h"
#include "errors.h"
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>

namespace fs = std::filesystem;

namespace compshot {

bool is_video_file(const fs::path& path) {
    static const char* const SUFFIXES[] = {".mp4", ".mkv", ".m2ts", ".ts"};
    const std::string ext = path.extension().string();
    return std::any_of(std::begin(SUFFIXES), std::end(SUFFIXES),
                       [&](const char* suffix) { return ext == suffix; });
}

fs::path index_cache_path(const fs::path& source, SourceFilter filter) {
    fs::path cache = source;
    cache.replace_extension(index_cache_suffix(filter));
    return cache;
}

fs::path guess_source(const fs::path& folder) {
    fs::path best;
    uintmax_t best_size = 0;
    bool found = false;

    for (const auto& entry : fs::directory_iterator(folder)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const uintmax_t size = entry.file_size();
        if (!found || size > best_size) {
            best = entry.path();
            best_size = size;
            found = true;
        }
    }

    if (!found) {
        throw ConfigurationError(fmt::format("No files found in '{}'", folder.string()));
    }
    return best;
}

std::vector<fs::path> discover_encodes(const fs::path& folder, const std::string& source_stem) {
    std::vector<fs::path> encodes;
    for (const auto& entry : fs::directory_iterator(folder)) {
        const fs::path& path = entry.path();
        if (is_video_file(path) && path.stem().string() != source_stem) {
            encodes.push_back(path);
        }
    }
    std::sort(encodes.begin(), encodes.end());
    return encodes;
}

std::vector<Clip> load_clips(const VideoBackend& backend,
                             Diagnostics& diag,
                             const std::vector<fs::path>& files,
                             SourceFilter filter) {
    if (files.empty()) {
        throw ConfigurationError(
            "No files were provided. Pass a list of file paths or a folder containing files to load");
    }

    std::vector<Clip> clips;
    clips.reserve(files.size());
    for (const auto& file : files) {
        const fs::path cache = index_cache_path(file, filter);
        diag.debug("Loading '{}' with {} (index: {})", file.string(), source_filter_name(filter), cache.string());
        clips.push_back(backend.load(filter, file, cache));
    }
    return clips;
}

} // namespace compshot
