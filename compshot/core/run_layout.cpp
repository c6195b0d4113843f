/*
 * File:        run_layout.cpp
 * Module:      compshot-core
 * Purpose:     Input files, titles and output folder of a screenshot run
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "run_layout.h"
#include "errors.h"
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace compshot {

namespace {

fs::path parent_or_current(const fs::path& file) {
    const fs::path parent = file.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

} // anonymous namespace

fs::path comparison_root(const std::optional<fs::path>& source,
                         const std::vector<fs::path>& encodes,
                         const std::optional<fs::path>& input_directory) {
    if (source) {
        return parent_or_current(*source);
    }
    if (!encodes.empty()) {
        return parent_or_current(encodes.front());
    }
    if (input_directory) {
        return *input_directory;
    }
    throw ConfigurationError("No files or directories were provided");
}

std::vector<fs::path> comparison_files(const std::optional<fs::path>& source,
                                       const std::vector<fs::path>& encodes) {
    std::vector<fs::path> files;
    if (source) {
        files.push_back(*source);
    }
    files.insert(files.end(), encodes.begin(), encodes.end());

    if (files.empty()) {
        throw ConfigurationError("No source or encode files to screenshot");
    }
    return files;
}

std::vector<std::string> resolve_titles(const std::vector<std::string>& titles,
                                        const std::vector<fs::path>& files,
                                        bool has_source) {
    if (has_source && !titles.empty() && files.size() == titles.size() + 1) {
        // Assume 'Source' was left out
        std::vector<std::string> result;
        result.reserve(files.size());
        result.push_back("Source");
        result.insert(result.end(), titles.begin(), titles.end());
        return result;
    }
    if (titles.empty() && has_source && files.size() == 1) {
        return {"Source"};
    }
    if (titles.empty()) {
        std::vector<std::string> stems;
        stems.reserve(files.size());
        for (const auto& file : files) {
            stems.push_back(file.stem().string());
        }
        return stems;
    }
    return titles;
}

fs::path default_output_directory(const fs::path& root, int64_t offset) {
    size_t existing = 0;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory() && it->path().filename().string().find("screens") != std::string::npos) {
            ++existing;
        }
    }
    return root / fmt::format("screens t{}-offset_{}", existing + 1, offset);
}

fs::path prepare_output_directory(Diagnostics& diag,
                                  const std::optional<fs::path>& requested,
                                  const fs::path& root,
                                  int64_t offset) {
    if (requested) {
        std::error_code ec;
        if (fs::is_directory(*requested, ec)) {
            return *requested;
        }
        fs::create_directories(*requested, ec);
        if (!ec) {
            return *requested;
        }

        const fs::path fallback = root / fmt::format("screens-offset_{}", offset);
        diag.warn("Failed to generate output folder: {}. Using '{}' instead", ec.message(), fallback.string());
        fs::create_directories(fallback);
        return fallback;
    }

    const fs::path folder = default_output_directory(root, offset);
    fs::create_directories(folder);
    return folder;
}

} // namespace compshot
