/*
 * File:        run_layout.h
 * Module:      compshot-core
 * Purpose:     Input files, titles and output folder of a screenshot run
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "logging.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace compshot {

/**
 * @brief Folder the run is anchored in
 *
 * The source's folder, else the first encode's folder, else the input
 * directory. A bare file name anchors in ".".
 *
 * @throws ConfigurationError if none of them is given
 */
std::filesystem::path comparison_root(const std::optional<std::filesystem::path>& source,
                                      const std::vector<std::filesystem::path>& encodes,
                                      const std::optional<std::filesystem::path>& input_directory);

/**
 * @brief Files to load, in order
 *
 * [source, encodes...] or whichever of the two is present.
 *
 * @throws ConfigurationError if there is nothing to load
 */
std::vector<std::filesystem::path> comparison_files(const std::optional<std::filesystem::path>& source,
                                                    const std::vector<std::filesystem::path>& encodes);

/**
 * @brief Overlay titles for the files of a run
 *
 * With a source and exactly one title fewer than files, "Source" is put
 * first. A lone source without titles is titled "Source". Without titles the
 * file stems are used. Other title lists are returned unchanged.
 */
std::vector<std::string> resolve_titles(const std::vector<std::string>& titles,
                                        const std::vector<std::filesystem::path>& files,
                                        bool has_source);

/**
 * @brief Default output folder under @p root
 *
 * "screens t<k+1>-offset_<offset>" where k counts the existing
 * sub-directories of @p root whose name contains "screens".
 */
std::filesystem::path default_output_directory(const std::filesystem::path& root, int64_t offset);

/**
 * @brief Create and return the output folder
 *
 * A requested folder is created when missing; if that fails a warning is
 * logged and "<root>/screens-offset_<offset>" is used instead. Without a
 * request the default folder is created.
 *
 * @throws std::filesystem::filesystem_error if no folder can be created
 */
std::filesystem::path prepare_output_directory(Diagnostics& diag,
                                               const std::optional<std::filesystem::path>& requested,
                                               const std::filesystem::path& root,
                                               int64_t offset);

} // namespace compshot
