/*
 * File:        filter_chain.h
 * Module:      compshot-core
 * Purpose:     Translate clip steps into libavfilter filter specifications
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#ifndef COMPSHOT_CORE_FILTER_CHAIN_H
#define COMPSHOT_CORE_FILTER_CHAIN_H

#include "clip.h"
#include "parameter_value.h"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace compshot {

/**
 * @brief One libavfilter filter and its options
 *
 * Options are applied one by one with av_opt_set() before the filter is
 * initialized, so values need no filtergraph escaping.
 */
struct FilterSpec {
    std::string name;
    std::vector<std::pair<std::string, std::string>> options;

    /// Value of an option, empty when not set
    std::string option(const std::string& key) const;
};

using FilterChain = std::vector<FilterSpec>;

/**
 * @brief Per-frame values only known once a frame has been decoded
 */
struct FrameStamp {
    int64_t frame = 0;          ///< Frame number within the clip
    int64_t total_frames = 0;
    char picture_type = '?';    ///< I, P, B, ...
};

/// Pixel format name for a clip format (e.g. RGB8 -> "rgb24")
std::string pixel_format_name(const VideoFormat& format);

/**
 * @brief libplacebo filter option for a tonemap keyword
 *
 * Keys without an equivalent option (dst_max, dst_min, src_csp handled by a
 * preceding setparams) return nullopt.
 */
std::optional<std::string> libplacebo_option(const std::string& key);

/// Tonemap keywords in @p parameters without any libplacebo equivalent
std::vector<std::string> unmapped_tonemap_keys(const ParameterSet& parameters);

/**
 * @brief Filters evaluating the whole step chain for one frame
 *
 * The chain ends in the clip's own format; callers append the conversion
 * they need for output.
 *
 * @throws ConfigurationError for a step the translator does not know
 */
FilterChain build_filter_chain(const std::vector<ClipStep>& steps, const FrameStamp& stamp);

/// "crop=w=...:h=...,zscale=..." for logging
std::string to_string(const FilterChain& chain);

} // namespace compshot

#endif // COMPSHOT_CORE_FILTER_CHAIN_H
