/*
 * File:        frame_selection.h
 * Module:      compshot-core
 * Purpose:     Random screenshot frame selection
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace compshot {

/// Frames at the end of the shortest clip never chosen at random
constexpr int64_t RANDOM_FRAME_TAIL_MARGIN = 5;

/**
 * @brief Sorted, distinct random frames in [start, stop)
 *
 * The frame count is that of the shortest clip; @p stop is clamped to
 * frame count - 5.
 *
 * @param seed Fixed seed for reproducible selection, random when unset
 * @throws ConfigurationError if @p clips is empty, @p start lies beyond the
 *         shortest clip or the range holds fewer than @p count frames
 */
std::vector<int64_t> generate_random_frames(const std::vector<Clip>& clips,
                                            int64_t start,
                                            int64_t stop,
                                            int64_t count,
                                            std::optional<uint64_t> seed = std::nullopt);

} // namespace compshot
