/*
 * File:        frame_selection.cpp
 * Module:      compshot-core
 * Purpose:     Random screenshot frame selection
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "frame_selection.h"
#include "errors.h"
#include "logging.h"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <map>
#include <random>

namespace compshot {

std::vector<int64_t> generate_random_frames(const std::vector<Clip>& clips,
                                            int64_t start,
                                            int64_t stop,
                                            int64_t count,
                                            std::optional<uint64_t> seed) {
    if (clips.empty()) {
        throw ConfigurationError("Random frames requested without any clips");
    }

    int64_t frame_count = clips.front().num_frames();
    for (const auto& clip : clips) {
        frame_count = std::min(frame_count, clip.num_frames());
    }

    if (start > frame_count) {
        throw ConfigurationError(fmt::format(
            "random frames: start frame {} is greater than the smallest clip's end frame {}",
            start, frame_count));
    }
    if (start < 0 || count < 0) {
        throw ConfigurationError("random frames: start and count must not be negative");
    }

    const int64_t end = std::min(stop, frame_count - RANDOM_FRAME_TAIL_MARGIN);
    const int64_t available = end > start ? end - start : 0;
    if (count > available) {
        throw ConfigurationError(fmt::format(
            "random frames: cannot pick {} frames from range [{}, {})", count, start, end));
    }

    std::mt19937_64 rng(seed ? *seed : std::random_device{}());

    // Partial Fisher-Yates over the range without materializing it
    std::vector<int64_t> frames;
    frames.reserve(static_cast<size_t>(count));
    std::map<int64_t, int64_t> swapped;
    for (int64_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<int64_t> pick(i, available - 1);
        const int64_t j = pick(rng);

        auto value_at = [&](int64_t k) {
            auto it = swapped.find(k);
            return it == swapped.end() ? k : it->second;
        };
        const int64_t vi = value_at(i);
        const int64_t vj = value_at(j);
        swapped[j] = vi;
        swapped[i] = vj;
        frames.push_back(start + vj);
    }

    std::sort(frames.begin(), frames.end());
    LOG_DEBUG("Random frames: {}", fmt::join(frames, ", "));
    return frames;
}

} // namespace compshot
