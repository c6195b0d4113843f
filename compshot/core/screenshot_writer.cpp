/*
 * File:        screenshot_writer.cpp
 * Module:      compshot-core
 * Purpose:     Render prepared clips to tagged image files
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "screenshot_writer.h"
#include "errors.h"
#include <fmt/format.h>

namespace compshot {

std::string screenshot_file_name(size_t position, Tag tag) {
    return fmt::format("{}{}.png", position, tag_to_utf8(tag));
}

std::vector<std::filesystem::path> generate_screenshots(const VideoBackend& backend,
                                                        Diagnostics& diag,
                                                        const std::vector<Clip>& clips,
                                                        const std::filesystem::path& folder,
                                                        const std::vector<int64_t>& frames,
                                                        int64_t offset,
                                                        bool has_source) {
    if (clips.empty()) {
        throw ConfigurationError("No clips to screenshot");
    }

    const std::vector<Tag> tags = allocate_tags_for_directory(folder, clips.size());

    std::vector<std::filesystem::path> written;
    written.reserve(clips.size() * frames.size());

    for (size_t i = 0; i < clips.size(); ++i) {
        const Clip& clip = clips[i];
        const bool is_source = has_source && i == 0;
        const int64_t shift = is_source ? offset : 0;
        const std::string tag_text = tag_to_utf8(tags[i]);

        diag.info("Writing {} screenshot(s) for '{}' with tag '{}'",
                  frames.size(), clip.overlay_title().empty() ? clip.source_path() : clip.overlay_title(),
                  tag_text);

        for (size_t n = 0; n < frames.size(); ++n) {
            const int64_t frame = frames[n] + shift;
            if (frame < 0 || frame >= clip.num_frames()) {
                throw ConfigurationError(fmt::format(
                    "Frame {} is outside '{}' ({} frames)", frame, clip.source_path(), clip.num_frames()));
            }

            const std::filesystem::path path = folder / screenshot_file_name(n + 1, tags[i]);
            backend.write_frame(clip, frame, path);
            diag.debug("  frame {} -> {}", frame, path.string());
            written.push_back(path);
        }
    }

    return written;
}

} // namespace compshot
