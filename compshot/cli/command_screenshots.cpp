/*
 * File:        command_screenshots.cpp
 * Module:      compshot-cli
 * Purpose:     Screenshot command
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "command_screenshots.h"
#include "backend_factory.h"
#include "clip_preparation.h"
#include "errors.h"
#include "frame_selection.h"
#include "logging.h"
#include "resize_inference.h"
#include "run_layout.h"
#include "screenshot_writer.h"
#include "source_loader.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace compshot {
namespace cli {

namespace {

std::vector<std::string> path_strings(const std::vector<fs::path>& paths) {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(p.string());
    }
    return out;
}

} // anonymous namespace

int screenshots_command(const ScreenshotOptions& options, const RunConfig& config) {
    Diagnostics diag;

    if (options.frames.empty() && !options.random_frames) {
        throw ConfigurationError(
            "No frames were provided. Specify frames via the `--frames` argument or random "
            "frames via the `--random-frames` argument.");
    }

    const bool has_source = options.source.has_value();
    std::optional<fs::path> source;
    if (has_source) {
        source = fs::path(*options.source);
    }
    std::vector<fs::path> encodes(options.encodes.begin(), options.encodes.end());
    std::optional<fs::path> input_directory;
    if (options.input_directory) {
        input_directory = fs::path(*options.input_directory);
    }

    const fs::path root = comparison_root(source, encodes, input_directory);

    // Folder discovery replaces --encodes
    if (input_directory) {
        std::string source_stem;
        if (has_source) {
            COMPSHOT_LOG_INFO("Loading folder clips...");
            source_stem = source->stem().string();
        } else {
            COMPSHOT_LOG_INFO("Loading folder clips...no source was provided. Attempting to guess based on file size");
            source_stem = guess_source(*input_directory).stem().string();
            COMPSHOT_LOG_INFO("Source (best guess): {}", source_stem);
        }
        encodes = discover_encodes(*input_directory, source_stem);
    }

    const std::vector<fs::path> files = comparison_files(source, encodes);
    const std::vector<std::string> titles = resolve_titles(options.titles, files, has_source);

    std::optional<fs::path> requested_output;
    if (options.output_directory) {
        requested_output = fs::path(*options.output_directory);
    }
    const fs::path out_folder = prepare_output_directory(diag, requested_output, root, options.offset);

    // Command line overrides the configuration file
    const ResizeKernel kernel = options.resize_kernel
        ? resize_kernel_from_string(*options.resize_kernel)
        : config.screenshots.resize_kernel;
    const SourceFilter filter = options.load_filter
        ? source_filter_from_string(*options.load_filter)
        : config.screenshots.load_filter;
    const bool frame_info = options.no_frame_info ? false : config.screenshots.frame_info;

    const size_t index = has_source ? 1 : 0;
    if (has_source) {
        COMPSHOT_LOG_INFO("Source: {}", files[0].string());
    }
    COMPSHOT_LOG_INFO("Encodes: {}", fmt::join(path_strings({files.begin() + static_cast<std::ptrdiff_t>(index), files.end()}), ", "));
    COMPSHOT_LOG_INFO("Frame offset: {}", options.offset);
    COMPSHOT_LOG_INFO("Output folder: {}", out_folder.string());

    VideoBackendPtr backend = create_video_backend();
    COMPSHOT_LOG_DEBUG("Using '{}' backend", backend->name());

    std::vector<Clip> clips = load_clips(*backend, diag, files, filter);

    std::vector<int64_t> frames = options.frames;
    std::optional<Dimensions> crop = options.crop;

    if (clips.size() == 1) {
        if (!crop) {
            diag.warn("No crop values were provided. The clip will be uncropped.");
            crop = Dimensions{clips[0].width(), clips[0].height()};
        }
        if (options.random_frames) {
            const auto& r = *options.random_frames;
            frames = generate_random_frames(clips, r.start, r.stop, r.count, options.seed);
        }
    } else {
        const std::vector<Clip> encode_clips(clips.begin() + static_cast<std::ptrdiff_t>(index), clips.end());
        if (options.random_frames) {
            const auto& r = *options.random_frames;
            frames = generate_random_frames(encode_clips, r.start, r.stop, r.count, options.seed);
        }
        // Without a crop, use the first encode's dimensions
        if (!crop) {
            crop = Dimensions{clips[index].width(), clips[index].height()};
        }
        if (has_source) {
            clips[0] = verify_resize(*backend, diag, clips, kernel);
        }
    }

    COMPSHOT_LOG_INFO("Frames: {}", fmt::join(frames, ", "));

    // Crop, tonemap (if applicable) and frame info (if applicable)
    PreparationOptions prep;
    prep.crop = *crop;
    prep.modulus = config.screenshots.crop_modulus;
    prep.titles = titles;
    prep.add_frame_info = frame_info;

    ClipPreparationPipeline pipeline(*backend, config.tonemap, diag);
    const std::vector<Clip> prepared = pipeline.prepare(clips, prep);

    const auto written = generate_screenshots(*backend, diag, prepared, out_folder, frames,
                                              options.offset, has_source);

    COMPSHOT_LOG_INFO("Wrote {} screenshot(s) to '{}'", written.size(), out_folder.string());
    return 0;
}

} // namespace cli
} // namespace compshot
