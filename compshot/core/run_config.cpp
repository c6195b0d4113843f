/*
 * File:        run_config.cpp
 * Module:      compshot-core
 * Purpose:     YAML run configuration
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "run_config.h"
#include "errors.h"
#include "logging.h"
#include <yaml-cpp/yaml.h>
#include <cmath>

namespace compshot {

namespace {

void require(bool condition, const std::string& origin, const std::string& message) {
    if (!condition) {
        throw ConfigurationError("Invalid configuration '" + origin + "': " + message);
    }
}

// Present keys must convert; absent keys keep the default
template<typename T>
T read(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node value = node[key];
    if (!value) {
        return fallback;
    }
    return value.as<T>();
}

void load_tonemap_section(const YAML::Node& node, TonemapSettings& tm) {
    tm.function = read<std::string>(node, "function", tm.function);
    tm.dst_max = read<double>(node, "dst_max", tm.dst_max);
    tm.dst_min = read<double>(node, "dst_min", tm.dst_min);
    tm.dynamic_peak_detection = read<bool>(node, "dynamic_peak_detection", tm.dynamic_peak_detection);
    tm.gamut_mode = read<int>(node, "gamut_mode", tm.gamut_mode);
    tm.tone_mapping_mode = read<int>(node, "tone_mapping_mode", tm.tone_mapping_mode);
    tm.smoothing_period = read<int>(node, "smoothing_period", tm.smoothing_period);
    tm.min_dynamic_peak = read<double>(node, "min_dynamic_peak", tm.min_dynamic_peak);
    tm.scene_threshold_low = read<double>(node, "scene_threshold_low", tm.scene_threshold_low);
    tm.scene_threshold_high = read<double>(node, "scene_threshold_high", tm.scene_threshold_high);
    tm.use_dovi = read<bool>(node, "use_dovi", tm.use_dovi);
}

void load_screenshots_section(const YAML::Node& node, ScreenshotSettings& ss, const std::string& origin) {
    if (node["resize_kernel"]) {
        const std::string name = node["resize_kernel"].as<std::string>();
        try {
            ss.resize_kernel = resize_kernel_from_string(name);
        } catch (const UnknownKernelError& e) {
            throw UnknownKernelError("Invalid configuration '" + origin + "': " + e.what());
        }
    }
    if (node["load_filter"]) {
        const std::string name = node["load_filter"].as<std::string>();
        try {
            ss.load_filter = source_filter_from_string(name);
        } catch (const UnknownLoaderError& e) {
            throw UnknownLoaderError("Invalid configuration '" + origin + "': " + e.what());
        }
    }
    ss.crop_modulus = read<int>(node, "crop_modulus", ss.crop_modulus);
    ss.frame_info = read<bool>(node, "frame_info", ss.frame_info);

    require(ss.crop_modulus >= 1, origin, "screenshots.crop_modulus must be at least 1");
}

void load_logging_section(const YAML::Node& node, LoggingSettings& ls) {
    ls.level = read<std::string>(node, "level", ls.level);
    ls.file = read<std::string>(node, "file", ls.file);
}

RunConfig build_config(const YAML::Node& root, const std::string& origin) {
    RunConfig config;

    if (root.IsNull()) {
        return config;
    }
    require(root.IsMap(), origin, "top level must be a mapping");

    try {
        if (root["tonemap"]) {
            load_tonemap_section(root["tonemap"], config.tonemap);
        }
        if (root["screenshots"]) {
            load_screenshots_section(root["screenshots"], config.screenshots, origin);
        }
        if (root["logging"]) {
            load_logging_section(root["logging"], config.logging);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid configuration '" + origin + "': " + e.what());
    }

    validate_tonemap_settings(config.tonemap, origin);

    COMPSHOT_LOG_DEBUG("Loaded configuration from '{}'", origin);
    return config;
}

} // anonymous namespace

void validate_tonemap_settings(const TonemapSettings& settings, const std::string& origin) {
    require(!settings.function.empty(), origin, "tonemap.function must not be empty");
    require(std::isfinite(settings.dst_max) && settings.dst_max > 0.0, origin,
            "tonemap.dst_max must be positive");
    require(std::isfinite(settings.dst_min) && settings.dst_min >= 0.0 && settings.dst_min < settings.dst_max,
            origin, "tonemap.dst_min must be in [0, dst_max)");
    require(settings.gamut_mode >= 0, origin, "tonemap.gamut_mode must not be negative");
    require(settings.tone_mapping_mode >= 0, origin, "tonemap.tone_mapping_mode must not be negative");
    require(settings.smoothing_period >= 0, origin, "tonemap.smoothing_period must not be negative");
    require(settings.min_dynamic_peak >= 0.0, origin, "tonemap.min_dynamic_peak must not be negative");
    require(settings.scene_threshold_low >= 0.0 && settings.scene_threshold_low <= settings.scene_threshold_high,
            origin, "tonemap.scene_threshold_low must be in [0, scene_threshold_high]");
}

RunConfig load_run_config(const std::string& filename) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse YAML file '" + filename + "': " + e.what());
    }

    return build_config(root, filename);
}

RunConfig parse_run_config(const std::string& yaml_text, const std::string& origin) {
    YAML::Node root;

    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse YAML '" + origin + "': " + e.what());
    }

    return build_config(root, origin);
}

} // namespace compshot
