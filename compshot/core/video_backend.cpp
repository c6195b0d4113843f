/*
 * File:        video_backend.cpp
 * Module:      compshot-core
 * Purpose:     Loader and kernel name tables
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "video_backend.h"
#include "errors.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace compshot {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::array<std::pair<ResizeKernel, const char*>, 7> KERNELS = {{
    {ResizeKernel::Bilinear, "bilinear"},
    {ResizeKernel::Bicubic, "bicubic"},
    {ResizeKernel::Point, "point"},
    {ResizeKernel::Lanczos, "lanczos"},
    {ResizeKernel::Spline16, "spline16"},
    {ResizeKernel::Spline36, "spline36"},
    {ResizeKernel::Spline64, "spline64"},
}};

} // anonymous namespace

SourceFilter source_filter_from_string(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "ffms2") return SourceFilter::FFMS2;
    if (lower == "lsmas") return SourceFilter::LSMAS;
    throw UnknownLoaderError("Unknown load filter '" + name + "'. Options are 'ffms2' and 'lsmas'");
}

const char* source_filter_name(SourceFilter filter) {
    switch (filter) {
        case SourceFilter::FFMS2: return "ffms2";
        case SourceFilter::LSMAS: return "lsmas";
    }
    return "unknown";
}

const char* index_cache_suffix(SourceFilter filter) {
    switch (filter) {
        case SourceFilter::FFMS2: return ".ffindex";
        case SourceFilter::LSMAS: return ".lwi";
    }
    return ".index";
}

ResizeKernel resize_kernel_from_string(const std::string& name) {
    const std::string lower = to_lower(name);
    for (const auto& [kernel, kernel_name] : KERNELS) {
        if (lower == kernel_name) {
            return kernel;
        }
    }
    throw UnknownKernelError("Unknown resize kernel '" + name +
                             "'. Options are bilinear, bicubic, point, lanczos, spline16, spline36, spline64");
}

const char* resize_kernel_name(ResizeKernel kernel) {
    for (const auto& [k, kernel_name] : KERNELS) {
        if (k == kernel) {
            return kernel_name;
        }
    }
    return "unknown";
}

} // namespace compshot
