/*
 * File:        frame_props.h
 * Module:      compshot-core
 * Purpose:     Per-frame metadata record and decode rules
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace compshot {

/**
 * @brief Raw bytes as delivered by a backend (e.g. a string property)
 */
struct PropBytes {
    std::string data;

    bool operator==(const PropBytes& other) const { return data == other.data; }
};

/// A single metadata value: integer, floating point or raw bytes
using PropValue = std::variant<int64_t, double, PropBytes>;

/// Frame metadata as reported by the backend, keyed by property name
using FrameProps = std::map<std::string, PropValue>;

// Well-known property names
namespace prop {
    inline constexpr const char* MATRIX = "_Matrix";
    inline constexpr const char* TRANSFER = "_Transfer";
    inline constexpr const char* PRIMARIES = "_Primaries";
    inline constexpr const char* COLOR_RANGE = "_ColorRange";
    inline constexpr const char* TONEMAPPED = "_Tonemapped";
}

// ISO/IEC 23091-4 code points used by the classifier
namespace code {
    inline constexpr int MATRIX_RGB = 0;
    inline constexpr int TRANSFER_BT709 = 1;
    inline constexpr int TRANSFER_PQ = 16;
    inline constexpr int TRANSFER_HLG = 18;
    inline constexpr int PRIMARIES_BT709 = 1;
    inline constexpr int PRIMARIES_BT2020 = 9;
    inline constexpr int RANGE_FULL = 0;
    inline constexpr int RANGE_LIMITED = 1;
}

/**
 * @brief Read a property as an integer code
 *
 * Decode rules:
 * - missing key -> nullopt
 * - integer -> value
 * - floating point -> truncated toward zero when finite, otherwise nullopt
 * - bytes -> text with surrounding whitespace removed, parsed as a base-10
 *   integer that must consume the whole text, otherwise nullopt
 *
 * Never throws.
 */
std::optional<int64_t> read_int_prop(const FrameProps& props, const std::string& key);

/**
 * @brief Colour representation derived from frame metadata
 *
 * Each field is absent when the metadata is missing or malformed.
 */
struct ColorspaceDescriptor {
    std::optional<int> matrix;
    std::optional<int> transfer;
    std::optional<int> primaries;
    std::optional<int> range;

    static ColorspaceDescriptor from_props(const FrameProps& props);
};

/// Debug helper: "matrix=1 transfer=16 primaries=9 range=absent"
std::string to_string(const ColorspaceDescriptor& desc);

} // namespace compshot
