/*
 * File:        png_writer.h
 * Module:      compshot-core
 * Purpose:     RGB24 image buffer and PNG export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#ifndef COMPSHOT_CORE_PNG_WRITER_H
#define COMPSHOT_CORE_PNG_WRITER_H

#include <cstdint>
#include <string>
#include <vector>

namespace compshot {

/**
 * @brief Packed 8-bit RGB image
 */
struct RgbImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgb_data;  ///< RGB888, width * height * 3 bytes, no row padding

    bool is_valid() const {
        return width > 0 && height > 0 && rgb_data.size() == static_cast<size_t>(width) * height * 3;
    }
};

/**
 * @brief Write @p image as an 8-bit RGB PNG
 *
 * @throws ImageWriteError if the image is invalid or the file cannot be
 *         written
 */
void write_png(const RgbImage& image, const std::string& filename);

} // namespace compshot

#endif // COMPSHOT_CORE_PNG_WRITER_H
