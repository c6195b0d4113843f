/*
 * File:        test_png_writer.cpp
 * Module:      compshot-core/tests
 * Purpose:     PNG export of rendered frames
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#undef NDEBUG
#include <cassert>
#include <cstring>
#include <iostream>

#include <png.h>

#include "errors.h"
#include "png_writer.h"
#include "test_support.h"

using namespace compshot;
using compshot::test::TempDir;

static void test_write_and_read_back() {
    TempDir dir("compshot-png");
    const std::string path = (dir.path() / "1a.png").string();

    RgbImage image;
    image.width = 3;
    image.height = 2;
    image.rgb_data = {
        255, 0, 0,    0, 255, 0,    0, 0, 255,
        0, 0, 0,      128, 128, 128, 255, 255, 255,
    };
    assert(image.is_valid());
    write_png(image, path);

    png_image read;
    std::memset(&read, 0, sizeof(read));
    read.version = PNG_IMAGE_VERSION;
    assert(png_image_begin_read_from_file(&read, path.c_str()));
    read.format = PNG_FORMAT_RGB;
    assert(read.width == 3 && read.height == 2);

    std::vector<uint8_t> pixels(PNG_IMAGE_SIZE(read));
    assert(png_image_finish_read(&read, nullptr, pixels.data(), 0, nullptr));
    assert(pixels == image.rgb_data);

    std::cout << "test_write_and_read_back: PASSED\n";
}

static void test_write_errors() {
    TempDir dir("compshot-png-errors");

    RgbImage truncated;
    truncated.width = 4;
    truncated.height = 4;
    truncated.rgb_data.resize(10);
    assert(!truncated.is_valid());

    bool raised = false;
    try {
        write_png(truncated, (dir.path() / "bad.png").string());
    } catch (const ImageWriteError&) {
        raised = true;
    }
    assert(raised);

    RgbImage pixel;
    pixel.width = 1;
    pixel.height = 1;
    pixel.rgb_data = {1, 2, 3};
    raised = false;
    try {
        write_png(pixel, (dir.path() / "missing" / "1a.png").string());
    } catch (const ImageWriteError&) {
        raised = true;
    }
    assert(raised);

    std::cout << "test_write_errors: PASSED\n";
}

static void test_libpng_error_removes_file() {
    TempDir dir("compshot-png-ihdr");
    const auto path = dir.path() / "1a.png";

    // Wider than libpng's default user limit: IHDR validation fails inside libpng
    RgbImage wide;
    wide.width = 1000001;
    wide.height = 1;
    wide.rgb_data.resize(static_cast<size_t>(wide.width) * 3);
    assert(wide.is_valid());

    bool raised = false;
    try {
        write_png(wide, path.string());
    } catch (const ImageWriteError& e) {
        raised = true;
        assert(std::string(e.what()).find("PNG write error") == 0);
    }
    assert(raised);
    assert(!std::filesystem::exists(path));

    // The writer is still usable afterwards
    RgbImage pixel;
    pixel.width = 1;
    pixel.height = 1;
    pixel.rgb_data = {9, 8, 7};
    write_png(pixel, path.string());
    assert(std::filesystem::exists(path));

    std::cout << "test_libpng_error_removes_file: PASSED\n";
}

int main() {
    test_write_and_read_back();
    test_write_errors();
    test_libpng_error_removes_file();

    std::cout << "\nAll PNG writer tests passed!\n";
    return 0;
}
