/*
 * File:        png_writer.cpp
 * Module:      compshot-core
 * Purpose:     RGB24 image buffer and PNG export
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "png_writer.h"
#include "errors.h"
#include "logging.h"
#include <fmt/format.h>
#include <png.h>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>

namespace compshot {

namespace {

struct FileCloser {
    void operator()(FILE* fp) const { std::fclose(fp); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

/// Last libpng error message, filled in before libpng longjmps
struct PngErrorState {
    char message[256] = {};
};

void on_png_error(png_structp png, png_const_charp message) {
    auto* state = static_cast<PngErrorState*>(png_get_error_ptr(png));
    if (state) {
        std::strncpy(state->message, message, sizeof(state->message) - 1);
    }
    png_longjmp(png, 1);
}

void on_png_warning(png_structp, png_const_charp message) {
    COMPSHOT_LOG_WARN("libpng: {}", message);
}

/**
 * @brief Owns a libpng write struct and its info struct
 */
class PngWriteHandle {
public:
    explicit PngWriteHandle(PngErrorState& errors)
        : png_(png_create_write_struct(PNG_LIBPNG_VER_STRING, &errors, on_png_error, on_png_warning))
    {
        if (!png_) {
            throw ImageWriteError("Failed to create PNG write structure");
        }
        info_ = png_create_info_struct(png_);
        if (!info_) {
            png_destroy_write_struct(&png_, nullptr);
            throw ImageWriteError("Failed to create PNG info structure");
        }
    }

    ~PngWriteHandle() {
        png_destroy_write_struct(&png_, &info_);
    }

    PngWriteHandle(const PngWriteHandle&) = delete;
    PngWriteHandle& operator=(const PngWriteHandle&) = delete;

    png_structp png() const { return png_; }
    png_infop info() const { return info_; }

private:
    png_structp png_ = nullptr;
    png_infop info_ = nullptr;
};

// libpng longjmps out of the calls below on error, so this frame holds
// nothing with a destructor
bool encode(png_structp png, png_infop info, FILE* fp, const RgbImage& image, png_bytepp rows) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info, image.width, image.height, 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows);
    png_write_end(png, nullptr);
    return true;
}

} // anonymous namespace

void write_png(const RgbImage& image, const std::string& filename) {
    if (!image.is_valid()) {
        throw ImageWriteError("Invalid image for PNG export: " + filename);
    }

    const size_t stride = static_cast<size_t>(image.width) * 3;
    std::vector<png_bytep> rows(image.height);
    for (uint32_t y = 0; y < image.height; ++y) {
        rows[y] = const_cast<png_bytep>(image.rgb_data.data() + y * stride);
    }

    FilePtr file(std::fopen(filename.c_str(), "wb"));
    if (!file) {
        throw ImageWriteError("Failed to open file for writing: " + filename);
    }

    PngErrorState errors;
    bool written = false;
    {
        PngWriteHandle handle(errors);
        written = encode(handle.png(), handle.info(), file.get(), image, rows.data());
    }

    const bool closed = std::fclose(file.release()) == 0;
    if (!written || !closed) {
        std::error_code ec;
        std::filesystem::remove(filename, ec);
        if (!written) {
            throw ImageWriteError(fmt::format("PNG write error for {}: {}", filename, errors.message));
        }
        throw ImageWriteError("Failed to close " + filename);
    }

    COMPSHOT_LOG_DEBUG("Saved PNG: {} ({}x{})", filename, image.width, image.height);
}

} // namespace compshot
