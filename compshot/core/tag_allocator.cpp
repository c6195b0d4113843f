/*
 * File:        tag_allocator.cpp
 * Module:      compshot-core
 * Purpose:     Single-character screenshot tags that never overwrite a previous run
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "tag_allocator.h"
#include "errors.h"
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <set>

namespace compshot {

namespace {

struct LetterRange {
    Tag first;
    Tag last;
};

// Lowercase letters only, so tags stay distinct on case-insensitive file systems
constexpr LetterRange TAG_LETTERS[] = {
    {U'a', U'z'},
    {0x00DF, 0x00F6},   // Latin-1: sharp s to o diaeresis
    {0x00F8, 0x00FF},   // Latin-1: o stroke to y diaeresis
    {0x03B1, 0x03C1},   // Greek: alpha to rho
    {0x03C3, 0x03C9},   // Greek: sigma to omega
    {0x0430, 0x044F},   // Cyrillic: a to ya
};

// Uppercase blocks that sit 0x20 below their lowercase letters
constexpr LetterRange UPPERCASE_LETTERS[] = {
    {U'A', U'Z'},
    {0x00C0, 0x00D6},
    {0x00D8, 0x00DE},
    {0x0391, 0x03A1},
    {0x03A3, 0x03A9},
    {0x0410, 0x042F},
};

constexpr Tag CASE_OFFSET = 0x20;

std::optional<size_t> letter_index(Tag code) {
    size_t base = 0;
    for (const auto& range : TAG_LETTERS) {
        if (code >= range.first && code <= range.last) {
            return base + static_cast<size_t>(code - range.first);
        }
        base += static_cast<size_t>(range.last - range.first) + 1;
    }
    return std::nullopt;
}

Tag letter_at(size_t index) {
    for (const auto& range : TAG_LETTERS) {
        const size_t size = static_cast<size_t>(range.last - range.first) + 1;
        if (index < size) {
            return range.first + static_cast<Tag>(index);
        }
        index -= size;
    }
    throw ConfigurationError(fmt::format(
        "Ran out of screenshot tags ({} letters available); use a new output directory",
        tag_alphabet_size()));
}

std::optional<char32_t> next_code_point(const std::string& text, size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    char32_t code = 0;
    size_t extra = 0;
    if (lead < 0x80) {
        code = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        code = lead & 0x1F;
        extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        code = lead & 0x0F;
        extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        code = lead & 0x07;
        extra = 3;
    } else {
        return std::nullopt;
    }
    if (pos + extra >= text.size()) {
        return std::nullopt;
    }
    for (size_t i = 1; i <= extra; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            return std::nullopt;
        }
        code = (code << 6) | (byte & 0x3F);
    }
    pos += extra + 1;
    return code;
}

} // anonymous namespace

size_t tag_alphabet_size() {
    size_t size = 0;
    for (const auto& range : TAG_LETTERS) {
        size += static_cast<size_t>(range.last - range.first) + 1;
    }
    return size;
}

std::optional<Tag> to_tag_letter(char32_t code) {
    for (const auto& range : UPPERCASE_LETTERS) {
        if (code >= range.first && code <= range.last) {
            code += CASE_OFFSET;
            break;
        }
    }
    if (!letter_index(code)) {
        return std::nullopt;
    }
    return code;
}

bool is_screenshot_file(const std::filesystem::path& path) {
    const std::string ext = path.extension().string();
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

std::vector<Tag> scan_used_tags(const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return {};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (is_screenshot_file(entry.path())) {
            files.push_back(entry.path().filename());
        }
    }
    std::sort(files.begin(), files.end());

    std::set<Tag> used;
    for (const auto& file : files) {
        const std::string stem = file.stem().string();
        size_t pos = 0;
        while (pos < stem.size()) {
            const auto code = next_code_point(stem, pos);
            if (!code) {
                break;
            }
            if (const auto tag = to_tag_letter(*code)) {
                used.insert(*tag);
                break;
            }
        }
    }

    return std::vector<Tag>(used.begin(), used.end());
}

std::vector<Tag> allocate_tags(const std::vector<Tag>& used, size_t count) {
    std::vector<Tag> tags;
    if (count == 0) {
        return tags;
    }

    std::set<size_t> used_indices;
    for (Tag code : used) {
        if (const auto tag = to_tag_letter(code)) {
            used_indices.insert(*letter_index(*tag));
        }
    }

    if (used_indices.empty()) {
        for (size_t i = 0; i < count; ++i) {
            tags.push_back(letter_at(i));
        }
        return tags;
    }

    std::set<size_t> taken = used_indices;
    size_t last = *used_indices.rbegin();
    for (size_t index : used_indices) {
        if (tags.size() == count) break;
        const size_t shifted = index + count;
        if (taken.count(shifted)) {
            continue;
        }
        tags.push_back(letter_at(shifted));
        taken.insert(shifted);
        last = shifted;
    }

    while (tags.size() < count) {
        ++last;
        if (taken.count(last)) {
            continue;
        }
        tags.push_back(letter_at(last));
        taken.insert(last);
    }

    return tags;
}

std::vector<Tag> allocate_tags_for_directory(const std::filesystem::path& directory, size_t count) {
    return allocate_tags(scan_used_tags(directory), count);
}

std::string tag_to_utf8(Tag tag) {
    std::string out;
    const uint32_t cp = static_cast<uint32_t>(tag);
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

} // namespace compshot
