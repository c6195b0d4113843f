/*
 * File:        tag_allocator.h
 * Module:      compshot-core
 * Purpose:     Single-character screenshot tags that never overwrite a previous run
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace compshot {

/// A tag is a single lowercase letter, stored as its Unicode code point
using Tag = char32_t;

/// Number of letters tags are drawn from
size_t tag_alphabet_size();

/**
 * @brief The tag letter a file name character stands for
 *
 * Tags are the lowercase letters a-z followed by the lowercase Latin-1,
 * Greek and Cyrillic letters. Uppercase forms of those letters map to
 * their lowercase tag. Any other character yields no tag.
 */
std::optional<Tag> to_tag_letter(char32_t code);

/// Image suffixes considered when scanning for previous tags
bool is_screenshot_file(const std::filesystem::path& path);

/**
 * @brief Tag codes already used in an output directory
 *
 * Visits the directory's .jpg/.jpeg/.png entries in sorted name order and
 * takes the first tag letter of each file stem (UTF-8). Names without one
 * are skipped. The result is de-duplicated and sorted. A missing directory
 * yields an empty list.
 */
std::vector<Tag> scan_used_tags(const std::filesystem::path& directory);

/**
 * @brief Allocate @p count tags that collide with none of @p used
 *
 * Tags are positions in the tag alphabet. No previous tags: 'a', 'b', 'c',
 * ... Otherwise every used tag is shifted up by @p count positions; shifted
 * tags that land on a used one are discarded and the list is extended
 * upwards from its last value, skipping used positions, until exactly
 * @p count tags exist. Within a-z this is a shift of the character code.
 *
 * @throws ConfigurationError if the allocation runs past the last letter
 */
std::vector<Tag> allocate_tags(const std::vector<Tag>& used, size_t count);

/// Convenience: scan_used_tags() followed by allocate_tags()
std::vector<Tag> allocate_tags_for_directory(const std::filesystem::path& directory, size_t count);

/// UTF-8 encoding of a tag for use in file names
std::string tag_to_utf8(Tag tag);

} // namespace compshot
