/*
 * File:        frame_props.cpp
 * Module:      compshot-core
 * Purpose:     Per-frame metadata decode rules
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "frame_props.h"
#include <fmt/format.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace compshot {

namespace {

std::optional<int64_t> parse_integer_text(const std::string& raw) {
    size_t begin = 0;
    size_t end = raw.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;
    if (begin == end) {
        return std::nullopt;
    }

    const std::string text = raw.substr(begin, end - begin);
    // Embedded NULs or other binary junk cannot form a valid integer
    for (char c : text) {
        if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+')) {
            return std::nullopt;
        }
    }

    errno = 0;
    char* parse_end = nullptr;
    long long value = std::strtoll(text.c_str(), &parse_end, 10);
    if (errno == ERANGE || parse_end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::optional<int> narrow(std::optional<int64_t> value) {
    if (!value) return std::nullopt;
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

} // anonymous namespace

std::optional<int64_t> read_int_prop(const FrameProps& props, const std::string& key) {
    auto it = props.find(key);
    if (it == props.end()) {
        return std::nullopt;
    }

    const PropValue& value = it->second;
    if (auto v = std::get_if<int64_t>(&value)) {
        return *v;
    }
    if (auto v = std::get_if<double>(&value)) {
        if (!std::isfinite(*v) ||
            *v >= static_cast<double>(std::numeric_limits<int64_t>::max()) ||
            *v <= static_cast<double>(std::numeric_limits<int64_t>::min())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(std::trunc(*v));
    }
    if (auto v = std::get_if<PropBytes>(&value)) {
        return parse_integer_text(v->data);
    }
    return std::nullopt;
}

ColorspaceDescriptor ColorspaceDescriptor::from_props(const FrameProps& props) {
    ColorspaceDescriptor desc;
    desc.matrix = narrow(read_int_prop(props, prop::MATRIX));
    desc.transfer = narrow(read_int_prop(props, prop::TRANSFER));
    desc.primaries = narrow(read_int_prop(props, prop::PRIMARIES));
    desc.range = narrow(read_int_prop(props, prop::COLOR_RANGE));
    return desc;
}

std::string to_string(const ColorspaceDescriptor& desc) {
    auto field = [](const std::optional<int>& v) {
        return v ? std::to_string(*v) : std::string("absent");
    };
    return fmt::format("matrix={} transfer={} primaries={} range={}",
                       field(desc.matrix), field(desc.transfer),
                       field(desc.primaries), field(desc.range));
}

} // namespace compshot
