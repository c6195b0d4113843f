/*
 * File:        parameter_value.cpp
 * Module:      compshot-core
 * Purpose:     Keyword parameter values
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "parameter_value.h"
#include <fmt/format.h>
#include <type_traits>

namespace compshot {
namespace parameter_util {

std::string value_to_string(const ParameterValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, double>) {
            // Shortest round-trip form, e.g. 120 -> "120", 0.1 -> "0.1"
            return fmt::format("{}", arg);
        } else {
            return std::to_string(arg);
        }
    }, value);
}

std::optional<double> as_number(const ParameterValue& value) {
    if (auto v = std::get_if<int32_t>(&value)) return static_cast<double>(*v);
    if (auto v = std::get_if<uint32_t>(&value)) return static_cast<double>(*v);
    if (auto v = std::get_if<double>(&value)) return *v;
    return std::nullopt;
}

std::string to_string(const ParameterSet& parameters) {
    std::string out;
    for (const auto& [key, value] : parameters) {
        if (!out.empty()) out += ", ";
        out += key;
        out += '=';
        out += value_to_string(value);
    }
    return out;
}

} // namespace parameter_util
} // namespace compshot
