/*
 * File:        parameter_value.h
 * Module:      compshot-core
 * Purpose:     Keyword argument values passed to backend functions
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include <string>
#include <variant>
#include <map>
#include <optional>
#include <cstdint>

namespace compshot {

/// Keyword argument value types accepted by backend functions
using ParameterValue = std::variant<
    int32_t,      // Colour codes, modes, periods
    uint32_t,     // Unsigned sizes
    double,       // Luminance, thresholds
    bool,         // Flags
    std::string   // Function and kernel names
>;

/// Named keyword arguments for one backend call (ordered by name)
using ParameterSet = std::map<std::string, ParameterValue>;

namespace parameter_util {
    /// Text form of a value ("true", "120", "0.1", "bt2390")
    std::string value_to_string(const ParameterValue& value);

    /// Numeric view of a value (bool and string yield nullopt)
    std::optional<double> as_number(const ParameterValue& value);

    /// Render a whole set as "key=value, key=value" for diagnostics
    std::string to_string(const ParameterSet& parameters);
}

} // namespace compshot
