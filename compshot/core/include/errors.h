/*
 * File:        errors.h
 * Module:      compshot-core
 * Purpose:     Exception types raised by clip preparation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include <stdexcept>
#include <string>

namespace compshot {

/**
 * @brief Inconsistent or invalid inputs (fatal, never retried)
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Resize kernel name is not one of the supported kernels
 */
class UnknownKernelError : public ConfigurationError {
public:
    explicit UnknownKernelError(const std::string& msg) : ConfigurationError(msg) {}
};

/**
 * @brief Source filter name is not one of the supported loaders
 */
class UnknownLoaderError : public ConfigurationError {
public:
    explicit UnknownLoaderError(const std::string& msg) : ConfigurationError(msg) {}
};

/**
 * @brief Geometry heuristics could not produce a usable result
 */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Dimension pair is not related by a recognised integer scale factor
 */
class AmbiguousRatioError : public GeometryError {
public:
    explicit AmbiguousRatioError(const std::string& msg) : GeometryError(msg) {}
};

/**
 * @brief Crop margins would leave no picture
 */
class DegenerateCropError : public GeometryError {
public:
    explicit DegenerateCropError(const std::string& msg) : GeometryError(msg) {}
};

/**
 * @brief A required backend capability is not installed
 */
class BackendUnavailableError : public std::runtime_error {
public:
    explicit BackendUnavailableError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A single tonemap invocation was rejected by the backend
 *
 * The message may name unsupported keyword parameters, e.g.
 * "Tonemap: Function does not take argument(s) named gamut_mode, tone_mapping_mode"
 */
class TonemapAttemptError : public std::runtime_error {
public:
    explicit TonemapAttemptError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A rendered frame could not be written to disk
 */
class ImageWriteError : public std::runtime_error {
public:
    explicit ImageWriteError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace compshot
