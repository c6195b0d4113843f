/*
 * File:        tonemap_sequencer.h
 * Module:      compshot-core
 * Purpose:     Ordered tonemap attempts with parameter relaxation and SDR fallback
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "colorspace.h"
#include "logging.h"
#include "parameter_value.h"
#include "tonemap_settings.h"
#include "video_backend.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace compshot {

/**
 * @brief Position of an attempt in the plan
 *
 * The sequencer moves Hinted -> Baseline -> ForcedSource -> Exhausted on
 * each failure and leaves on the first success.
 */
enum class AttemptKind {
    Hinted,         ///< Baseline plus the deduced src_csp hint
    Baseline,       ///< Settings only
    ForcedSource    ///< Baseline with src_csp forced to PQ
};

const char* attempt_kind_name(AttemptKind kind);

struct TonemapAttempt {
    AttemptKind kind;
    ParameterSet parameters;
};

/**
 * @brief Ordered parameter sets to try for one clip
 *
 * At most three entries: Hinted (only if a hint was deduced), Baseline,
 * ForcedSource.
 */
class AttemptPlan {
public:
    static AttemptPlan build(const TonemapSettings& settings, std::optional<SourceColorspaceHint> hint);

    const std::vector<TonemapAttempt>& attempts() const { return attempts_; }
    size_t size() const { return attempts_.size(); }

private:
    std::vector<TonemapAttempt> attempts_;
};

/**
 * @brief Parameter names listed in a backend rejection message
 *
 * Looks for "does not take argument(s) named" or "does not take argument
 * named" and splits what follows on commas, ignoring quotes, brackets and
 * line breaks. Returns an empty set if neither phrase occurs.
 */
std::set<std::string> extract_unsupported_parameters(const std::string& message);

/**
 * @brief Runs the tonemap plan for one clip at a time
 *
 * Parameters the backend reports as unsupported are dropped and the same
 * attempt is retried; they are remembered in the unsupported-key set so
 * later clips never send them. The set is owned by the caller when one is
 * supplied, otherwise by this instance.
 */
class TonemapAttemptSequencer {
public:
    TonemapAttemptSequencer(const VideoBackend& backend,
                            const TonemapSettings& settings,
                            Diagnostics& diag,
                            std::set<std::string>* unsupported_parameters = nullptr);

    TonemapAttemptSequencer(const TonemapAttemptSequencer&) = delete;
    TonemapAttemptSequencer& operator=(const TonemapAttemptSequencer&) = delete;

    /**
     * @brief Execute the plan against a normalized RGB48 clip
     *
     * On success the result carries the _Tonemapped marker.
     *
     * @throws BackendUnavailableError if the backend has no tonemap
     * @throws TonemapAttemptError the last failure once all attempts failed
     */
    Clip tonemap(const Clip& normalized, std::optional<SourceColorspaceHint> hint);

    /**
     * @brief Full HDR path for one clip
     *
     * RGB48 conversion, metadata normalization, the attempt plan and the
     * final RGB24 conversion. Any failure after the capability check drops
     * the HDR path and converts the original clip straight to RGB24.
     *
     * @throws BackendUnavailableError if the backend has no tonemap
     */
    Clip process(const Clip& clip);

    const std::set<std::string>& unsupported_parameters() const { return *unsupported_; }

private:
    Clip run_attempt(const Clip& clip, size_t index, const TonemapAttempt& attempt);
    Clip apply_marker(const Clip& clip);
    void require_backend() const;

    const VideoBackend& backend_;
    const TonemapSettings& settings_;
    Diagnostics& diag_;
    std::set<std::string> own_unsupported_;
    std::set<std::string>* unsupported_;
};

} // namespace compshot
