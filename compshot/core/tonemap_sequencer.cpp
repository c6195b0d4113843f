/*
 * File:        tonemap_sequencer.cpp
 * Module:      compshot-core
 * Purpose:     Ordered tonemap attempts with parameter relaxation and SDR fallback
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "tonemap_sequencer.h"
#include "color_conversion.h"
#include "errors.h"
#include <fmt/format.h>
#include <algorithm>

namespace compshot {

const char* attempt_kind_name(AttemptKind kind) {
    switch (kind) {
        case AttemptKind::Hinted: return "hinted";
        case AttemptKind::Baseline: return "baseline";
        case AttemptKind::ForcedSource: return "forced-PQ";
    }
    return "unknown";
}

AttemptPlan AttemptPlan::build(const TonemapSettings& settings, std::optional<SourceColorspaceHint> hint) {
    const ParameterSet base = base_tonemap_parameters(settings);

    AttemptPlan plan;
    if (hint) {
        ParameterSet hinted = base;
        hinted[tonemap_key::SRC_CSP] = static_cast<int32_t>(*hint);
        plan.attempts_.push_back({AttemptKind::Hinted, std::move(hinted)});
    }

    plan.attempts_.push_back({AttemptKind::Baseline, base});

    ParameterSet forced = base;
    forced[tonemap_key::SRC_CSP] = static_cast<int32_t>(SourceColorspaceHint::PQ);
    plan.attempts_.push_back({AttemptKind::ForcedSource, std::move(forced)});

    return plan;
}

std::set<std::string> extract_unsupported_parameters(const std::string& message) {
    static const char* const MARKERS[] = {
        "does not take argument(s) named",
        "does not take argument named",
    };

    for (const char* marker : MARKERS) {
        const size_t pos = message.find(marker);
        if (pos == std::string::npos) {
            continue;
        }

        std::string suffix = message.substr(pos + std::char_traits<char>::length(marker));
        suffix.erase(std::remove_if(suffix.begin(), suffix.end(), [](char c) {
            return c == '\'' || c == '"' || c == '(' || c == ')';
        }), suffix.end());
        std::replace(suffix.begin(), suffix.end(), '\n', ' ');

        std::set<std::string> names;
        size_t start = 0;
        while (start <= suffix.size()) {
            size_t comma = suffix.find(',', start);
            if (comma == std::string::npos) comma = suffix.size();
            std::string part = suffix.substr(start, comma - start);
            const size_t first = part.find_first_not_of(" \t\r");
            const size_t last = part.find_last_not_of(" \t\r");
            if (first != std::string::npos) {
                names.insert(part.substr(first, last - first + 1));
            }
            start = comma + 1;
        }
        return names;
    }

    return {};
}

TonemapAttemptSequencer::TonemapAttemptSequencer(const VideoBackend& backend,
                                                 const TonemapSettings& settings,
                                                 Diagnostics& diag,
                                                 std::set<std::string>* unsupported_parameters)
    : backend_(backend)
    , settings_(settings)
    , diag_(diag)
    , unsupported_(unsupported_parameters ? unsupported_parameters : &own_unsupported_)
{
}

void TonemapAttemptSequencer::require_backend() const {
    if (!backend_.has_tonemap()) {
        throw BackendUnavailableError(fmt::format(
            "HDR content detected but backend '{}' has no tonemap implementation. "
            "Install a backend build with libplacebo support to enable tonemapping.",
            backend_.name()));
    }
}

Clip TonemapAttemptSequencer::run_attempt(const Clip& clip, size_t index, const TonemapAttempt& attempt) {
    ParameterSet params = attempt.parameters;
    for (const auto& key : *unsupported_) {
        params.erase(key);
    }

    diag_.debug("Tonemap attempt {} ({}): {}", index, attempt_kind_name(attempt.kind),
                parameter_util::to_string(params));

    // Each retry removes at least one key, so this terminates
    while (true) {
        try {
            return backend_.tonemap(clip, params);
        } catch (const TonemapAttemptError& e) {
            std::set<std::string> rejected;
            for (const auto& name : extract_unsupported_parameters(e.what())) {
                if (params.count(name)) {
                    rejected.insert(name);
                }
            }
            if (rejected.empty()) {
                throw;
            }

            std::string names;
            for (const auto& name : rejected) {
                params.erase(name);
                unsupported_->insert(name);
                if (!names.empty()) names += ", ";
                names += name;
            }
            diag_.warn_once("tonemap-unsupported:" + names,
                            "Ignoring unsupported tonemap arguments: {}", names);
        }
    }
}

Clip TonemapAttemptSequencer::apply_marker(const Clip& clip) {
    FrameProps marker;
    marker[prop::TONEMAPPED] = PropBytes{tonemap_marker(settings_)};
    Clip stamped = backend_.set_frame_props(clip, marker);

    diag_.info("[libplacebo] HDR->SDR tonemap applied using function '{}' (dpd={}, dst_max={}).",
               settings_.function, settings_.dynamic_peak_detection ? "true" : "false",
               settings_.dst_max);
    return stamped;
}

Clip TonemapAttemptSequencer::tonemap(const Clip& normalized, std::optional<SourceColorspaceHint> hint) {
    require_backend();

    const AttemptPlan plan = AttemptPlan::build(settings_, hint);
    if (hint) {
        diag_.debug("Deduced source colourspace hint: {}", hint_name(*hint));
    }

    std::optional<TonemapAttemptError> last_error;
    size_t index = 1;
    for (const auto& attempt : plan.attempts()) {
        try {
            Clip tonemapped = run_attempt(normalized, index, attempt);
            return apply_marker(tonemapped);
        } catch (const TonemapAttemptError& e) {
            diag_.warn("[Tonemap attempt {} failed] {}", index, e.what());
            last_error = e;
        }
        ++index;
    }

    // Exhausted
    if (last_error) {
        throw *last_error;
    }
    throw TonemapAttemptError("Unknown error during tonemap attempts");
}

Clip TonemapAttemptSequencer::process(const Clip& clip) {
    require_backend();

    const ColorspaceDescriptor desc = ColorspaceDescriptor::from_props(clip.frame_props());
    diag_.debug("HDR source colourspace: {}", to_string(desc));

    Clip tonemapped;
    try {
        Clip rgb16 = convert_to_rgb48(backend_, clip, desc);
        Clip normalized = normalize_props_for_tonemap(backend_, rgb16, desc);
        tonemapped = tonemap(normalized, deduce_source_hint(desc));
    } catch (const std::exception& e) {
        diag_.error("Color processing failed ({}). Falling back to SDR conversion.", e.what());
        return convert_to_rgb24(backend_, clip, desc);
    }

    return finalize_rgb24(backend_, tonemapped);
}

} // namespace compshot
