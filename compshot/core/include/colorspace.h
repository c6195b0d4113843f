/*
 * File:        colorspace.h
 * Module:      compshot-core
 * Purpose:     HDR classification from frame metadata
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#pragma once

#include "clip.h"
#include "frame_props.h"
#include <optional>

namespace compshot {

/**
 * @brief Source colourspace hint handed to the tonemap backend (src_csp)
 */
enum class SourceColorspaceHint {
    PQ = 1,
    HLG = 2
};

const char* hint_name(SourceColorspaceHint hint);

/// HDR iff transfer is PQ or HLG and primaries are BT.2020. Missing fields are never HDR.
bool is_hdr(const ColorspaceDescriptor& desc);

/// Classify from a metadata record
bool is_hdr(const FrameProps& props);

/// Classify from the first frame of a clip
bool is_hdr(const Clip& clip);

/// BT.2020 + PQ -> PQ, BT.2020 + HLG -> HLG, otherwise no hint
std::optional<SourceColorspaceHint> deduce_source_hint(const ColorspaceDescriptor& desc);

} // namespace compshot
