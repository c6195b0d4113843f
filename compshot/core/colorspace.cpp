/*
 * File:        colorspace.cpp
 * Module:      compshot-core
 * Purpose:     HDR classification from frame metadata
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#include "colorspace.h"

namespace compshot {

const char* hint_name(SourceColorspaceHint hint) {
    switch (hint) {
        case SourceColorspaceHint::PQ: return "PQ";
        case SourceColorspaceHint::HLG: return "HLG";
    }
    return "unknown";
}

bool is_hdr(const ColorspaceDescriptor& desc) {
    if (!desc.transfer || !desc.primaries) {
        return false;
    }
    const bool hdr_transfer = *desc.transfer == code::TRANSFER_PQ || *desc.transfer == code::TRANSFER_HLG;
    return hdr_transfer && *desc.primaries == code::PRIMARIES_BT2020;
}

bool is_hdr(const FrameProps& props) {
    return is_hdr(ColorspaceDescriptor::from_props(props));
}

bool is_hdr(const Clip& clip) {
    return is_hdr(clip.frame_props());
}

std::optional<SourceColorspaceHint> deduce_source_hint(const ColorspaceDescriptor& desc) {
    if (desc.primaries != code::PRIMARIES_BT2020) {
        return std::nullopt;
    }
    if (desc.transfer == code::TRANSFER_PQ) {
        return SourceColorspaceHint::PQ;
    }
    if (desc.transfer == code::TRANSFER_HLG) {
        return SourceColorspaceHint::HLG;
    }
    return std::nullopt;
}

} // namespace compshot
