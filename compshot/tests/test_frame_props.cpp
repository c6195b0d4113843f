/*
 * File:        test_frame_props.cpp
 * Module:      compshot-core/tests
 * Purpose:     Frame metadata decode rules and HDR classification
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025 Simon Inns
 */

#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "colorspace.h"
#include "frame_props.h"

using namespace compshot;

static void test_read_int_prop() {
    FrameProps props{
        {"int", int64_t{16}},
        {"float", 9.9},
        {"negative_float", -2.7},
        {"nan", std::numeric_limits<double>::quiet_NaN()},
        {"inf", std::numeric_limits<double>::infinity()},
        {"bytes", PropBytes{"  18\n"}},
        {"signed_bytes", PropBytes{"-3"}},
        {"junk", PropBytes{"16a"}},
        {"embedded_nul", PropBytes{std::string("1\0" "6", 3)}},
        {"blank", PropBytes{"   "}},
    };

    assert(read_int_prop(props, "int") == 16);
    assert(read_int_prop(props, "float") == 9);
    assert(read_int_prop(props, "negative_float") == -2);
    assert(!read_int_prop(props, "nan"));
    assert(!read_int_prop(props, "inf"));
    assert(read_int_prop(props, "bytes") == 18);
    assert(read_int_prop(props, "signed_bytes") == -3);
    assert(!read_int_prop(props, "junk"));
    assert(!read_int_prop(props, "embedded_nul"));
    assert(!read_int_prop(props, "blank"));
    assert(!read_int_prop(props, "missing"));

    std::cout << "test_read_int_prop: PASSED\n";
}

static void test_descriptor() {
    FrameProps props{
        {prop::MATRIX, int64_t{9}},
        {prop::TRANSFER, PropBytes{"16"}},
        {prop::PRIMARIES, 9.0},
    };

    const auto desc = ColorspaceDescriptor::from_props(props);
    assert(desc.matrix == 9);
    assert(desc.transfer == 16);
    assert(desc.primaries == 9);
    assert(!desc.range);
    assert(to_string(desc) == "matrix=9 transfer=16 primaries=9 range=absent");

    // Out of int range is treated as malformed
    FrameProps huge{{prop::MATRIX, int64_t{1} << 40}};
    assert(!ColorspaceDescriptor::from_props(huge).matrix);

    std::cout << "test_descriptor: PASSED\n";
}

static void test_is_hdr() {
    auto props = [](PropValue transfer, PropValue primaries) {
        return FrameProps{{prop::TRANSFER, transfer}, {prop::PRIMARIES, primaries}};
    };

    assert(is_hdr(props(int64_t{16}, int64_t{9})));
    assert(is_hdr(props(int64_t{18}, int64_t{9})));
    assert(is_hdr(props(PropBytes{"16"}, PropBytes{" 9 "})));
    assert(!is_hdr(props(int64_t{16}, int64_t{1})));
    assert(!is_hdr(props(int64_t{1}, int64_t{9})));
    assert(!is_hdr(props(int64_t{14}, int64_t{9})));
    assert(!is_hdr(props(PropBytes{"pq"}, int64_t{9})));

    // Missing fields are never HDR
    assert(!is_hdr(FrameProps{{prop::TRANSFER, int64_t{16}}}));
    assert(!is_hdr(FrameProps{{prop::PRIMARIES, int64_t{9}}}));
    assert(!is_hdr(FrameProps{}));

    std::cout << "test_is_hdr: PASSED\n";
}

static void test_source_hint() {
    ColorspaceDescriptor desc;
    desc.primaries = 9;
    desc.transfer = 16;
    assert(deduce_source_hint(desc) == SourceColorspaceHint::PQ);

    desc.transfer = 18;
    assert(deduce_source_hint(desc) == SourceColorspaceHint::HLG);
    assert(std::string(hint_name(SourceColorspaceHint::HLG)) == "HLG");

    desc.transfer = 1;
    assert(!deduce_source_hint(desc));

    desc.transfer = 16;
    desc.primaries = 1;
    assert(!deduce_source_hint(desc));

    desc.primaries.reset();
    assert(!deduce_source_hint(desc));

    std::cout << "test_source_hint: PASSED\n";
}

int main() {
    test_read_int_prop();
    test_descriptor();
    test_is_hdr();
    test_source_hint();

    std::cout << "\nAll frame property tests passed!\n";
    return 0;
}
