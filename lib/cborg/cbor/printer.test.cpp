/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <sstream>
#include <cborg/common/test.hpp>
#include <cborg/cbor/printer.hpp>

using namespace cborg;
using namespace cborg::cbor;

suite cbor_printer_suite = [] {
    "cbor::printer"_test = [] {
        "scalars"_test = [] {
            test_same(to_string(value { 42 }), std::string { "42" });
            test_same(to_string(value { -7 }), std::string { "-7" });
            test_same(to_string(value { 2.5 }), std::string { "2.5" });
            test_same(to_string(value { 33.3 }), std::string { "33.3" });
            test_same(to_string(value { "hi" }), std::string { "\"hi\"" });
            test_same(to_string(value { true }), std::string { "true" });
            test_same(to_string(value { false }), std::string { "false" });
            test_same(to_string(value {}), std::string { "null" });
            test_same(to_string(value { simple::s_undefined() }), std::string { "undefined" });
            test_same(to_string(value { simple::unassigned(99) }), std::string { "99" });
        };
        "bytes"_test = [] {
            test_same(to_string(value { uint8_vector {} }), std::string { "[]" });
            test_same(to_string(value { uint8_vector::from_hex("07") }), std::string { "[ 7 ]" });
            test_same(to_string(value { uint8_vector::from_hex("0102FF") }), std::string { "[1, 2, 255]" });
        };
        "empty aggregates"_test = [] {
            test_same(to_string(value { array {} }), std::string { "[\n]" });
            test_same(to_string(value { map {} }), std::string { "{\n}" });
        };
        "nesting"_test = [] {
            const value v { map { { "a", array { 1, value { array { 2 } } } }, { array { 3 }, "x" } } };
            test_same(to_string(v), std::string {
                "{\n"
                "   \"a\": [\n"
                "      1,\n"
                "      [\n"
                "         2,\n"
                "      ],\n"
                "   ],\n"
                "   [\n"
                "      3,\n"
                "   ]: \"x\",\n"
                "}"
            });
        };
        "stream and fmt"_test = [] {
            const value v { array { 1, "b" } };
            std::ostringstream ss {};
            ss << v;
            test_same(ss.str(), to_string(v));
            test_same(fmt::format("{}", v), to_string(v));
        };
    };
};
