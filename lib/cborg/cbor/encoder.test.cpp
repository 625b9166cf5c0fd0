/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <limits>
#include <cborg/common/test.hpp>
#include <cborg/cbor/decoder.hpp>
#include <cborg/cbor/encoder.hpp>
#include <cborg/cbor/printer.hpp>

using namespace cborg;
using namespace cborg::cbor;

suite cbor_encoder_suite = [] {
    "cbor::encoder"_test = [] {
        "uint minimal length"_test = [] {
            test_same(encode_value(value { 0 }), uint8_vector::from_hex("00"));
            test_same(encode_value(value { 23 }), uint8_vector::from_hex("17"));
            test_same(encode_value(value { 24 }), uint8_vector::from_hex("1818"));
            test_same(encode_value(value { 255 }), uint8_vector::from_hex("18FF"));
            test_same(encode_value(value { 256 }), uint8_vector::from_hex("190100"));
            test_same(encode_value(value { 65535 }), uint8_vector::from_hex("19FFFF"));
            test_same(encode_value(value { 65536 }), uint8_vector::from_hex("1A00010000"));
            test_same(encode_value(value { 0xFFFFFFFFULL }), uint8_vector::from_hex("1AFFFFFFFF"));
            test_same(encode_value(value { 0x100000000ULL }), uint8_vector::from_hex("1B0000000100000000"));
            test_same(encode_value(value { std::numeric_limits<uint64_t>::max() }), uint8_vector::from_hex("1BFFFFFFFFFFFFFFFF"));
        };
        "nint"_test = [] {
            test_same(encode_value(value { -1 }), uint8_vector::from_hex("20"));
            test_same(encode_value(value { -24 }), uint8_vector::from_hex("37"));
            test_same(encode_value(value { -25 }), uint8_vector::from_hex("3818"));
            test_same(encode_value(value { -256 }), uint8_vector::from_hex("38FF"));
            test_same(encode_value(value { -257 }), uint8_vector::from_hex("390100"));
            test_same(encode_value(value { std::numeric_limits<int64_t>::min() }), uint8_vector::from_hex("3B7FFFFFFFFFFFFFFF"));
            encoder enc {};
            expect(throws<error>([&] { enc.nint(0); }));
        };
        "negative round trip"_test = [] {
            for (const int64_t n: std::initializer_list<int64_t> { -1, -24, -25, std::numeric_limits<int64_t>::min() + 1, std::numeric_limits<int64_t>::min() }) {
                const value v { n };
                test_same(decode(encode_value(v)).nint(), n);
            }
        };
        "string headers"_test = [] {
            test_same(encode_value(value { uint8_vector {} }), uint8_vector::from_hex("40"));
            test_same(encode_value(value { "a" }), uint8_vector::from_hex("6161"));
            test_same(encode_value(value { std::string(23, 'x') }).at(0), 0x77);
            {
                const auto enc = encode_value(value { std::string(24, 'x') });
                test_same(enc.size(), 26);
                test_same(buffer { enc }.subbuf(0, 2), buffer { uint8_vector::from_hex("7818") });
            }
            {
                const auto enc = encode_value(value { uint8_vector(255) });
                test_same(buffer { enc }.subbuf(0, 2), buffer { uint8_vector::from_hex("58FF") });
            }
            {
                const auto enc = encode_value(value { uint8_vector(256) });
                test_same(buffer { enc }.subbuf(0, 3), buffer { uint8_vector::from_hex("590100") });
            }
            {
                const auto enc = encode_value(value { uint8_vector(0x10000) });
                test_same(enc.size(), 0x10005);
                test_same(buffer { enc }.subbuf(0, 5), buffer { uint8_vector::from_hex("5A00010000") });
            }
        };
        "collection headers"_test = [] {
            test_same(encode_value(value { array {} }), uint8_vector::from_hex("80"));
            test_same(encode_value(value { map {} }), uint8_vector::from_hex("A0"));
            array big {};
            for (size_t i = 0; i < 24; ++i)
                big.emplace_back(i);
            const auto enc = encode_value(value { std::move(big) });
            test_same(buffer { enc }.subbuf(0, 2), buffer { uint8_vector::from_hex("9818") });
            encoder e {};
            e.array(0x100000000ULL);
            test_same(e.cbor(), uint8_vector::from_hex("9B0000000100000000"));
            encoder m {};
            m.map(0x10000);
            test_same(m.cbor(), uint8_vector::from_hex("BA00010000"));
        };
        "floats are always eight bytes"_test = [] {
            test_same(encode_value(value { 1.5 }), uint8_vector::from_hex("FB3FF8000000000000"));
            test_same(encode_value(value { 0.0 }), uint8_vector::from_hex("FB0000000000000000"));
            test_same(encode_value(value { -4.1 }), uint8_vector::from_hex("FBC010666666666666"));
        };
        "simple"_test = [] {
            test_same(encode_value(value { false }), uint8_vector::from_hex("F4"));
            test_same(encode_value(value { true }), uint8_vector::from_hex("F5"));
            test_same(encode_value(value {}), uint8_vector::from_hex("F6"));
            test_same(encode_value(value { simple::s_undefined() }), uint8_vector::from_hex("F7"));
            test_same(encode_value(value { simple::unassigned(16) }), uint8_vector::from_hex("F0"));
            test_same(encode_value(value { simple::unassigned(32) }), uint8_vector::from_hex("F820"));
            test_same(encode_value(value { simple::unassigned(255) }), uint8_vector::from_hex("F8FF"));
        };
        "map entries keep their order"_test = [] {
            const value v { map { { "b", 1 }, { "a", 2 }, { "b", 3 } } };
            test_same(encode_value(v), uint8_vector::from_hex("A3616201616102616203"));
        };
        "builder"_test = [] {
            encoder enc {};
            enc.array(3).uint(1).text("x").map(1).bytes(uint8_vector::from_hex("01")).s_null();
            test_same(enc.cbor(), uint8_vector::from_hex("83016178A14101F6"));
            enc << value { -2 };
            test_same(enc.cbor(), uint8_vector::from_hex("83016178A14101F621"));
        };
        "round trip"_test = [] {
            const value v { map {
                { 1, array { -1, 2.5, "text", uint8_vector::from_hex("DEADBEEF"), true, value {} } },
                { array { 1, 2 }, map { { "nested", map {} } } },
                { "big", std::numeric_limits<uint64_t>::max() },
                { -100000, simple::unassigned(200) }
            } };
            test_same(decode(encode_value(v)), v);
        };
        "indefinite input becomes definite"_test = [] {
            const auto v = decode(uint8_vector::from_hex("BF61619F0102FF7F6178FF5F4101FFFF"));
            test_same(encode_value(v), uint8_vector::from_hex("A2616182010261784101"));
        };
    };
};
