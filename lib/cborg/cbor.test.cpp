/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <map>
#include <unordered_map>
#include <cborg/common/test.hpp>
#include <cborg/cbor.hpp>

using namespace cborg;
using namespace cborg::cbor;

namespace {
    const std::string long_string {
        "This line is greater than 256 characters to test if lengths are encoded correctly after the major. "
        "This line is greater than 256 characters to test if lengths are encoded correctly after the major. "
        "This line is greater than 256 characters to test if lengths are encoded correctly after the major."
    };
    const std::string utf8_val { "\xE4\xBD\xA0\xE5\xA5\xBD\xEF\xBC\x8C\xE4\xB8\x96\xE7\x95\x8C - hello, world" };

    const auto definite_data = uint8_vector::from_hex(
        "A219022BA665666C6F6174FB40040000000000006A62797465737472696E674501020304056A75746638737472696E67"
        "781EE4BDA0E5A5BDEFBC8CE4B896E7958C202D2068656C6C6F2C20776F726C646B6C6F6E6720737472696E6779012854"
        "686973206C696E652069732067726561746572207468616E20323536206368617261637465727320746F207465737420"
        "6966206C656E677468732061726520656E636F64656420636F72726563746C7920616674657220746865206D616A6F72"
        "2E2054686973206C696E652069732067726561746572207468616E20323536206368617261637465727320746F207465"
        "7374206966206C656E677468732061726520656E636F64656420636F72726563746C7920616674657220746865206D61"
        "6A6F722E2054686973206C696E652069732067726561746572207468616E20323536206368617261637465727320746F"
        "2074657374206966206C656E677468732061726520656E636F64656420636F72726563746C7920616674657220746865"
        "206D616A6F722E68756E7369676E656408686E6567617469766523190309840B35FB4040A666666666666B666F757274"
        "792D666F7572");

    const auto indefinite_data = uint8_vector::from_hex(
        "BF19022BBF65666C6F6174FB40040000000000006A62797465737472696E674501020304056A75746638737472696E67"
        "7F6FE4BDA0E5A5BDEFBC8CE4B896E7958C63202D206C68656C6C6F2C20776F726C64FF68756E7369676E656408686E65"
        "67617469766523FF1903099F0B35FB4040A666666666666B666F757274792D666F7572FFFF");

    value make_tree(const bool with_long_string)
    {
        map inner {
            { "float", 2.5 },
            { "bytestring", uint8_vector::from_hex("0102030405") },
            { "utf8string", utf8_val }
        };
        if (with_long_string)
            inner.emplace_back("long string", long_string);
        inner.emplace_back("unsigned", 8);
        inner.emplace_back("negative", -4);
        return value { map {
            { 555, std::move(inner) },
            { 777, array { 11, -22, 33.3, "fourty-four" } }
        } };
    }

    value make_definite_tree()
    {
        return make_tree(true);
    }

    struct point {
        int x;
        int y;
    };

    // an application type that exposes itself through the dynamic interface
    struct point_encodable: encodable {
        explicit point_encodable(const point &p): _p { p } {}

        value as_value() const override
        {
            return make_value(std::map<std::string, int> { { "x", _p.x }, { "y", _p.y } });
        }
    private:
        point _p;
    };
}

suite cbor_suite = [] {
    "cbor"_test = [] {
        "fixtures have the expected sizes"_test = [] {
            test_same(definite_data.size(), 438);
            test_same(indefinite_data.size(), 133);
        };
        "decode both fixtures"_test = [] {
            for (const auto *data: { &definite_data, &indefinite_data }) {
                const auto v = decode(*data);
                const auto top = v.hash_map();
                test_same(top.size(), 2);
                const auto inner = top.at(value { 555 }).hash_map();
                test_close(2.5, inner.at(value { "float" }).float64(), 0.01);
                test_same(inner.at(value { "bytestring" }).bytes(), uint8_vector::from_hex("0102030405"));
                test_same(inner.at(value { "utf8string" }).text(), utf8_val);
                test_same(inner.at(value { "unsigned" }).uint(), 8);
                test_same(inner.at(value { "negative" }).nint(), -4);
                if (data == &definite_data)
                    test_same(inner.at(value { "long string" }).text(), long_string);
                const auto &arr = top.at(value { 777 }).array();
                test_same(arr.size(), 4);
                test_same(arr.at(0), value { 11 });
                test_same(arr.at(1), value { -22 });
                test_same(arr.at(2), value { 33.3 });
                test_close(33.3, arr.at(2).float64());
                test_same(arr.at(3), value { "fourty-four" });
            }
        };
        "encode reproduces the definite fixture"_test = [] {
            test_same(encode(make_definite_tree()), definite_data);
            test_same(decode(definite_data), make_definite_tree());
        };
        "indefinite and definite are equivalent"_test = [] {
            // the indefinite fixture has no long string
            const auto tree = make_tree(false);
            test_same(decode(indefinite_data), tree);
            test_same(encode(decode(indefinite_data)), encode(tree));
        };
        "display"_test = [] {
            const auto v = decode(indefinite_data);
            test_same(to_string(v), std::string {
                "{\n"
                "   555: {\n"
                "      \"float\": 2.5,\n"
                "      \"bytestring\": [1, 2, 3, 4, 5],\n"
                "      \"utf8string\": \"" + utf8_val + "\",\n"
                "      \"unsigned\": 8,\n"
                "      \"negative\": -4,\n"
                "   },\n"
                "   777: [\n"
                "      11,\n"
                "      -22,\n"
                "      33.3,\n"
                "      \"fourty-four\",\n"
                "   ],\n"
                "}"
            });
        };
        "decode_to keeps only the string fields"_test = [] {
            const auto dict = decode_to<std::unordered_map<uint64_t, std::unordered_map<std::string, std::string>>>(definite_data);
            expect(dict.has_value());
            test_same(dict->size(), 1);
            const auto &m555 = dict->at(555);
            test_same(m555.size(), 2);
            test_same(m555.at("utf8string"), utf8_val);
            test_same(m555.at("long string"), long_string);
        };
        "decode_to ordered maps"_test = [] {
            const auto dict = decode_to<std::map<int64_t, std::unordered_map<std::string, std::string>>>(definite_data);
            test_same(dict->size(), 1);
            test_same(dict->at(555).size(), 2);
        };
        "decode_to sequences"_test = [] {
            const auto ints = decode_to<std::map<int64_t, std::vector<int64_t>>>(definite_data);
            test_same(ints->at(777), std::vector<int64_t> { 11, -22 });
            const auto dbls = decode_to<std::map<int64_t, std::vector<double>>>(definite_data);
            test_same(dbls->at(777), std::vector<double> { 11.0, -22.0, 33.3 });
            const auto vals = decode_to<std::map<int64_t, std::vector<value>>>(definite_data);
            test_same(vals->at(777).size(), 4);
            test_same(vals->at(777).at(3).text(), std::string { "fourty-four" });
        };
        "decode_to a sequence of pairs"_test = [] {
            const auto seq = decode_to<std::vector<std::pair<uint64_t, std::map<std::string, std::string>>>>(definite_data);
            test_same(seq->size(), 1);
            test_same(seq->at(0).first, 555);
            test_same(seq->at(0).second.size(), 2);
            test_same(seq->at(0).second.at("utf8string"), utf8_val);
            expect(seq->at(0).second.at("long string").size() > 256);
        };
        "decode_to shape mismatch"_test = [] {
            expect(!decode_to<std::string>(definite_data).has_value());
            expect(!decode_to<std::vector<int>>(uint8_vector::from_hex("01")).has_value());
            expect(throws<decode_error>([] { static_cast<void>(decode_to<int>(uint8_vector::from_hex("18"))); }));
        };
        "decode_to with the examples from the documentation"_test = [] {
            const auto m = decode_to<std::unordered_map<int8_t, std::string>>(uint8_vector::from_hex("A23818636162630763444546"));
            test_same(m->at(-25), std::string { "abc" });
            test_same(m->at(7), std::string { "DEF" });
            test_same(*decode_to<std::vector<uint32_t>>(uint8_vector::from_hex("830B161821")), std::vector<uint32_t> { 11, 22, 33 });
        };
        "encode variants are byte identical"_test = [] {
            const std::map<uint32_t, std::map<std::string, std::string>> data {
                { 555, { { "utf8string", utf8_val }, { "second", "two" } } },
                { 777, { { "third", "three" } } }
            };
            const auto by_ref = encode_ref(data);
            const auto by_dyn = encode_dyn(encodable_ref { data });
            auto copy = data;
            const auto by_val = encode(std::move(copy));
            test_same(by_ref, by_dyn);
            test_same(by_ref, by_val);
            const auto decoded = decode_to<std::unordered_map<uint32_t, std::unordered_map<std::string, std::string>>>(by_ref);
            test_same(decoded->at(555).at("utf8string"), utf8_val);
            test_same(decoded->at(555).at("second"), std::string { "two" });
            test_same(decoded->at(777).at("third"), std::string { "three" });
        };
        "encode_dyn with a custom type"_test = [] {
            const point_encodable p { point { 1, -2 } };
            test_same(encode_dyn(p), uint8_vector::from_hex("A2617801617921"));
        };
        "round trip of definite trees"_test = [] {
            for (const auto &v: { make_definite_tree(), value { array {} }, value { map { { value {}, value { simple::unassigned(40) } } } } })
                test_same(decode(encode(v)), v);
        };
    };
};
