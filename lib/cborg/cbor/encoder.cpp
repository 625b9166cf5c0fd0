/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cborg/cbor/encoder.hpp>

namespace cborg::cbor {
    encoder &encoder::item(const value &v)
    {
        switch (v.type()) {
            case value_type::uint:
                return uint(v.uint());
            case value_type::nint:
                return nint(v.nint());
            case value_type::bytes:
                return bytes(v.bytes());
            case value_type::text:
                return text(v.text());
            case value_type::array: {
                const auto &items = v.array();
                array(items.size());
                for (const auto &it: items)
                    item(it);
                return *this;
            }
            case value_type::map: {
                const auto &items = v.map();
                map(items.size());
                for (const auto &[k, val]: items) {
                    item(k);
                    item(val);
                }
                return *this;
            }
            case value_type::float64:
                return float64(v.float64());
            case value_type::simple:
                return simple(v.simple());
            default:
                throw error(fmt::format("unsupported value type: {}", v.type()));
        }
    }

    uint8_vector encode_value(const value &v)
    {
        encoder enc {};
        enc.item(v);
        return std::move(enc.cbor());
    }
}
