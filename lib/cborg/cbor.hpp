/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_CBOR_HPP
#define CBORG_CBOR_HPP

#include <optional>
#include <cborg/cbor/convert.hpp>
#include <cborg/cbor/decoder.hpp>
#include <cborg/cbor/encoder.hpp>
#include <cborg/cbor/printer.hpp>

namespace cborg::cbor {
    // std::nullopt when the top-level shape does not match T; malformed input throws decode_error
    template<from_value_c T>
    std::optional<T> decode_to(const buffer bytes, const decode_options &opts={})
    {
        return value_into<T>(decode(bytes, opts));
    }

    template<typename T>
        requires to_value_c<std::decay_t<T>>
    uint8_vector encode(T &&x)
    {
        return encode_value(make_value(std::forward<T>(x)));
    }

    template<typename T>
        requires to_value_c<T>
    uint8_vector encode_ref(const T &x)
    {
        return encode_value(make_value(x));
    }

    // for callers that work with objects of different types through a common interface
    struct encodable {
        virtual ~encodable() =default;
        virtual value as_value() const =0;
    };

    template<to_value_c T>
    struct encodable_ref: encodable {
        explicit encodable_ref(const T &ref):
            _ref { ref }
        {
        }

        value as_value() const override
        {
            return make_value(_ref);
        }
    private:
        const T &_ref;
    };

    inline uint8_vector encode_dyn(const encodable &v)
    {
        return encode_value(v.as_value());
    }
}

#endif // !CBORG_CBOR_HPP
