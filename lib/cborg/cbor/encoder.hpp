/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_CBOR_ENCODER_HPP
#define CBORG_CBOR_ENCODER_HPP

#include <bit>
#include <limits>
#include <cborg/common/bytes.hpp>
#include <cborg/cbor/value.hpp>

namespace cborg::cbor {
    // Produces definite-length items with the shortest possible argument encoding
    struct encoder {
        encoder &array(const size_t sz)
        {
            _encode_uint_item(major_type::array, sz);
            return *this;
        }

        encoder &map(const size_t sz)
        {
            _encode_uint_item(major_type::map, sz);
            return *this;
        }

        encoder &uint(const uint64_t val)
        {
            _encode_uint_item(major_type::uint, val);
            return *this;
        }

        // expects the true value, which must be negative
        encoder &nint(const int64_t val)
        {
            if (val >= 0) [[unlikely]]
                throw error(fmt::format("nint expects a negative value but got {}", val));
            _encode_uint_item(major_type::nint, static_cast<uint64_t>(-1 - val));
            return *this;
        }

        encoder &float64(const double val)
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::eight_bytes));
            _encode_data(buffer::from(host_to_net(std::bit_cast<uint64_t>(val))));
            return *this;
        }

        encoder &bytes(const buffer buf)
        {
            _encode_uint_item(major_type::bytes, buf.size());
            _encode_data(buf);
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _encode_uint_item(major_type::text, sv.size());
            _encode_data(sv);
            return *this;
        }

        encoder &simple(const cbor::simple s)
        {
            if (s.code() < 24) {
                _encode_item(major_type::simple, s.code());
            } else {
                _encode_item(major_type::simple, static_cast<uint8_t>(special_val::one_byte));
                _buf.emplace_back(s.code());
            }
            return *this;
        }

        encoder &s_null()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_null));
            return *this;
        }

        encoder &s_undefined()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_undefined));
            return *this;
        }

        encoder &s_false()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_false));
            return *this;
        }

        encoder &s_true()
        {
            _encode_item(major_type::simple, static_cast<uint8_t>(special_val::s_true));
            return *this;
        }

        // encodes a whole tree; map entries are written in their stored order
        encoder &item(const value &v);

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_data(const buffer buf)
        {
            _buf.insert(_buf.end(), buf.begin(), buf.end());
        }

        void _encode_uint_item(const major_type typ, const uint64_t val)
        {
            if (val < 24) {
                _encode_item(typ, static_cast<uint8_t>(val));
            } else if (val <= std::numeric_limits<uint8_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::one_byte));
                _buf.emplace_back(static_cast<uint8_t>(val));
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::two_bytes));
                _encode_data(buffer::from(host_to_net(static_cast<uint16_t>(val))));
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                _encode_item(typ, static_cast<uint8_t>(special_val::four_bytes));
                _encode_data(buffer::from(host_to_net(static_cast<uint32_t>(val))));
            } else {
                _encode_item(typ, static_cast<uint8_t>(special_val::eight_bytes));
                _encode_data(buffer::from(host_to_net(val)));
            }
        }

        void _encode_item(const major_type typ, const uint8_t minor)
        {
            _buf.emplace_back(make_head(typ, minor));
        }
    };

    inline encoder &operator<<(encoder &dst, const value &v)
    {
        return dst.item(v);
    }

    extern uint8_vector encode_value(const value &v);
}

#endif // !CBORG_CBOR_ENCODER_HPP
