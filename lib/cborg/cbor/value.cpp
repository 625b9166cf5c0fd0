/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <bit>
#include <boost/container_hash/hash.hpp>
#include <cborg/cbor/value.hpp>

namespace cborg::cbor {
    const value &array::at(const size_t idx, const std::source_location &loc) const
    {
        if (idx < size()) [[likely]]
            return operator[](idx);
        throw error(fmt::format("invalid element index {} in an array of size {} in file {} line {}!",
            idx, size(), loc.file_name(), loc.line()));
    }

    simple simple::unassigned(const uint8_t code)
    {
        if (code >= 20 && code <= 31) [[unlikely]]
            throw error(fmt::format("simple value code {} cannot be used as an unassigned value!", code));
        return simple { code };
    }

    simple::simple(const uint8_t code):
        _code { code }
    {
        if (code >= 24 && code <= 31) [[unlikely]]
            throw error(fmt::format("simple value code {} has no well-formed encoding!", code));
    }

    static std::string &&validated_text(std::string &&s)
    {
        if (!is_utf8(buffer { s })) [[unlikely]]
            throw error(fmt::format("a text value must be valid UTF-8 but got: {}", buffer { s }));
        return std::move(s);
    }

    value::value(std::string &&s):
        _val { validated_text(std::move(s)) }
    {
    }

    value::value(const std::string &s):
        value { std::string { s } }
    {
    }

    value::value(const std::string_view s):
        value { std::string { s } }
    {
    }

    bool value::operator==(const value &o) const
    {
        if (_val.index() != o._val.index())
            return false;
        // bitwise, so that equal values always have equal hashes and NaNs are usable as keys
        if (const auto *f = std::get_if<double>(&_val); f)
            return std::bit_cast<uint64_t>(*f) == std::bit_cast<uint64_t>(std::get<double>(o._val));
        return _val == o._val;
    }

    size_t value::hash() const noexcept
    {
        size_t seed = _val.index();
        switch (type()) {
            case value_type::uint:
                boost::hash_combine(seed, std::get<uint64_t>(_val));
                break;
            case value_type::nint:
                boost::hash_combine(seed, std::get<int64_t>(_val));
                break;
            case value_type::bytes: {
                const auto &b = std::get<uint8_vector>(_val);
                boost::hash_range(seed, b.begin(), b.end());
                break;
            }
            case value_type::text:
                boost::hash_combine(seed, std::get<std::string>(_val));
                break;
            case value_type::array:
                for (const auto &v: std::get<cbor::array>(_val))
                    boost::hash_combine(seed, v.hash());
                break;
            case value_type::map:
                for (const auto &[k, v]: std::get<cbor::map>(_val)) {
                    boost::hash_combine(seed, k.hash());
                    boost::hash_combine(seed, v.hash());
                }
                break;
            case value_type::float64:
                boost::hash_combine(seed, std::bit_cast<uint64_t>(std::get<double>(_val)));
                break;
            case value_type::simple:
                boost::hash_combine(seed, std::get<cbor::simple>(_val).code());
                break;
        }
        return seed;
    }

    major_type value::major() const noexcept
    {
        switch (type()) {
            case value_type::uint: return major_type::uint;
            case value_type::nint: return major_type::nint;
            case value_type::bytes: return major_type::bytes;
            case value_type::text: return major_type::text;
            case value_type::array: return major_type::array;
            case value_type::map: return major_type::map;
            default: return major_type::simple;
        }
    }

    std::unordered_map<value, value> value::hash_map(const std::source_location &loc) const
    {
        const auto &m = map(loc);
        std::unordered_map<value, value> res {};
        res.reserve(m.size());
        for (const auto &[k, v]: m)
            res.insert_or_assign(k, v);
        return res;
    }

    void value::_throw_access_error(const value_type exp, const std::source_location &loc) const
    {
        throw error(fmt::format("invalid cbor value access, expecting type {} while the present value is {} in file {} line {}!",
            exp, type(), loc.file_name(), loc.line()));
    }
}
