/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <bit>
#include <cmath>
#include <limits>
#include <cborg/cbor/decoder.hpp>
#include <cborg/logger.hpp>

namespace cborg::cbor {
    static size_t positive_option(const config &cfg, const std::string_view name, const size_t def)
    {
        if (!cfg.contains(name))
            return def;
        const auto &j = cfg.at(name);
        if (j.is_int64() && j.as_int64() > 0)
            return static_cast<size_t>(j.as_int64());
        if (j.is_uint64() && j.as_uint64() > 0)
            return static_cast<size_t>(j.as_uint64());
        throw error(fmt::format("configuration option {} must be a positive integer but got {}", name, json::serialize(j)));
    }

    decode_options decode_options::from_config(const config &cfg)
    {
        return {
            positive_option(cfg, "maxDepth", default_max_depth),
            positive_option(cfg, "maxCollectionSize", default_max_collection_size)
        };
    }

    double float16_to_double(const uint16_t h) noexcept
    {
        const int exp = (h >> 10) & 0x1F;
        const int mant = h & 0x3FF;
        double val;
        if (exp == 0)
            val = std::ldexp(mant, -24);
        else if (exp != 31)
            val = std::ldexp(mant + 1024, exp - 25);
        else
            val = mant == 0 ? std::numeric_limits<double>::infinity() : std::numeric_limits<double>::quiet_NaN();
        return (h & 0x8000) ? -val : val;
    }

    template<typename T>
    static T read_be(const buffer b)
    {
        T v;
        memcpy(&v, b.data(), sizeof(v));
        return net_to_host(v);
    }

    decoder::decoder(const buffer bytes, const decode_options &opts):
        _data { bytes }, _opts { opts }
    {
    }

    value decoder::read()
    {
        return _read_value(0);
    }

    uint8_t decoder::_next()
    {
        if (_pos >= _data.size()) [[unlikely]]
            throw insufficient_bytes_error(_pos, "the input ended while a data item was expected");
        return _data[_pos++];
    }

    uint8_t decoder::_peek()
    {
        if (_pos >= _data.size()) [[unlikely]]
            throw insufficient_bytes_error(_pos, "the input ended before the break byte");
        return _data[_pos];
    }

    buffer decoder::_take(const size_t sz)
    {
        if (sz > _remaining()) [[unlikely]]
            throw insufficient_bytes_error(_pos, fmt::format("need {} bytes but only {} remain", sz, _remaining()));
        const auto res = _data.subbuf(_pos, sz);
        _pos += sz;
        return res;
    }

    uint64_t decoder::_read_uint(const uint8_t minor, const size_t head_pos)
    {
        if (minor < 24)
            return minor;
        switch (minor) {
            case 24: return _take(1)[0];
            case 25: return read_be<uint16_t>(_take(2));
            case 26: return read_be<uint32_t>(_take(4));
            case 27: return read_be<uint64_t>(_take(8));
            default:
                throw unexpected_value_error(head_pos, fmt::format("invalid additional information value: {}", minor));
        }
    }

    void decoder::_check_limit(const uint64_t sz, const size_t head_pos, const char *what)
    {
        if (sz > _opts.max_collection_size) [[unlikely]] {
            logger::trace("cbor decoder: {} of size {} at offset {} exceeds the limit of {}", what, sz, head_pos, _opts.max_collection_size);
            throw unexpected_value_error(head_pos, fmt::format("{} size {} exceeds the limit of {}", what, sz, _opts.max_collection_size));
        }
    }

    void decoder::_check_fits(const uint64_t sz, const size_t min_item_size, const size_t head_pos, const char *what)
    {
        _check_limit(sz, head_pos, what);
        // every element takes at least min_item_size bytes, so fail early instead of allocating
        if (sz > _remaining() / min_item_size) [[unlikely]]
            throw insufficient_bytes_error(head_pos, fmt::format("{} of size {} cannot fit into the remaining {} bytes", what, sz, _remaining()));
    }

    void decoder::_check_depth(const size_t depth, const size_t head_pos)
    {
        if (depth >= _opts.max_depth) [[unlikely]] {
            logger::trace("cbor decoder: nesting at offset {} exceeds the limit of {}", head_pos, _opts.max_depth);
            throw unexpected_value_error(head_pos, fmt::format("nesting depth exceeds the limit of {}", _opts.max_depth));
        }
    }

    value decoder::_read_value(const size_t depth)
    {
        const auto head_pos = _pos;
        const auto head = _next();
        const auto typ = static_cast<major_type>(head >> 5);
        const uint8_t minor = head & 0x1F;
        switch (typ) {
            case major_type::uint:
                return { _read_uint(minor, head_pos) };
            case major_type::nint: {
                const auto u = _read_uint(minor, head_pos);
                if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
                    throw unexpected_value_error(head_pos, fmt::format("negative integer -1-{} is out of the supported range", u));
                return { -1 - static_cast<int64_t>(u) };
            }
            case major_type::bytes:
                return { _read_string(typ, minor, head_pos) };
            case major_type::text: {
                auto bytes = _read_string(typ, minor, head_pos);
                if (!is_utf8(bytes)) [[unlikely]]
                    throw unexpected_value_error(head_pos, "a text string is not valid UTF-8");
                return value::_text_unchecked(std::string { bytes.str() });
            }
            case major_type::array:
                return _read_array(minor, depth, head_pos);
            case major_type::map:
                return _read_map(minor, depth, head_pos);
            case major_type::tag:
                _check_depth(depth, head_pos);
                _read_uint(minor, head_pos);
                return _read_value(depth + 1);
            case major_type::simple:
                return _read_simple(minor, head_pos);
            default:
                throw unexpected_value_error(head_pos, fmt::format("unsupported major type: {}", typ));
        }
    }

    uint8_vector decoder::_read_string(const major_type typ, const uint8_t minor, const size_t head_pos)
    {
        if (minor != indefinite_minor) {
            const auto sz = _read_uint(minor, head_pos);
            _check_fits(sz, 1, head_pos, "string");
            return _take(sz);
        }
        uint8_vector res {};
        for (;;) {
            const auto chunk_pos = _pos;
            const auto chunk_head = _next();
            if (chunk_head == break_byte)
                break;
            const auto chunk_typ = static_cast<major_type>(chunk_head >> 5);
            const uint8_t chunk_minor = chunk_head & 0x1F;
            if (chunk_typ != typ || chunk_minor == indefinite_minor) [[unlikely]]
                throw unexpected_value_error(chunk_pos, fmt::format("an indefinite {} string cannot contain a {} chunk{}",
                    typ, chunk_typ, chunk_minor == indefinite_minor ? " of indefinite length" : ""));
            const auto sz = _read_uint(chunk_minor, chunk_pos);
            _check_limit(sz, head_pos, "string");
            _check_limit(res.size() + sz, head_pos, "string");
            res << _take(sz);
        }
        return res;
    }

    value decoder::_read_array(const uint8_t minor, const size_t depth, const size_t head_pos)
    {
        _check_depth(depth, head_pos);
        array items {};
        if (minor != indefinite_minor) {
            const auto sz = _read_uint(minor, head_pos);
            _check_fits(sz, 1, head_pos, "array");
            items.reserve(sz);
            for (uint64_t i = 0; i < sz; ++i)
                items.emplace_back(_read_value(depth + 1));
        } else {
            while (_peek() != break_byte) {
                _check_limit(items.size() + 1, head_pos, "array");
                items.emplace_back(_read_value(depth + 1));
            }
            ++_pos;
        }
        return { std::move(items) };
    }

    value decoder::_read_map(const uint8_t minor, const size_t depth, const size_t head_pos)
    {
        _check_depth(depth, head_pos);
        map items {};
        if (minor != indefinite_minor) {
            const auto sz = _read_uint(minor, head_pos);
            _check_fits(sz, 2, head_pos, "map");
            items.reserve(sz);
            for (uint64_t i = 0; i < sz; ++i) {
                auto k = _read_value(depth + 1);
                auto v = _read_value(depth + 1);
                items.emplace_back(std::move(k), std::move(v));
            }
        } else {
            while (_peek() != break_byte) {
                _check_limit(items.size() + 1, head_pos, "map");
                auto k = _read_value(depth + 1);
                auto v = _read_value(depth + 1);
                items.emplace_back(std::move(k), std::move(v));
            }
            ++_pos;
        }
        return { std::move(items) };
    }

    value decoder::_read_simple(const uint8_t minor, const size_t head_pos)
    {
        switch (minor) {
            case 20: return { simple::s_false() };
            case 21: return { simple::s_true() };
            case 22: return { simple::s_null() };
            case 23: return { simple::s_undefined() };
            case 24: {
                const auto code = _take(1)[0];
                if (code < 32) [[unlikely]]
                    throw unexpected_value_error(head_pos, fmt::format("a two-byte simple value must be at least 32 but got {}", code));
                return { simple::unassigned(code) };
            }
            case 25: return { float16_to_double(read_be<uint16_t>(_take(2))) };
            case 26: return { static_cast<double>(std::bit_cast<float>(read_be<uint32_t>(_take(4)))) };
            case 27: return { std::bit_cast<double>(read_be<uint64_t>(_take(8))) };
            case indefinite_minor:
                throw unexpected_value_error(head_pos, "a break byte outside of an indefinite-length item");
            default:
                if (minor < 20)
                    return { simple::unassigned(minor) };
                throw unexpected_value_error(head_pos, fmt::format("reserved simple value encoding: {}", minor));
        }
    }

    value decode(const buffer bytes, const decode_options &opts)
    {
        decoder dec { bytes, opts };
        return dec.read();
    }

    std::vector<value> decode_all(const buffer bytes, const decode_options &opts)
    {
        std::vector<value> res {};
        decoder dec { bytes, opts };
        while (!dec.eof())
            res.emplace_back(dec.read());
        return res;
    }
}
