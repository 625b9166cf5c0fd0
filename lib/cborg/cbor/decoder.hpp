/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_CBOR_DECODER_HPP
#define CBORG_CBOR_DECODER_HPP

#include <vector>
#include <cborg/config.hpp>
#include <cborg/cbor/value.hpp>

namespace cborg::cbor {
    struct decode_options {
        static constexpr size_t default_max_depth = 256;
        static constexpr size_t default_max_collection_size = 0x100000;

        // the maximum nesting of arrays, maps, and tags
        size_t max_depth = default_max_depth;
        // the maximum number of elements in an array or a map and the maximum number of bytes in a string
        size_t max_collection_size = default_max_collection_size;

        static decode_options from_config(const config &cfg);
    };

    // Reads successive CBOR items from a contiguous buffer. Tags are skipped and only the tagged item is returned.
    // Errors are reported with unexpected_value_error and insufficient_bytes_error.
    struct decoder {
        explicit decoder(buffer bytes, const decode_options &opts={});

        value read();

        bool eof() const noexcept
        {
            return _pos >= _data.size();
        }

        size_t offset() const noexcept
        {
            return _pos;
        }
    private:
        const buffer _data;
        const decode_options _opts;
        size_t _pos = 0;

        size_t _remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        uint8_t _next();
        uint8_t _peek();
        buffer _take(size_t sz);
        uint64_t _read_uint(uint8_t minor, size_t head_pos);
        void _check_limit(uint64_t sz, size_t head_pos, const char *what);
        void _check_fits(uint64_t sz, size_t min_item_size, size_t head_pos, const char *what);
        void _check_depth(size_t depth, size_t head_pos);
        value _read_value(size_t depth);
        uint8_vector _read_string(major_type typ, uint8_t minor, size_t head_pos);
        value _read_array(uint8_t minor, size_t depth, size_t head_pos);
        value _read_map(uint8_t minor, size_t depth, size_t head_pos);
        value _read_simple(uint8_t minor, size_t head_pos);
    };

    // decodes the first item; trailing bytes are ignored
    extern value decode(buffer bytes, const decode_options &opts={});
    extern std::vector<value> decode_all(buffer bytes, const decode_options &opts={});

    extern double float16_to_double(uint16_t h) noexcept;
}

#endif // !CBORG_CBOR_DECODER_HPP
