/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_CBOR_VALUE_HPP
#define CBORG_CBOR_VALUE_HPP

#include <concepts>
#include <functional>
#include <source_location>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <cborg/common/bytes.hpp>
#include <cborg/cbor/error.hpp>
#include <cborg/cbor/types.hpp>

namespace cborg::cbor {
    struct decoder;
    struct value;

    // A map entry; owned exclusively by its map
    using key_val = std::pair<value, value>;

    struct array: std::vector<value> {
        using std::vector<value>::vector;

        const value &at(size_t idx, const std::source_location &loc=std::source_location::current()) const;
    };

    // Keeps the entries in their original order, duplicate keys included
    struct map: std::vector<key_val> {
        using std::vector<key_val>::vector;
    };

    struct simple {
        static constexpr simple s_false() noexcept
        {
            return simple { special_val::s_false };
        }

        static constexpr simple s_true() noexcept
        {
            return simple { special_val::s_true };
        }

        static constexpr simple s_null() noexcept
        {
            return simple { special_val::s_null };
        }

        static constexpr simple s_undefined() noexcept
        {
            return simple { special_val::s_undefined };
        }

        // codes 0-19 and 32-255; 20-31 are either named values or have no well-formed encoding
        static simple unassigned(uint8_t code);

        // any code that has a well-formed encoding: 0-23 and 32-255
        explicit simple(uint8_t code);

        uint8_t code() const noexcept
        {
            return _code;
        }

        bool is_unassigned() const noexcept
        {
            return _code < 20 || _code > 31;
        }

        bool operator==(const simple &o) const noexcept =default;
    private:
        uint8_t _code;

        constexpr explicit simple(const special_val v) noexcept:
            _code { static_cast<uint8_t>(v) }
        {
        }
    };

    enum class value_type: uint8_t {
        uint,
        nint,
        bytes,
        text,
        array,
        map,
        float64,
        simple
    };

    struct value {
        using storage_type = std::variant<uint64_t, int64_t, uint8_vector, std::string, cbor::array, cbor::map, double, cbor::simple>;

        value():
            _val { simple::s_null() }
        {
        }

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        value(const T v)
        {
            if constexpr (std::is_signed_v<T>) {
                if (v < 0)
                    _val.emplace<int64_t>(static_cast<int64_t>(v));
                else
                    _val.emplace<uint64_t>(static_cast<uint64_t>(v));
            } else {
                _val.emplace<uint64_t>(static_cast<uint64_t>(v));
            }
        }

        value(const double v):
            _val { v }
        {
        }

        value(const bool v):
            _val { v ? simple::s_true() : simple::s_false() }
        {
        }

        value(uint8_vector &&bytes):
            _val { std::move(bytes) }
        {
        }

        value(const buffer bytes):
            _val { uint8_vector { bytes } }
        {
        }

        value(std::string &&s);
        value(const std::string &s);
        value(const std::string_view s);

        value(const char *s):
            value { std::string_view { s } }
        {
        }

        value(cbor::array &&a):
            _val { std::move(a) }
        {
        }

        value(const cbor::array &a):
            _val { a }
        {
        }

        value(cbor::map &&m):
            _val { std::move(m) }
        {
        }

        value(const cbor::map &m):
            _val { m }
        {
        }

        value(const cbor::simple s):
            _val { s }
        {
        }

        value(const value &) =default;
        value(value &&) =default;
        value &operator=(const value &) =default;
        value &operator=(value &&) =default;

        bool operator==(const value &o) const;
        size_t hash() const noexcept;

        value_type type() const noexcept
        {
            return static_cast<value_type>(_val.index());
        }

        major_type major() const noexcept;

        bool is_uint() const noexcept
        {
            return std::holds_alternative<uint64_t>(_val);
        }

        bool is_nint() const noexcept
        {
            return std::holds_alternative<int64_t>(_val);
        }

        bool is_bytes() const noexcept
        {
            return std::holds_alternative<uint8_vector>(_val);
        }

        bool is_text() const noexcept
        {
            return std::holds_alternative<std::string>(_val);
        }

        bool is_array() const noexcept
        {
            return std::holds_alternative<cbor::array>(_val);
        }

        bool is_map() const noexcept
        {
            return std::holds_alternative<cbor::map>(_val);
        }

        bool is_float() const noexcept
        {
            return std::holds_alternative<double>(_val);
        }

        bool is_simple() const noexcept
        {
            return std::holds_alternative<cbor::simple>(_val);
        }

        bool is_null() const noexcept
        {
            return is_simple() && std::get<cbor::simple>(_val) == simple::s_null();
        }

        bool is_bool() const noexcept
        {
            return is_simple() && (std::get<cbor::simple>(_val) == simple::s_true() || std::get<cbor::simple>(_val) == simple::s_false());
        }

        uint64_t uint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint64_t>(loc);
        }

        // the true value, always negative
        int64_t nint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<int64_t>(loc);
        }

        double float64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<double>(loc);
        }

        cbor::simple simple(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<cbor::simple>(loc);
        }

        const uint8_vector &bytes(const std::source_location &loc=std::source_location::current()) const &
        {
            return _get<uint8_vector>(loc);
        }

        uint8_vector &&bytes(const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(_get<uint8_vector>(loc));
        }

        const std::string &text(const std::source_location &loc=std::source_location::current()) const &
        {
            return _get<std::string>(loc);
        }

        std::string &&text(const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(_get<std::string>(loc));
        }

        const cbor::array &array(const std::source_location &loc=std::source_location::current()) const &
        {
            return _get<cbor::array>(loc);
        }

        cbor::array &&array(const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(_get<cbor::array>(loc));
        }

        const cbor::map &map(const std::source_location &loc=std::source_location::current()) const &
        {
            return _get<cbor::map>(loc);
        }

        cbor::map &&map(const std::source_location &loc=std::source_location::current()) &&
        {
            return std::move(_get<cbor::map>(loc));
        }

        const value &at(const size_t idx, const std::source_location &loc=std::source_location::current()) const
        {
            return array(loc).at(idx, loc);
        }

        // later duplicates of a key overwrite the earlier ones
        std::unordered_map<value, value> hash_map(const std::source_location &loc=std::source_location::current()) const;

        const storage_type &storage() const noexcept
        {
            return _val;
        }
    private:
        friend decoder;

        storage_type _val;

        // the decoder validates UTF-8 itself before building a text value
        static value _text_unchecked(std::string &&s)
        {
            value v {};
            v._val.emplace<std::string>(std::move(s));
            return v;
        }

        template<typename T>
        const T &_get(const std::source_location &loc) const
        {
            if (const auto *ptr = std::get_if<T>(&_val); ptr) [[likely]]
                return *ptr;
            _throw_access_error(_type_of<T>(), loc);
        }

        template<typename T>
        T &_get(const std::source_location &loc)
        {
            if (auto *ptr = std::get_if<T>(&_val); ptr) [[likely]]
                return *ptr;
            _throw_access_error(_type_of<T>(), loc);
        }

        template<typename T, size_t I=0>
        static constexpr value_type _type_of() noexcept
        {
            if constexpr (std::is_same_v<T, std::variant_alternative_t<I, storage_type>>)
                return static_cast<value_type>(I);
            else
                return _type_of<T, I + 1>();
        }

        [[noreturn]] void _throw_access_error(value_type exp, const std::source_location &loc) const;
    };

    inline size_t hash_value(const value &v) noexcept
    {
        return v.hash();
    }
}

namespace std {
    template<>
    struct hash<cborg::cbor::value> {
        size_t operator()(const cborg::cbor::value &v) const noexcept
        {
            return v.hash();
        }
    };
}

namespace fmt {
    template<>
    struct formatter<cborg::cbor::value_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using cborg::cbor::value_type;
            switch (v) {
                case value_type::uint: return fmt::format_to(ctx.out(), "unsigned integer");
                case value_type::nint: return fmt::format_to(ctx.out(), "negative integer");
                case value_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case value_type::text: return fmt::format_to(ctx.out(), "text");
                case value_type::array: return fmt::format_to(ctx.out(), "array");
                case value_type::map: return fmt::format_to(ctx.out(), "map");
                case value_type::float64: return fmt::format_to(ctx.out(), "float");
                case value_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "value_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<cborg::cbor::simple>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v.is_unassigned())
                return fmt::format_to(ctx.out(), "{}", v.code());
            return fmt::format_to(ctx.out(), "{}", static_cast<cborg::cbor::special_val>(v.code()));
        }
    };
}

#endif // !CBORG_CBOR_VALUE_HPP
