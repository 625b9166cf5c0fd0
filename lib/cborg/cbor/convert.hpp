/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_CBOR_CONVERT_HPP
#define CBORG_CBOR_CONVERT_HPP

#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include <cborg/narrow-cast.hpp>
#include <cborg/cbor/value.hpp>

namespace cborg::cbor {
    /*
     * Conversions between the dynamic value tree and native types.
     *
     * from_value<T>::get accepts either an rvalue value, which is taken apart and its leaves are moved,
     * or a const reference, in which case the leaves are copied. Both go through the same code.
     * The conversion is lossy at the element level: elements of sequences and entries of maps
     * that cannot be converted are dropped, and only a mismatch of the top-level shape yields std::nullopt.
     *
     * to_value<T>::make builds a value from a native one.
     */
    template<typename T>
    struct from_value {
    };

    template<typename T>
    struct to_value {
    };

    template<typename V>
    concept value_ref_c = std::same_as<std::remove_cvref_t<V>, value>;

    template<typename T>
    concept from_value_c = requires(const value &cv, value &&rv) {
        { from_value<T>::get(cv) } -> std::same_as<std::optional<T>>;
        { from_value<T>::get(std::move(rv)) } -> std::same_as<std::optional<T>>;
    };

    template<typename T>
    concept to_value_c = requires(const T &x) {
        { to_value<T>::make(x) } -> std::same_as<value>;
    };

    // moves the item out when the owner O is a non-const rvalue; gives a const reference otherwise
    template<typename O, typename T>
    constexpr decltype(auto) forward_item(T &item) noexcept
    {
        if constexpr (std::is_lvalue_reference_v<O> || std::is_const_v<std::remove_reference_t<O>>)
            return std::as_const(item);
        else
            return std::move(item);
    }

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    struct from_value<T> {
        template<value_ref_c V>
        static std::optional<T> get(V &&v)
        {
            switch (v.type()) {
                case value_type::uint: return try_narrow_cast<T>(v.uint());
                case value_type::nint: return try_narrow_cast<T>(v.nint());
                default: return {};
            }
        }
    };

    template<std::floating_point T>
    struct from_value<T> {
        template<value_ref_c V>
        static std::optional<T> get(V &&v)
        {
            switch (v.type()) {
                case value_type::uint: return static_cast<T>(v.uint());
                case value_type::nint: return static_cast<T>(v.nint());
                case value_type::float64: return static_cast<T>(v.float64());
                default: return {};
            }
        }
    };

    template<>
    struct from_value<bool> {
        template<value_ref_c V>
        static std::optional<bool> get(V &&v)
        {
            if (!v.is_bool())
                return {};
            return v.simple() == simple::s_true();
        }
    };

    template<>
    struct from_value<std::string> {
        template<value_ref_c V>
        static std::optional<std::string> get(V &&v)
        {
            if (!v.is_text())
                return {};
            return std::forward<V>(v).text();
        }
    };

    template<>
    struct from_value<value> {
        template<value_ref_c V>
        static std::optional<value> get(V &&v)
        {
            return std::forward<V>(v);
        }
    };

    // a byte string, or an array of small integers with the out-of-range ones dropped
    template<typename B>
    struct from_value_bytes {
        template<value_ref_c V>
        static std::optional<B> get(V &&v)
        {
            switch (v.type()) {
                case value_type::bytes:
                    return B(std::forward<V>(v).bytes());
                case value_type::array: {
                    B res {};
                    const auto &items = v.array();
                    res.reserve(items.size());
                    for (const auto &item: items) {
                        if (const auto b = from_value<uint8_t>::get(item); b)
                            res.emplace_back(*b);
                    }
                    return res;
                }
                default:
                    return {};
            }
        }
    };

    template<>
    struct from_value<uint8_vector>: from_value_bytes<uint8_vector> {
    };

    template<>
    struct from_value<std::vector<uint8_t>>: from_value_bytes<std::vector<uint8_t>> {
    };

    // an array, or a map with each entry converted as a single-entry map
    template<from_value_c T, typename A>
    struct from_value<std::vector<T, A>> {
        template<value_ref_c V>
        static std::optional<std::vector<T, A>> get(V &&v)
        {
            std::vector<T, A> res {};
            switch (v.type()) {
                case value_type::array: {
                    auto &&items = std::forward<V>(v).array();
                    res.reserve(items.size());
                    for (auto &item: items) {
                        if (auto x = from_value<T>::get(forward_item<V>(item)); x)
                            res.emplace_back(std::move(*x));
                    }
                    return res;
                }
                case value_type::map: {
                    auto &&entries = std::forward<V>(v).map();
                    res.reserve(entries.size());
                    for (auto &kv: entries) {
                        map single {};
                        single.emplace_back(forward_item<V>(kv));
                        if (auto x = from_value<T>::get(value { std::move(single) }); x)
                            res.emplace_back(std::move(*x));
                    }
                    return res;
                }
                default:
                    return {};
            }
        }
    };

    template<typename M>
    struct from_value_map {
        using key_type = typename M::key_type;
        using mapped_type = typename M::mapped_type;

        template<value_ref_c V>
        static std::optional<M> get(V &&v)
        {
            if (!v.is_map())
                return {};
            M res {};
            for (auto &kv: std::forward<V>(v).map()) {
                auto k = from_value<key_type>::get(forward_item<V>(kv.first));
                if (!k)
                    continue;
                auto val = from_value<mapped_type>::get(forward_item<V>(kv.second));
                if (!val)
                    continue;
                res.insert_or_assign(std::move(*k), std::move(*val));
            }
            return res;
        }
    };

    template<from_value_c K, from_value_c T, typename C, typename A>
    struct from_value<std::map<K, T, C, A>>: from_value_map<std::map<K, T, C, A>> {
    };

    template<from_value_c K, from_value_c T, typename H, typename E, typename A>
    struct from_value<std::unordered_map<K, T, H, E, A>>: from_value_map<std::unordered_map<K, T, H, E, A>> {
    };

    // a map with exactly one entry
    template<from_value_c K, from_value_c T>
    struct from_value<std::pair<K, T>> {
        template<value_ref_c V>
        static std::optional<std::pair<K, T>> get(V &&v)
        {
            if (!v.is_map())
                return {};
            auto &&entries = std::forward<V>(v).map();
            if (entries.size() != 1)
                return {};
            auto &kv = entries.front();
            auto k = from_value<K>::get(forward_item<V>(kv.first));
            if (!k)
                return {};
            auto val = from_value<T>::get(forward_item<V>(kv.second));
            if (!val)
                return {};
            return std::pair<K, T> { std::move(*k), std::move(*val) };
        }
    };

    template<std::integral T>
    struct to_value<T> {
        static value make(const T x)
        {
            return value { x };
        }
    };

    template<std::floating_point T>
    struct to_value<T> {
        static value make(const T x)
        {
            return value { static_cast<double>(x) };
        }
    };

    template<>
    struct to_value<std::string> {
        static value make(std::string &&s)
        {
            return value { std::move(s) };
        }

        static value make(const std::string &s)
        {
            return value { s };
        }
    };

    template<>
    struct to_value<std::string_view> {
        static value make(const std::string_view s)
        {
            return value { s };
        }
    };

    template<>
    struct to_value<const char *> {
        static value make(const char *s)
        {
            return value { s };
        }
    };

    template<>
    struct to_value<uint8_vector> {
        static value make(uint8_vector &&b)
        {
            return value { std::move(b) };
        }

        static value make(const uint8_vector &b)
        {
            return value { static_cast<buffer>(b) };
        }
    };

    template<>
    struct to_value<std::vector<uint8_t>> {
        static value make(std::vector<uint8_t> &&b)
        {
            return value { uint8_vector(std::move(b)) };
        }

        static value make(const std::vector<uint8_t> &b)
        {
            return value { uint8_vector(b.begin(), b.end()) };
        }
    };

    template<>
    struct to_value<value> {
        template<value_ref_c V>
        static value make(V &&v)
        {
            return std::forward<V>(v);
        }
    };

    template<to_value_c T, typename A>
    struct to_value<std::vector<T, A>> {
        template<typename U>
        static value make(U &&items)
        {
            array res {};
            res.reserve(items.size());
            for (auto &&item: items)
                res.emplace_back(to_value<T>::make(forward_item<U>(item)));
            return value { std::move(res) };
        }
    };

    // entries keep the iteration order of the source container
    template<typename M>
    struct to_value_map {
        using key_type = typename M::key_type;
        using mapped_type = typename M::mapped_type;

        template<typename U>
        static value make(U &&src)
        {
            map res {};
            res.reserve(src.size());
            for (auto &[k, v]: src)
                res.emplace_back(to_value<key_type>::make(k), to_value<mapped_type>::make(forward_item<U>(v)));
            return value { std::move(res) };
        }
    };

    template<to_value_c K, to_value_c T, typename C, typename A>
    struct to_value<std::map<K, T, C, A>>: to_value_map<std::map<K, T, C, A>> {
    };

    template<to_value_c K, to_value_c T, typename H, typename E, typename A>
    struct to_value<std::unordered_map<K, T, H, E, A>>: to_value_map<std::unordered_map<K, T, H, E, A>> {
    };

    template<to_value_c K, to_value_c T>
    struct to_value<std::pair<K, T>> {
        template<typename U>
        static value make(U &&p)
        {
            map res {};
            res.emplace_back(to_value<K>::make(forward_item<U>(p.first)), to_value<T>::make(forward_item<U>(p.second)));
            return value { std::move(res) };
        }
    };

    template<from_value_c T>
    std::optional<T> value_into(value &&v)
    {
        return from_value<T>::get(std::move(v));
    }

    template<from_value_c T>
    std::optional<T> value_to(const value &v)
    {
        return from_value<T>::get(v);
    }

    template<typename T>
        requires to_value_c<std::decay_t<T>>
    value make_value(T &&x)
    {
        return to_value<std::decay_t<T>>::make(std::forward<T>(x));
    }
}

#endif // !CBORG_CBOR_CONVERT_HPP
