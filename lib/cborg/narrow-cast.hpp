/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_NARROW_CAST_HPP
#define CBORG_NARROW_CAST_HPP

#include <limits>
#include <optional>
#include <typeinfo>
#include <cborg/common/error.hpp>
#include <cborg/common/format.hpp>

namespace cborg {
    // returns std::nullopt when the value does not fit into the target type
    template<typename TO, typename FROM>
    constexpr std::optional<TO> try_narrow_cast(const FROM from) noexcept
    {
        if constexpr (std::numeric_limits<FROM>::is_signed == std::numeric_limits<TO>::is_signed) {
            if (from > std::numeric_limits<TO>::max()) [[unlikely]]
                return {};
            if (from < std::numeric_limits<TO>::min()) [[unlikely]]
                return {};
            return static_cast<TO>(from);
        }
        if constexpr (std::numeric_limits<FROM>::is_signed) {
            if (from < 0) [[unlikely]]
                return {};
            if (static_cast<std::make_unsigned_t<FROM>>(from) > std::numeric_limits<TO>::max()) [[unlikely]]
                return {};
            return static_cast<TO>(from);
        }
        if (from > static_cast<std::make_unsigned_t<TO>>(std::numeric_limits<TO>::max())) [[unlikely]]
            return {};
        return static_cast<TO>(from);
    }

    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if (const auto res = try_narrow_cast<TO>(from); res) [[likely]]
            return *res;
        throw error(fmt::format("can't convert {} {} to {}: the value is out of range", typeid(FROM).name(), from, typeid(TO).name()));
    }
}

#endif // !CBORG_NARROW_CAST_HPP
