/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_CBOR_PRINTER_HPP
#define CBORG_CBOR_PRINTER_HPP

#include <iosfwd>
#include <string>
#include <cborg/cbor/value.hpp>

namespace cborg::cbor {
    // indents nested items with three spaces per level
    extern std::string to_string(const value &v);
    extern std::ostream &operator<<(std::ostream &os, const value &v);
}

namespace fmt {
    template<>
    struct formatter<cborg::cbor::value>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", cborg::cbor::to_string(v));
        }
    };
}

#endif // !CBORG_CBOR_PRINTER_HPP
