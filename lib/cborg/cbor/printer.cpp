/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iterator>
#include <ostream>
#include <cborg/cbor/printer.hpp>

namespace cborg::cbor {
    using out_it = std::back_insert_iterator<std::string>;

    static void print_indent(out_it out, const size_t depth)
    {
        for (size_t i = 0; i < depth; ++i)
            fmt::format_to(out, "   ");
    }

    static void print_value(out_it out, const value &v, const size_t depth)
    {
        switch (v.type()) {
            case value_type::uint:
                fmt::format_to(out, "{}", v.uint());
                break;
            case value_type::nint:
                fmt::format_to(out, "{}", v.nint());
                break;
            case value_type::bytes: {
                const auto &b = v.bytes();
                if (b.empty())
                    fmt::format_to(out, "[]");
                else if (b.size() == 1)
                    fmt::format_to(out, "[ {} ]", b[0]);
                else {
                    fmt::format_to(out, "[{}", b[0]);
                    for (size_t i = 1; i < b.size(); ++i)
                        fmt::format_to(out, ", {}", b[i]);
                    fmt::format_to(out, "]");
                }
                break;
            }
            case value_type::text:
                fmt::format_to(out, "\"{}\"", v.text());
                break;
            case value_type::array:
                fmt::format_to(out, "[\n");
                for (const auto &item: v.array()) {
                    print_indent(out, depth + 1);
                    print_value(out, item, depth + 1);
                    fmt::format_to(out, ",\n");
                }
                print_indent(out, depth);
                fmt::format_to(out, "]");
                break;
            case value_type::map:
                fmt::format_to(out, "{{\n");
                for (const auto &[k, val]: v.map()) {
                    print_indent(out, depth + 1);
                    print_value(out, k, depth + 1);
                    fmt::format_to(out, ": ");
                    print_value(out, val, depth + 1);
                    fmt::format_to(out, ",\n");
                }
                print_indent(out, depth);
                fmt::format_to(out, "}}");
                break;
            case value_type::float64:
                fmt::format_to(out, "{}", v.float64());
                break;
            case value_type::simple:
                fmt::format_to(out, "{}", v.simple());
                break;
            default:
                throw error(fmt::format("unsupported value type: {}", v.type()));
        }
    }

    std::string to_string(const value &v)
    {
        std::string res {};
        print_value(std::back_inserter(res), v, 0);
        return res;
    }

    std::ostream &operator<<(std::ostream &os, const value &v)
    {
        return os << to_string(v);
    }
}
