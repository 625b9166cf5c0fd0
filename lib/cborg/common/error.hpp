/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_COMMON_ERROR_HPP
#define CBORG_COMMON_ERROR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cborg {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg, bool with_trace=true);
        const char *what() const noexcept override;

        bool has_trace() const noexcept
        {
            return _trace_size > 0;
        }
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
        size_t _trace_size = 0;
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    protected:
        // for errors that can be triggered by untrusted input in bulk, the stacktrace is too expensive
        explicit error(std::string_view msg, bool with_trace);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}

#endif // !CBORG_COMMON_ERROR_HPP
