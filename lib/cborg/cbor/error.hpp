/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_CBOR_ERROR_HPP
#define CBORG_CBOR_ERROR_HPP

#include <cborg/common/error.hpp>
#include <cborg/common/format.hpp>

namespace cborg::cbor {
    using error = cborg::error;

    enum class error_kind: uint8_t {
        unexpected_value,
        insufficient_bytes
    };
}

namespace fmt {
    template<>
    struct formatter<cborg::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using cborg::cbor::error_kind;
            switch (v) {
                case error_kind::unexpected_value: return fmt::format_to(ctx.out(), "Unexpected value");
                case error_kind::insufficient_bytes: return fmt::format_to(ctx.out(), "Insufficient bytes");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

namespace cborg::cbor {
    // Raised by the decoder on malformed or truncated input.
    // Decoding untrusted data can fail often, so no stacktrace is recorded.
    struct decode_error: error {
        decode_error(const error_kind kind, const size_t offset, const std::string_view msg):
            error { fmt::format("{} at offset {}: {}", kind, offset, msg), false },
            _kind { kind }, _offset { offset }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }
    private:
        error_kind _kind;
        size_t _offset;
    };

    struct unexpected_value_error: decode_error {
        unexpected_value_error(const size_t offset, const std::string_view msg):
            decode_error { error_kind::unexpected_value, offset, msg }
        {
        }
    };

    struct insufficient_bytes_error: decode_error {
        insufficient_bytes_error(const size_t offset, const std::string_view msg):
            decode_error { error_kind::insufficient_bytes, offset, msg }
        {
        }
    };
}

#endif // !CBORG_CBOR_ERROR_HPP
