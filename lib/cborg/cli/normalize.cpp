/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cborg/cbor/encoder.hpp>
#include <cborg/cli.hpp>
#include <cborg/file.hpp>

namespace cborg::cli::normalize {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "normalize";
            cmd.desc = "re-encode the first CBOR value of <in-path> with minimal definite-length items";
            cmd.args.expect({ "<in-path>", "<out-path>" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto bytes = file::read(args.at(0));
            cbor::decoder dec { bytes, decode_options_from(opts) };
            const auto val = dec.read();
            if (!dec.eof())
                logger::warn("ignoring {} bytes after the first value", bytes.size() - dec.offset());
            const auto out = cbor::encode_value(val);
            file::write(args.at(1), out);
            logger::info("normalized {} bytes into {} bytes", dec.offset(), out.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
