/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cborg/cbor/printer.hpp>
#include <cborg/cli.hpp>
#include <cborg/file.hpp>

namespace cborg::cli::print {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "print";
            cmd.desc = "decode the first CBOR value stored in a file and print it";
            cmd.args.expect({ "<path>" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto bytes = file::read(args.at(0));
            const auto val = cbor::decode(bytes, decode_options_from(opts));
            fmt::print("{}\n", val);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
