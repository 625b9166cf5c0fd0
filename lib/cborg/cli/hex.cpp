/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cborg/cli.hpp>
#include <cborg/file.hpp>

namespace cborg::cli::hex {
    struct to_hex_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "to-hex";
            cmd.desc = "print the contents of a file as a hex string";
            cmd.args.expect({ "<path>" });
        }

        void run(const arguments &args, const options &) const override
        {
            fmt::print("{}\n", file::read(args.at(0)));
        }
    };
    static auto to_hex_instance = command::reg(std::make_shared<to_hex_cmd>());

    struct from_hex_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "from-hex";
            cmd.desc = "write the bytes of a hex string into a file";
            cmd.args.expect({ "<hex>", "<out-path>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto bytes = uint8_vector::from_hex(args.at(0));
            file::write(args.at(1), bytes);
            logger::info("wrote {} bytes to {}", bytes.size(), args.at(1));
        }
    };
    static auto from_hex_instance = command::reg(std::make_shared<from_hex_cmd>());
}
