/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cborg/common/test.hpp>
#include <cborg/cli.hpp>
#include <cborg/file.hpp>

using namespace cborg;

namespace {
    struct echo_cmd: cli::command {
        void configure(cli::config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "test command";
            cmd.args.expect({ "<first>", "[<second>]" });
            cmd.opts.try_emplace("flag", "a flag");
            cmd.opts.try_emplace("level", cli::option_config { .desc="a level", .default_value="3" });
        }

        void run(const cli::arguments &, const cli::options &) const override
        {
        }
    };

    template<size_t SZ>
    int run_cli(const std::array<const char *, SZ> &argv)
    {
        return cli::run(static_cast<int>(argv.size()), const_cast<const char **>(argv.data()));
    }
}

suite cli_suite = [] {
    "cli"_test = [] {
        "argument config"_test = [] {
            cli::argument_config args {};
            args.expect({ "<a>", "<b>", "[<c>]" });
            test_same(size_t { 2 }, *args.min);
            test_same(size_t { 3 }, *args.max);
            test_same(size_t { 3 }, args.names.size());
        };
        "parse"_test = [] {
            const echo_cmd cmd {};
            cli::config cfg {};
            cmd.configure(cfg);
            test_same(std::string { "echo <first> [<second>] [options] - test command" }, cfg.make_usage());
            {
                const auto pr = cmd.parse(cfg, { "x", "--flag", "y" });
                test_same(cli::arguments { "x", "y" }, pr.args);
                expect(pr.opts.contains("flag"));
                expect(!pr.opts.at("flag").has_value());
                test_same(std::string { "3" }, pr.opts.at("level").value());
            }
            {
                const auto pr = cmd.parse(cfg, { "x", "--level=7" });
                test_same(std::string { "7" }, pr.opts.at("level").value());
            }
            expect(throws<error>([&] { cmd.parse(cfg, {}); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "b", "c" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "--unknown" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "--flag", "--flag" }); }));
        };
        "decode options"_test = [] {
            {
                const auto opts = cli::decode_options_from({});
                test_same(cbor::decode_options::default_max_depth, opts.max_depth);
                test_same(cbor::decode_options::default_max_collection_size, opts.max_collection_size);
            }
            {
                const auto opts = cli::decode_options_from({ { "max-depth", "5" } });
                test_same(size_t { 5 }, opts.max_depth);
            }
            file::tmp cfg_path { "cborg-cli-test-config.json" };
            file::write(cfg_path, buffer { std::string_view { R"({ "maxDepth": 10, "maxCollectionSize": 100 })" } });
            {
                const auto opts = cli::decode_options_from({ { "config", cfg_path.path() } });
                test_same(size_t { 10 }, opts.max_depth);
                test_same(size_t { 100 }, opts.max_collection_size);
            }
            {
                const auto opts = cli::decode_options_from({ { "config", cfg_path.path() }, { "max-depth", "2" } });
                test_same(size_t { 2 }, opts.max_depth);
                test_same(size_t { 100 }, opts.max_collection_size);
            }
            expect(throws<error>([] { cli::decode_options_from({ { "config", std::optional<std::string> {} } }); }));
        };
        "from-hex and to-hex"_test = [] {
            file::tmp out { "cborg-cli-test-from-hex.bin" };
            test_same(0, run_cli(std::array { "cborg", "from-hex", "A1636B6579F5", out.path().c_str() }));
            test_same(uint8_vector::from_hex("A1636B6579F5"), file::read(out));
            test_same(0, run_cli(std::array { "cborg", "to-hex", out.path().c_str() }));
            test_same(1, run_cli(std::array { "cborg", "from-hex", "A1Z", out.path().c_str() }));
        };
        "normalize"_test = [] {
            file::tmp in { "cborg-cli-test-normalize-in.bin" };
            file::tmp out { "cborg-cli-test-normalize-out.bin" };
            file::write(in, uint8_vector::from_hex("BF61619F0102FF7F6178FF5F4101FFFF"));
            test_same(0, run_cli(std::array { "cborg", "normalize", in.path().c_str(), out.path().c_str() }));
            test_same(uint8_vector::from_hex("A2616182010261784101"), file::read(out));
        };
        "print"_test = [] {
            file::tmp in { "cborg-cli-test-print.bin" };
            file::write(in, uint8_vector::from_hex("8301820203820405"));
            test_same(0, run_cli(std::array { "cborg", "print", in.path().c_str() }));
            test_same(0, run_cli(std::array { "cborg", "print", in.path().c_str(), "--max-depth=2" }));
            test_same(1, run_cli(std::array { "cborg", "print", in.path().c_str(), "--max-depth=1" }));
            test_same(1, run_cli(std::array { "cborg", "print", in.path().c_str(), "--max-depth=0" }));
            test_same(1, run_cli(std::array { "cborg", "print", in.path().c_str(), "--max-depth=x" }));
        };
        "failures"_test = [] {
            test_same(1, run_cli(std::array { "cborg" }));
            test_same(1, run_cli(std::array { "cborg", "no-such-command" }));
            test_same(1, run_cli(std::array { "cborg", "print" }));
            test_same(1, run_cli(std::array { "cborg", "print", "/nonexistent/cborg/file.bin" }));
            file::tmp in { "cborg-cli-test-truncated.bin" };
            file::write(in, uint8_vector::from_hex("8301"));
            test_same(1, run_cli(std::array { "cborg", "print", in.path().c_str() }));
        };
    };
};
