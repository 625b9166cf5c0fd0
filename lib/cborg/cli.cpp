/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include <cborg/cli.hpp>
#include <cborg/timer.hpp>

namespace cborg::cli {
    parse_result command::parse(const config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (arg.substr(0, 2) == "--") {
                std::string name = arg.substr(2);
                std::optional<std::string> val {};
                if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                    val = arg.substr(eq_pos + 1);
                    name = arg.substr(2, eq_pos - 2);
                }
                if (!cfg.opts.contains(name))
                    throw error(fmt::format("unknown option '--{}'", name));
                if (const auto [opt_it, opt_created] = pr.opts.try_emplace(name, std::move(val)); !opt_created)
                    throw error(fmt::format("duplicate option specification '{}'", arg));
            } else {
                pr.args.emplace_back(arg);
            }
        }
        for (const auto &[name, opt_cfg]: cfg.opts) {
            if (opt_cfg.default_value && !pr.opts.contains(name))
                pr.opts.emplace(name, *opt_cfg.default_value);
            if (const auto val_it = pr.opts.find(name); opt_cfg.validator && val_it != pr.opts.end()) {
                if (const auto val_err = (*opt_cfg.validator)(val_it->second); val_err)
                    throw error(fmt::format("value '{}' is invalid for '--{}': {}", val_it->second.value_or(""), name, *val_err));
            }
        }
        if (cfg.args.min && pr.args.size() < *cfg.args.min)
            _throw_usage(cfg);
        if (cfg.args.max && pr.args.size() > *cfg.args.max)
            _throw_usage(cfg);
        return pr;
    }

    void command::_throw_usage(const config &cmd)
    {
        std::string usage = fmt::format("usage: {}", cmd.make_usage());
        if (!cmd.opts.empty()) {
            usage += fmt::format("\n{} supports the following options:", cmd.name);
            for (const auto &[name, opt_cfg]: cmd.opts) {
                if (opt_cfg.default_value)
                    usage += fmt::format("\n    --{} ({} by default) - {}", name, *opt_cfg.default_value, opt_cfg.desc);
                else
                    usage += fmt::format("\n    --{} - {}", name, opt_cfg.desc);
            }
        }
        throw error(usage);
    }

    static std::optional<std::string> validate_positive(const std::optional<std::string> &val)
    {
        if (!val || val->empty() || val->find_first_not_of("0123456789") != std::string::npos)
            return "must be a positive integer";
        if (val->find_first_not_of('0') == std::string::npos)
            return "must be greater than zero";
        if (val->size() > std::numeric_limits<uint64_t>::digits10)
            return "is too large";
        return {};
    }

    static void add_common_options(config &cfg)
    {
        cfg.opts.try_emplace("config", "a JSON file with the decoder limits (maxDepth and maxCollectionSize)");
        cfg.opts.try_emplace("max-depth", option_config { .desc="the maximum nesting depth of decoded values", .validator=validate_positive });
    }

    cbor::decode_options decode_options_from(const options &opts)
    {
        cbor::decode_options res {};
        if (const auto it = opts.find("config"); it != opts.end()) {
            if (!it->second)
                throw error("--config requires a path: --config=<path>");
            res = cbor::decode_options::from_config(config_file { *it->second });
        }
        if (const auto it = opts.find("max-depth"); it != opts.end() && it->second)
            res.max_depth = std::stoull(*it->second);
        return res;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::set_terminate([]() {
            std::cerr << "std::terminate called; terminating\n";
            std::abort();
        });
        std::map<std::string, command_meta> commands {};
        for (const auto &cmd: command_list) {
            command_meta meta { cmd };
            cmd->configure(meta.cfg);
            add_common_options(meta.cfg);
            const auto name = meta.cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, std::move(meta)); !created) [[unlikely]] {
                logger::error("multiple definitions for command {}", name);
                return 1;
            }
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, meta]: commands)
                std::cerr << fmt::format("    {}\n", meta.cfg.make_usage());
            return 1;
        }

        const std::string cmd { argv[1] };
        logger::debug("run {}", cmd);
        const auto cmd_it = commands.find(cmd);
        if (cmd_it == commands.end()) {
            logger::error("Unknown command {}", cmd);
            return 1;
        }

        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &meta = cmd_it->second;
            timer t { fmt::format("run {}", cmd), logger::level::debug };
            const auto pr = meta.cmd->parse(meta.cfg, args);
            meta.cmd->run(pr.args, pr.opts);
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd, ex.what());
            return 1;
        } catch (...) {
            logger::error("{}: an unrecognized exception caught", cmd);
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
