/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cborg/config.hpp>
#include <cborg/logger.hpp>

namespace cborg {
    static json::object parse_config_object(const std::string &path, const buffer raw)
    {
        try {
            auto j = json::parse(raw);
            if (!j.is_object()) [[unlikely]]
                throw error(fmt::format("configuration file {} must contain a JSON object!", path));
            return std::move(j.as_object());
        } catch (const boost::system::system_error &ex) {
            throw error(fmt::format("failed to parse configuration file {}", path), ex);
        }
    }

    config_file::config_file(const std::string &path)
        : _raw { file::read(path) }, _parsed { parse_config_object(path, _raw) }
    {
        logger::debug("loaded configuration from {}", path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error(fmt::format("configuration file does not have the element {}!", name));
        return it->value();
    }
}
