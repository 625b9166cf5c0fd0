/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef CBORG_FILE_HPP
#define CBORG_FILE_HPP

#include <filesystem>
#include <string>
#include <cborg/common/bytes.hpp>

namespace cborg::file {
    extern void read(const std::string &path, uint8_vector &buffer);
    extern void write(const std::string &path, buffer data);

    inline uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    // a temporary file path which is removed when the object goes out of scope
    struct tmp {
        explicit tmp(const std::string &name):
            _path { (std::filesystem::temp_directory_path() / name).string() }
        {
        }

        tmp(const tmp &) =delete;

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}

#endif // !CBORG_FILE_HPP
