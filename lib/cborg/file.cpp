/* This file is part of cborg project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <cborg/file.hpp>

namespace cborg::file {
    void read(const std::string &path, uint8_vector &buffer)
    {
        std::error_code ec {};
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("failed to get the size of {}: {}", path, ec.message()));
        auto *f = std::fopen(path.c_str(), "rb");
        if (f == nullptr) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for reading: {}", path));
        buffer.resize(size);
        const auto num_read = size > 0 ? std::fread(buffer.data(), 1, size, f) : 0;
        std::fclose(f);
        if (num_read != size) [[unlikely]]
            throw error_sys(fmt::format("could read only {} bytes out of {} from {}", num_read, size, path));
    }

    void write(const std::string &path, const buffer data)
    {
        auto *f = std::fopen(path.c_str(), "wb");
        if (f == nullptr) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for writing: {}", path));
        const auto num_written = data.empty() ? 0 : std::fwrite(data.data(), 1, data.size(), f);
        if (std::fclose(f) != 0 || num_written != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }
}
