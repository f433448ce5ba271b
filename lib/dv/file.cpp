/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <fstream>
#include <dv/file.hpp>
#include <dv/logger.hpp>

namespace devalue::file {
    std::string read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        const auto sz = std::filesystem::file_size(path);
        std::string buf(sz, '\0');
        if (!is.read(buf.data(), static_cast<std::streamsize>(sz)))
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
        return buf;
    }

    void write(const std::string &path, const std::string_view data)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open file {} for writing", path));
        if (!os.write(data.data(), static_cast<std::streamsize>(data.size())))
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    tmp::tmp(const std::string_view &name)
        : _path { (std::filesystem::temp_directory_path() / name).string() }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        if (!std::filesystem::remove(_path, ec) && ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }
}
