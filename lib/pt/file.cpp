/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/file.hpp>

namespace programmable_tokens::file {
    uint8_vector read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary | std::ios::ate };
        if (!is)
            throw error_sys(fmt::format("failed to open for reading: {}", path));
        const auto sz = static_cast<size_t>(is.tellg());
        uint8_vector data(sz);
        is.seekg(0);
        if (sz > 0 && !is.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(sz)))
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
        return data;
    }

    void write(const std::string &path, const buffer data)
    {
        if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
            std::filesystem::create_directories(parent);
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open for writing: {}", path));
        if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())))
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    void truncate(const std::string &path, const uint64_t new_size)
    {
        std::filesystem::resize_file(path, new_size);
    }

    append_stream::append_stream(const std::string &path):
        _path { path }, _os { path, std::ios::binary | std::ios::app }
    {
        if (!_os)
            throw error_sys(fmt::format("failed to open for appending: {}", _path));
    }

    void append_stream::write(const buffer data)
    {
        if (!_os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())) || !_os.flush())
            throw error_sys(fmt::format("failed to append {} bytes to {}", data.size(), _path));
    }
}
