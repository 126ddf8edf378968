/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_FILE_HPP
#define PROGRAMMABLE_TOKENS_FILE_HPP

#include <filesystem>
#include <fstream>
#include <string>
#include <pt/bytes.hpp>

namespace programmable_tokens::file {
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);
    extern void truncate(const std::string &path, uint64_t new_size);

    // Appends whole records to a file and flushes each of them to the OS before returning
    struct append_stream {
        explicit append_stream(const std::string &path);
        append_stream(const append_stream &) =delete;
        void write(buffer data);

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
        std::ofstream _os;
    };
}

#endif // !PROGRAMMABLE_TOKENS_FILE_HPP
