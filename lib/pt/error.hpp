/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_ERROR_HPP
#define PROGRAMMABLE_TOKENS_ERROR_HPP

#include <cerrno>
#include <cstring>
#include <source_location>
#include <stdexcept>
#include <typeinfo>
#include <pt/format.hpp>

namespace programmable_tokens {
    // The base of all project exceptions; the message carries the location where it was thrown
    struct error: std::runtime_error {
        explicit error(const std::string &msg, const std::source_location &loc=std::source_location::current());
        // wraps a lower-level exception, keeping its type and message
        error(const std::string &msg, const std::exception &cause, const std::source_location &loc=std::source_location::current());
    };

    // adds the errno state of a failed system call
    struct error_sys: error {
        explicit error_sys(const std::string &msg, const std::source_location &loc=std::source_location::current())
            : error { fmt::format("{}: errno {} ({})", msg, errno, std::strerror(errno)), loc }
        {
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_ERROR_HPP
