/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/error.hpp>
#include <pt/logger.hpp>

namespace programmable_tokens {
    static std::string _with_location(const std::string &msg, const std::source_location &loc)
    {
        return fmt::format("{} at {}:{}", msg, loc.file_name(), loc.line());
    }

    error::error(const std::string &msg, const std::source_location &loc)
        : std::runtime_error { _with_location(msg, loc) }
    {
        logger::trace("exception: {}", what());
    }

    error::error(const std::string &msg, const std::exception &cause, const std::source_location &loc)
        : std::runtime_error { _with_location(fmt::format("{} caused by {}: {}", msg, typeid(cause).name(), cause.what()), loc) }
    {
        logger::trace("exception: {}", what());
    }
}
