/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_LOGGER_HPP
#define PROGRAMMABLE_TOKENS_LOGGER_HPP

#include <exception>
#include <functional>
#include <source_location>
#include <pt/error.hpp>
#include <pt/format.hpp>

namespace programmable_tokens::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    extern bool &tracing_enabled();
    extern void log(level lev, const std::string &msg);

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        log(lev, format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }

    /*
     * Runs an action and logs an exception escaping it together with the caller's location.
     * The exception is returned so that the caller can count or rethrow it.
     */
    inline std::exception_ptr run_log_errors(const std::function<void()> &action,
            const std::source_location &loc=std::source_location::current())
    {
        try {
            action();
        } catch (const programmable_tokens::error &err) {
            logger::error("{}:{}: {}", loc.file_name(), loc.line(), err.what());
            return std::current_exception();
        } catch (const std::exception &ex) {
            logger::error("{}:{}: std::exception: {}", loc.file_name(), loc.line(), ex.what());
            return std::current_exception();
        }
        return {};
    }
}

#endif // !PROGRAMMABLE_TOKENS_LOGGER_HPP
