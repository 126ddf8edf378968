/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_TIMER_HPP
#define PROGRAMMABLE_TOKENS_TIMER_HPP

#include <chrono>
#include <exception>
#include <pt/logger.hpp>

namespace programmable_tokens {
    // Logs how long the enclosing scope took, or that it was left by an exception
    struct timer {
        explicit timer(const std::string_view title, const logger::level lev=logger::level::trace)
            : _title { title }, _level { lev }
        {
            if (logger::tracing_enabled())
                logger::trace("{} started", _title);
        }

        ~timer()
        {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - _start;
            if (std::uncaught_exceptions() == _uncaught_at_start)
                logger::log(_level, "{} took {:0.3f} secs", _title, elapsed.count());
            else
                logger::log(_level, "{} failed after {:0.3f} secs", _title, elapsed.count());
        }
    private:
        const std::string _title;
        const logger::level _level;
        const int _uncaught_at_start = std::uncaught_exceptions();
        const std::chrono::steady_clock::time_point _start = std::chrono::steady_clock::now();
    };
}

#endif // !PROGRAMMABLE_TOKENS_TIMER_HPP
