/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <fstream>
#include <iterator>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <pt/config.hpp>
#include <pt/logger.hpp>

namespace programmable_tokens::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("PT_DEBUG") != nullptr;
        return enabled;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("PT_LOG");
        return install_path(env_log_path ? env_log_path : "./log/pt.log");
    }

    static bool console_enabled()
    {
        return !std::getenv("PT_LOG_NO_CONSOLE");
    }

    static spdlog::level::level_enum console_level()
    {
        if (const char *env_level = std::getenv("PT_LOG_LEVEL"); env_level) {
            const auto lev = spdlog::level::from_str(env_level);
            // from_str returns off for names it does not know
            if (lev != spdlog::level::off || std::string_view { env_level } == "off")
                return lev;
            std::cerr << fmt::format("PT_INIT: unknown PT_LOG_LEVEL value: {}; using info\n", env_level);
        }
        return spdlog::level::info;
    }

    static spdlog::logger create(const std::string &path)
    {
        static constexpr size_t max_file_size = 64 << 20;
        static constexpr size_t max_files = 4;
        std::cerr << fmt::format("PT_INIT: log path: {}\n", path);
        {
            std::ofstream os { path, std::ios_base::app };
            if (!os) {
                std::cerr << fmt::format("PT_INIT: Unable to write to the log file: {}; terminating.\n", path);
                std::terminate();
            }
        }

        std::vector<spdlog::sink_ptr> sinks {};
        if (console_enabled()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(console_level());
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, max_file_size, max_files);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        sinks.emplace_back(std::move(file_sink));
        spdlog::logger logger { "pt", sinks.begin(), sinks.end() };
        logger.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        logger.debug("installation directory: {}", install_path(""));
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    void log(const level lev, const std::string &msg)
    {
        static constexpr spdlog::level::level_enum levels[] {
            spdlog::level::trace, spdlog::level::debug, spdlog::level::info, spdlog::level::warn, spdlog::level::err
        };
        const auto idx = static_cast<size_t>(lev);
        if (idx >= std::size(levels)) [[unlikely]]
            throw programmable_tokens::error(fmt::format("unsupported log level: {}", idx));
        get().log(levels[idx], msg);
    }
}
