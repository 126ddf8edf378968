/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <filesystem>
#include <iostream>
#include <pt/config.hpp>
#include <pt/logger.hpp>

namespace programmable_tokens {
    // An installation directory has the shipped network configs next to the log directory
    static bool looks_like_install_dir(const std::filesystem::path &dir)
    {
        return std::getenv("PT_ETC") != nullptr
            || (std::filesystem::exists(dir / "etc" / "mainnet" / "indexer.json") && std::filesystem::exists(dir / "log"));
    }

    static std::optional<std::filesystem::path> &install_dir_override()
    {
        static std::optional<std::filesystem::path> dir {};
        return dir;
    }

    // resolved once, before any worker threads start
    static const std::filesystem::path &install_dir()
    {
        static const std::filesystem::path dir = [] {
            if (const auto &bin_rel = install_dir_override(); bin_rel) {
                std::cerr << fmt::format("PT_INIT: install dir: {} (relative to the binary)\n", bin_rel->string());
                return *bin_rel;
            }
            const auto cwd = std::filesystem::absolute(std::filesystem::current_path());
            if (!looks_like_install_dir(cwd)) {
                std::cerr << fmt::format("PT_INIT: {} has no etc/mainnet/indexer.json or log/; set PT_ETC or run from the installation directory\n", cwd.string());
                std::terminate();
            }
            std::cerr << fmt::format("PT_INIT: install dir: {} (the current directory)\n", cwd.string());
            return cwd;
        }();
        return dir;
    }

    // The binaries live in a bin or a build subdirectory of the installation directory
    void consider_bin_dir(const std::string_view bin_path)
    {
        const auto candidate = std::filesystem::weakly_canonical(std::filesystem::absolute(bin_path)).parent_path().parent_path();
        if (looks_like_install_dir(candidate))
            install_dir_override().emplace(candidate);
    }

    std::string install_path(const std::string_view rel_path)
    {
        const std::filesystem::path path { rel_path };
        return std::filesystem::weakly_canonical(path.is_relative() ? install_dir() / path : path).string();
    }

    config_file::config_file(const std::string &path)
        : config { std::move(json::load(path).as_object()), path }
    {
    }

    static std::optional<std::string> &configs_dir_override()
    {
        static std::optional<std::string> dir {};
        return dir;
    }

    void configs_dir::set_default_path(const std::optional<std::string> &dir)
    {
        configs_dir_override() = dir;
    }

    // --config-dir wins over PT_ETC, which wins over the mainnet configs of the installation
    std::string configs_dir::default_path()
    {
        std::string dir {};
        if (const auto &cli_dir = configs_dir_override(); cli_dir)
            dir = *cli_dir;
        else if (const char *env_dir = std::getenv("PT_ETC"); env_dir)
            dir = env_dir;
        else
            dir = install_path("etc/mainnet");
        logger::debug("configuration directory: {}", dir);
        return dir;
    }

    const configs &configs_dir::get()
    {
        static configs_dir cfg { default_path() };
        return cfg;
    }

    configs_dir::configs_dir(const std::string &dir)
    {
        for (const auto &e: std::filesystem::directory_iterator(dir)) {
            if (e.is_regular_file() && e.path().extension() == ".json")
                _configs.emplace(e.path().stem().string(), e.path().string());
        }
    }

    const config &configs_dir::_at_impl(const std::string &name) const
    {
        const auto it = _configs.find(name);
        if (it == _configs.end())
            throw error(fmt::format("there is no config named {}!", name));
        return it->second;
    }

    bool configs_dir::_contains_impl(const std::string &name) const
    {
        return _configs.contains(name);
    }
}
