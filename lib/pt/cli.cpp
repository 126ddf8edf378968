/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <charconv>
#include <pt/cli.hpp>

namespace programmable_tokens::cli {
    static std::string _usage(const config &cmd)
    {
        std::string usage = fmt::format("usage: {} {}", cmd.name, cmd.make_usage());
        if (!cmd.opts.empty()) {
            usage += fmt::format("\n{} supports the following options:", cmd.name);
            for (const auto &[name, opt]: cmd.opts) {
                if (opt.default_value)
                    usage += fmt::format("\n    --{} ({} by default) - {}", name, *opt.default_value, opt.desc);
                else
                    usage += fmt::format("\n    --{} - {}", name, opt.desc);
            }
        }
        return usage;
    }

    std::optional<std::string> validate_uint(const std::optional<std::string> &val)
    {
        if (!val)
            return "a value is required";
        uint64_t res = 0;
        const auto *end = val->data() + val->size();
        if (const auto [ptr, ec] = std::from_chars(val->data(), end, res); ec != std::errc {} || ptr != end)
            return "must be a non-negative integer";
        return {};
    }

    parse_result command::parse(const config &cfg, const arguments &args) const
    {
        parse_result pr {};
        for (const auto &arg: args) {
            if (!arg.starts_with("--")) {
                pr.args.emplace_back(arg);
                continue;
            }
            std::string name = arg.substr(2);
            std::optional<std::string> val {};
            if (const auto eq_pos = arg.find('=', 2); eq_pos != arg.npos) {
                val = arg.substr(eq_pos + 1);
                name = arg.substr(2, eq_pos - 2);
            }
            if (!cfg.opts.contains(name))
                throw error(fmt::format("unknown option '--{}'\n{}", name, _usage(cfg)));
            if (const auto [it, created] = pr.opts.try_emplace(name, std::move(val)); !created)
                throw error(fmt::format("duplicate option specification '{}'", arg));
        }
        for (const auto &[name, opt]: cfg.opts) {
            if (opt.default_value && !pr.opts.contains(name))
                pr.opts.emplace(name, *opt.default_value);
            if (const auto it = pr.opts.find(name); opt.validator && it != pr.opts.end()) {
                if (const auto err = (*opt.validator)(it->second); err)
                    throw error(fmt::format("value {} is invalid for '--{}': {}", it->second, name, *err));
            }
        }
        if (pr.args.size() < cfg.args.min || pr.args.size() > cfg.args.max)
            throw error(_usage(cfg));
        if (const auto it = pr.opts.find("config-dir"); it != pr.opts.end() && it->second)
            configs_dir::set_default_path(*it->second);
        return pr;
    }

    int run(const int argc, const char **argv, const command::command_list &command_list)
    {
        std::set_terminate([]() {
            std::cerr << "std::terminate called; terminating\n";
            std::abort();
        });
        std::ios_base::sync_with_stdio(false);
        map<std::string, std::pair<std::shared_ptr<command>, config>> commands {};
        for (const auto &cmd: command_list) {
            config cfg {};
            cmd->configure(cfg);
            cfg.opts.try_emplace("config-dir", option_config { "a directory with the indexer configuration files" });
            const auto name = cfg.name;
            if (const auto [it, created] = commands.try_emplace(name, cmd, std::move(cfg)); !created) [[unlikely]]
                throw error(fmt::format("multiple definitions for command {}", name));
        }
        if (argc < 2) {
            std::cerr << "Usage: <command> [<arg> ...], where <command> is one of:\n";
            for (const auto &[name, cmd]: commands)
                std::cerr << fmt::format("    {} {}\n", name, cmd.second.make_usage());
            return 1;
        }

        const std::string cmd_name { argv[1] };
        logger::debug("run {}", cmd_name);
        const auto cmd_it = commands.find(cmd_name);
        if (cmd_it == commands.end()) {
            logger::error("unknown command {}", cmd_name);
            return 1;
        }
        arguments args {};
        for (int i = 2; i < argc; ++i)
            args.emplace_back(argv[i]);
        try {
            const auto &[cmd, cfg] = cmd_it->second;
            timer t { fmt::format("run {}", cmd_name), logger::level::info };
            const auto pr = cmd->parse(cfg, args);
            cmd->run(pr.args, pr.opts);
        } catch (const std::exception &ex) {
            logger::error("{}: {}", cmd_name, ex.what());
            return 1;
        }
        return 0;
    }

    int run(const int argc, const char **argv)
    {
        return run(argc, argv, command::registry());
    }
}
