/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CLI_HPP
#define PROGRAMMABLE_TOKENS_CLI_HPP

#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <pt/config.hpp>
#include <pt/container.hpp>
#include <pt/logger.hpp>
#include <pt/timer.hpp>

namespace programmable_tokens::cli {
    using arguments = vector<std::string>;
    using options = map<std::string, std::optional<std::string>>;
    using option_validator = std::function<std::optional<std::string>(const std::optional<std::string> &)>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};
        std::optional<option_validator> validator {};
    };
    using option_config_map = map<std::string, option_config>;

    struct argument_config {
        size_t min = 0;
        size_t max = 0;
        vector<std::string> names {};

        // names in square brackets are optional
        void expect(const std::initializer_list<std::string> &args)
        {
            names = args;
            min = 0;
            max = 0;
            for (const auto &a: args) {
                ++max;
                if (a.empty() || a.front() != '[')
                    ++min;
            }
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        option_config_map opts {};

        std::string make_usage() const
        {
            std::string usage {};
            if (!opts.empty())
                usage += "[options]";
            for (const auto &arg: args.names)
                usage += fmt::format(" {}", arg);
            return fmt::format("{} - {}", usage, desc);
        }
    };

    struct parse_result {
        arguments args {};
        options opts {};
    };

    extern std::optional<std::string> validate_uint(const std::optional<std::string> &val);

    struct command {
        using command_list = vector<std::shared_ptr<command>>;

        static const command_list &registry()
        {
            return _registry();
        }

        static std::shared_ptr<command> reg(std::shared_ptr<command> &&cmd)
        {
            return _registry().emplace_back(std::move(cmd));
        }

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;
        virtual void run(const arguments &args, const options &opts) const =0;
        parse_result parse(const config &cfg, const arguments &args) const;
    private:
        static command_list &_registry()
        {
            static command_list l {};
            return l;
        }
    };

    extern int run(int argc, const char **argv, const command::command_list &command_list);
    extern int run(int argc, const char **argv);
}

#endif // !PROGRAMMABLE_TOKENS_CLI_HPP
