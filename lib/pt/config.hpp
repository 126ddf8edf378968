/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CONFIG_HPP
#define PROGRAMMABLE_TOKENS_CONFIG_HPP

#include <map>
#include <optional>
#include <pt/json.hpp>

namespace programmable_tokens {
    extern void consider_bin_dir(std::string_view bin_path);
    extern std::string install_path(std::string_view rel_path);

    // a named JSON object with required and optional members
    struct config {
        explicit config(json::object &&json, std::string source="inline"):
            _json { std::move(json) }, _source { std::move(source) }
        {
        }

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            if (const auto *v = find(name); v)
                return *v;
            throw error(fmt::format("configuration {} does not have the element {}!", _source, name));
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            if (const auto it = _json.find(name); it != _json.end())
                return &it->value();
            return nullptr;
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json;
        }
    private:
        json::object _json;
        std::string _source;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json): config { std::move(json) }
        {
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    };

    struct configs {
        virtual ~configs() =default;

        [[nodiscard]] const config &at(const std::string &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] bool contains(const std::string &name) const
        {
            return _contains_impl(name);
        }
    private:
        virtual const config &_at_impl(const std::string &) const =0;
        virtual bool _contains_impl(const std::string &) const =0;
    };

    struct configs_mock: configs {
        using map_type = std::map<std::string, config_json>;

        explicit configs_mock() =default;

        explicit configs_mock(map_type &&map): _map { std::move(map) }
        {
        }
    private:
        const map_type _map {};

        const config &_at_impl(const std::string &name) const override
        {
            const auto it = _map.find(name);
            if (it == _map.end())
                throw error(fmt::format("there is no config named {}!", name));
            return it->second;
        }

        bool _contains_impl(const std::string &name) const override
        {
            return _map.contains(name);
        }
    };

    struct configs_dir: configs {
        static void set_default_path(const std::optional<std::string> &);
        static std::string default_path();
        static const configs &get();
        explicit configs_dir(const std::string &dir);
    private:
        std::map<std::string, config_file> _configs {};

        const config &_at_impl(const std::string &) const override;
        bool _contains_impl(const std::string &) const override;
    };
}

#endif // !PROGRAMMABLE_TOKENS_CONFIG_HPP
