/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <charconv>
#include <pt/cli/common.hpp>

namespace programmable_tokens::cli::common {
    void print_json(const json::value &j)
    {
        std::cout << json::serialize_pretty(j) << '\n';
    }

    std::optional<uint64_t> uint_opt(const options &opts, const std::string &name)
    {
        const auto it = opts.find(name);
        if (it == opts.end() || !it->second)
            return {};
        uint64_t res = 0;
        const auto &s = *it->second;
        if (const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), res); ec != std::errc {} || ptr != s.data() + s.size())
            throw error(fmt::format("--{} must be a non-negative integer but got '{}'", name, s));
        return res;
    }
}
