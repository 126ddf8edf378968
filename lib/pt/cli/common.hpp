/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CLI_COMMON_HPP
#define PROGRAMMABLE_TOKENS_CLI_COMMON_HPP

#include <pt/balance.hpp>
#include <pt/cli.hpp>
#include <pt/protocol-versions.hpp>
#include <pt/registry.hpp>
#include <pt/store/file.hpp>

namespace programmable_tokens::cli::common {
    // The read side of a data directory
    struct query_state {
        store::file db;
        protocol_version_registry versions { db };
        token_registry registry { db };
        balance_ledger ledger { db };

        explicit query_state(const std::string &data_dir): db { data_dir }
        {
        }
    };

    extern void print_json(const json::value &j);
    extern std::optional<uint64_t> uint_opt(const options &opts, const std::string &name);

    template<typename T>
    json::array rows_to_json(const T &rows)
    {
        json::array res {};
        res.reserve(rows.size());
        for (const auto &row: rows)
            res.emplace_back(row.to_json());
        return res;
    }
}

#endif // !PROGRAMMABLE_TOKENS_CLI_COMMON_HPP
