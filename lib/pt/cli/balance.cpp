/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli/common.hpp>

namespace programmable_tokens::cli::balance {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "balance";
            cmd.desc = "show the current balance of an address or its history";
            cmd.args.expect({ "<data-dir>", "<address>" });
            cmd.opts.try_emplace("history", option_config { "show the balance history, newest first" });
            cmd.opts.try_emplace("limit", option_config { "the maximum number of history entries, zero means all", "0", validate_uint });
        }

        void run(const arguments &args, const options &opts) const override
        {
            common::query_state qs { args.at(0) };
            const auto addr = cardano::address::from_string(args.at(1));
            if (opts.contains("history")) {
                const auto limit = common::uint_opt(opts, "limit").value_or(0);
                common::print_json(common::rows_to_json(qs.ledger.history(addr.bytes(), limit)));
                return;
            }
            common::print_json(json::object {
                { "address", addr.to_string() },
                { "balance", store::value_to_json(qs.ledger.current_balance(addr.bytes())) }
            });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
