/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli/common.hpp>

namespace programmable_tokens::cli::tx_balances {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "tx-balances";
            cmd.desc = "show the balance entries recorded for a transaction";
            cmd.args.expect({ "<data-dir>", "<tx-hash>" });
        }

        void run(const arguments &args, const options &) const override
        {
            common::query_state qs { args.at(0) };
            const auto tx = cardano::tx_hash::from_hex(args.at(1));
            common::print_json(common::rows_to_json(qs.ledger.by_tx(tx)));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
