/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli/common.hpp>

namespace programmable_tokens::cli::credential_balances {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "credential-balances";
            cmd.desc = "show the latest balances of all addresses with the given payment or stake credential";
            cmd.args.expect({ "<data-dir>", "<credential-hash>" });
            cmd.opts.try_emplace("stake", option_config { "match the stake credential instead of the payment one" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            common::query_state qs { args.at(0) };
            const auto hash = cardano::key_hash::from_hex(args.at(1));
            if (opts.contains("stake"))
                common::print_json(common::rows_to_json(qs.ledger.latest_by_stake_credential(hash)));
            else
                common::print_json(common::rows_to_json(qs.ledger.latest_by_payment_credential(hash)));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
