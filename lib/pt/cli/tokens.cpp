/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli/common.hpp>

namespace programmable_tokens::cli::tokens {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "tokens";
            cmd.desc = "show the registered token policies of a protocol version, the latest one by default";
            cmd.args.expect({ "<data-dir>", "[<policy-id>]" });
            cmd.opts.try_emplace("version", option_config { "the transaction hash of the protocol version" });
            cmd.opts.try_emplace("all", option_config { "include deleted nodes and the sentinel" });
            cmd.opts.try_emplace("chain", option_config { "verify the linked list and show its keys in order" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            common::query_state qs { args.at(0) };
            if (args.size() > 1) {
                const auto policy = cardano::policy_id::from_hex(args.at(1));
                common::print_json(json::object {
                    { "policyId", fmt::format("{}", policy) },
                    { "registered", qs.registry.is_registered(policy) }
                });
                return;
            }
            cardano::tx_hash version {};
            if (const auto it = opts.find("version"); it != opts.end() && it->second) {
                version = cardano::tx_hash::from_hex(*it->second);
            } else if (const auto latest = qs.versions.latest(); latest) {
                version = latest->tx;
            } else {
                throw error("no protocol version has been observed yet");
            }
            if (opts.contains("chain")) {
                json::array keys {};
                for (const auto &key: qs.registry.chain(version))
                    keys.emplace_back(fmt::format("{}", buffer_lowercase { key.data(), key.size() }));
                common::print_json(keys);
                return;
            }
            if (opts.contains("all"))
                common::print_json(common::rows_to_json(qs.registry.all_nodes(version)));
            else
                common::print_json(common::rows_to_json(qs.registry.registered_tokens(version)));
            logger::info("protocol version {} has {} registered tokens", version, qs.registry.count(version));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
