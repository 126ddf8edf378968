/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli/common.hpp>

namespace programmable_tokens::cli::versions {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "versions";
            cmd.desc = "show the known protocol versions";
            cmd.args.expect({ "<data-dir>" });
            cmd.opts.try_emplace("slot", option_config { "show only the version valid at the given slot", {}, validate_uint });
            cmd.opts.try_emplace("tx", option_config { "show only the version deployed by the given transaction" });
            cmd.opts.try_emplace("latest", option_config { "show only the latest version" });
        }

        void run(const arguments &args, const options &opts) const override
        {
            common::query_state qs { args.at(0) };
            std::optional<store::protocol_version> ver {};
            if (const auto slot = common::uint_opt(opts, "slot"); slot) {
                ver = qs.versions.valid_at_slot(*slot);
            } else if (const auto it = opts.find("tx"); it != opts.end() && it->second) {
                ver = qs.versions.by_tx_hash(cardano::tx_hash::from_hex(*it->second));
            } else if (opts.contains("latest")) {
                ver = qs.versions.latest();
            } else {
                common::print_json(common::rows_to_json(*qs.versions.all()));
                return;
            }
            if (!ver)
                throw error("no matching protocol version");
            common::print_json(ver->to_json());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
