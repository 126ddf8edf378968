/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli/common.hpp>
#include <pt/indexer.hpp>
#include <pt/utxo-index.hpp>

namespace programmable_tokens::cli::replay {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "replay";
            cmd.desc = "apply the batches from JSON event files to the data directory";
            cmd.args.expect({ "<data-dir>", "<events.json>", "[<events.json> ...]" });
            cmd.args.max = std::numeric_limits<size_t>::max();
        }

        void run(const arguments &args, const options &) const override
        {
            const auto &data_dir = args.at(0);
            const auto cfg = indexer_config::from_configs(configs_dir::get());
            store::file st { data_dir };
            utxo::index_file utxos { data_dir };
            indexer idx { st, utxos, cfg };
            batch_stats total {};
            for (size_t i = 1; i < args.size(); ++i) {
                const auto batches = load_batches(args[i]);
                timer t { fmt::format("replay {} batches from {}", batches.size(), args[i]), logger::level::info };
                for (const auto &batch: batches)
                    total += idx.process(batch);
            }
            logger::info("replay complete: {}", total);
            if (const auto latest = idx.versions().latest(); latest)
                logger::info("the latest protocol version: {}", *latest);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
