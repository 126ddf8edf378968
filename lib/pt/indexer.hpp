/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_INDEXER_HPP
#define PROGRAMMABLE_TOKENS_INDEXER_HPP

#include <pt/balance.hpp>
#include <pt/config.hpp>
#include <pt/protocol-versions.hpp>
#include <pt/registry.hpp>

namespace programmable_tokens {
    struct indexer_config {
        std::string network { "mainnet" };
        // when present, only outputs of these transactions can deploy a protocol version
        std::optional<set<cardano::tx_hash>> deployment_txs {};
        std::string params_asset_name { "ProtocolParams" };

        static indexer_config from_config(const config &cfg);
        static indexer_config from_configs(const configs &cfgs);
    };

    struct batch_stats {
        size_t txs = 0;
        size_t versions = 0;
        size_t registry_rows = 0;
        size_t balance_rows = 0;
        size_t failures = 0;

        batch_stats &operator+=(const batch_stats &o)
        {
            txs += o.txs;
            versions += o.versions;
            registry_rows += o.registry_rows;
            balance_rows += o.balance_rows;
            failures += o.failures;
            return *this;
        }
    };

    // Applies batches one at a time: protocol versions first, then the token registry and the balance ledger
    struct indexer {
        indexer(store::base &st, utxo::index &utxos, indexer_config cfg={});
        batch_stats process(const block_batch &batch);

        const protocol_version_registry &versions() const
        {
            return _versions;
        }

        const token_registry &registry() const
        {
            return _registry;
        }

        const balance_ledger &ledger() const
        {
            return _ledger;
        }

        // the highest slot processed so far or found in the reloaded logs
        std::optional<uint64_t> last_slot() const
        {
            return _last_slot;
        }
    private:
        const indexer_config _cfg;
        utxo::index &_utxos;
        protocol_version_registry _versions;
        token_registry _registry;
        balance_ledger _ledger;
        std::optional<uint64_t> _last_slot {};

        bool _is_deployment(const transaction &tx, const tx_output &out) const;
        size_t _apply_registry_output(const transaction &tx, size_t out_idx, const block_batch &batch,
            const map<cardano::policy_id, cardano::tx_hash> &registry_policies);
    };
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::batch_stats>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "txs: {} versions: {} registry rows: {} balance rows: {} failures: {}",
                v.txs, v.versions, v.registry_rows, v.balance_rows, v.failures);
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_INDEXER_HPP
