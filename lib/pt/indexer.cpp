/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/datum.hpp>
#include <pt/indexer.hpp>
#include <pt/logger.hpp>
#include <pt/timer.hpp>

namespace programmable_tokens {
    namespace {
        template<typename T>
        void update_max_slot(std::optional<uint64_t> &max_slot, const vector<T> &rows)
        {
            for (const auto &r: rows) {
                if (!max_slot || r.slot > *max_slot)
                    max_slot = r.slot;
            }
        }

        std::optional<uint64_t> max_logged_slot(const store::base &st)
        {
            std::optional<uint64_t> max_slot {};
            update_max_slot(max_slot, st.versions());
            update_max_slot(max_slot, st.registry_rows());
            update_max_slot(max_slot, st.balance_rows());
            return max_slot;
        }
    }

    indexer_config indexer_config::from_config(const config &cfg)
    {
        indexer_config res {};
        if (const auto *j_network = cfg.find("network"); j_network)
            res.network = static_cast<std::string_view>(j_network->as_string());
        if (const auto *j_txs = cfg.find("transaction_ids"); j_txs && !j_txs->is_null()) {
            auto &txs = res.deployment_txs.emplace();
            for (const auto &j_tx: j_txs->as_array())
                txs.emplace(cardano::tx_hash::from_hex(static_cast<std::string_view>(j_tx.as_string())));
        }
        if (const auto *j_name = cfg.find("params_asset_name"); j_name)
            res.params_asset_name = static_cast<std::string_view>(j_name->as_string());
        return res;
    }

    indexer_config indexer_config::from_configs(const configs &cfgs)
    {
        if (!cfgs.contains("indexer")) {
            logger::warn("no indexer configuration found, using the defaults");
            return {};
        }
        return from_config(cfgs.at("indexer"));
    }

    indexer::indexer(store::base &st, utxo::index &utxos, indexer_config cfg):
        _cfg { std::move(cfg) }, _utxos { utxos }, _versions { st }, _registry { st }, _ledger { st },
        _last_slot { max_logged_slot(st) }
    {
        if (_last_slot)
            logger::info("the last slot recorded in the logs: {}", *_last_slot);
        logger::info("indexer network: {} deployment txs: {} params asset name: {}",
            _cfg.network, _cfg.deployment_txs ? fmt::format("{}", _cfg.deployment_txs->size()) : std::string { "any" }, _cfg.params_asset_name);
    }

    bool indexer::_is_deployment(const transaction &tx, const tx_output &out) const
    {
        if (_cfg.deployment_txs && !_cfg.deployment_txs->contains(tx.hash))
            return false;
        if (!out.datum)
            return false;
        const buffer marker { _cfg.params_asset_name };
        for (const auto &[unit, qty]: out.amounts) {
            if (unit != cardano::lovelace_unit && cardano::unit_asset_name(unit) == marker)
                return true;
        }
        return false;
    }

    size_t indexer::_apply_registry_output(const transaction &tx, const size_t out_idx, const block_batch &batch,
        const map<cardano::policy_id, cardano::tx_hash> &registry_policies)
    {
        const auto &out = tx.outputs.at(out_idx);
        if (!out.datum)
            return 0;
        std::optional<cardano::tx_hash> version {};
        size_t num_marked = 0;
        for (const auto &[unit, qty]: out.amounts) {
            const auto policy = cardano::unit_policy(unit);
            if (!policy)
                continue;
            if (const auto it = registry_policies.find(*policy); it != registry_policies.end()) {
                ++num_marked;
                if (qty == 1)
                    version = it->second;
            }
        }
        if (!version || num_marked != 1)
            return 0;
        const auto node = datum::decode_registry_node(*out.datum);
        if (!node) {
            logger::warn("tx {} output #{}: a registry output with an undecodable datum is skipped", tx.hash, out_idx);
            return 0;
        }
        store::registry_row row {};
        row.version = *version;
        row.key = node->key;
        row.next = node->next;
        row.transfer_logic = node->transfer_logic;
        row.third_party_logic = node->third_party_logic;
        row.global_state_policy = node->global_state_policy;
        row.tx = tx.hash;
        row.slot = batch.slot;
        row.height = batch.height;
        return _registry.apply(row);
    }

    batch_stats indexer::process(const block_batch &batch)
    {
        timer t { fmt::format("process the batch at slot {}", batch.slot), logger::level::debug };
        if (_last_slot && batch.slot <= *_last_slot)
            logger::error("ordering violation: the batch slot {} is not greater than the last processed slot {}", batch.slot, *_last_slot);
        else
            _last_slot = batch.slot;

        batch_stats stats {};
        stats.txs = batch.txs.size();
        for (const auto &tx: batch.txs) {
            for (const auto &out: tx.outputs) {
                const auto ex = logger::run_log_errors([&] {
                    if (!_is_deployment(tx, out))
                        return;
                    const auto params = datum::decode_protocol_params(*out.datum);
                    if (!params) {
                        logger::warn("tx {}: a protocol params output with an undecodable datum is skipped", tx.hash);
                        return;
                    }
                    if (_versions.exists(tx.hash))
                        return;
                    _versions.save(store::protocol_version { tx.hash, batch.slot, batch.height, params->registry_policy, params->base_credential });
                    ++stats.versions;
                });
                if (ex)
                    ++stats.failures;
            }
        }

        const auto known = _versions.known_at_slot(batch.slot);
        if (known.empty())
            logger::debug("no protocol version is known at slot {}: skipping the registry and the balances", batch.slot);
        tracked_credentials tracked {};
        map<cardano::policy_id, cardano::tx_hash> registry_policies {};
        for (const auto &ver: known) {
            tracked.emplace(ver.base_credential);
            registry_policies.insert_or_assign(ver.registry_policy, ver.tx);
        }

        for (const auto &tx: batch.txs) {
            if (!known.empty()) {
                for (size_t i = 0; i < tx.outputs.size(); ++i) {
                    const auto ex = logger::run_log_errors([&] {
                        stats.registry_rows += _apply_registry_output(tx, i, batch, registry_policies);
                    });
                    if (ex)
                        ++stats.failures;
                }
                const auto ex = logger::run_log_errors([&] {
                    stats.balance_rows += _ledger.apply(tx, batch.slot, batch.height, tracked, _utxos);
                });
                if (ex)
                    ++stats.failures;
            }
            if (logger::run_log_errors([&] { _utxos.observe(tx, tracked); }))
                ++stats.failures;
        }
        logger::debug("slot {}: {}", batch.slot, stats);
        return stats;
    }
}
