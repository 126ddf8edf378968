/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/balance.hpp>
#include <pt/logger.hpp>

namespace programmable_tokens {
    namespace {
        struct address_change {
            cardano::address address;
            cardano::value_map net {};
        };
    }

    store::tx_kind balance_ledger::classify(const cardano::asset_list &mint, const cardano::value_map &net_change)
    {
        const auto policies = net_change.policies();
        for (const auto &m: mint) {
            const auto policy = cardano::unit_policy(m.unit);
            if (policy && policies.contains(*policy))
                return m.quantity > 0 ? store::tx_kind::mint : store::tx_kind::burn;
        }
        return store::tx_kind::transfer;
    }

    balance_ledger::balance_ledger(store::base &st): _store { st }
    {
    }

    size_t balance_ledger::apply(const transaction &tx, const uint64_t slot, const uint64_t height,
        const tracked_credentials &tracked, const utxo::index &utxos)
    {
        if (tracked.empty())
            return 0;
        map<uint8_vector, address_change> changes {};
        for (const auto &in: tx.inputs) {
            const auto prev = utxos.lookup(in);
            if (!prev) {
                logger::debug("tx {}: the spent output {} is not a known tracked output and is counted as zero", tx.hash, in);
                continue;
            }
            if (utxo::is_tracked(prev->address, tracked)) {
                auto [it, created] = changes.try_emplace(uint8_vector { prev->address.bytes() }, address_change { prev->address });
                it->second.net -= prev->amounts;
            }
        }
        for (const auto &out: tx.outputs) {
            if (utxo::is_tracked(out.address, tracked)) {
                auto [it, created] = changes.try_emplace(uint8_vector { out.address.bytes() }, address_change { out.address });
                it->second.net += out.amounts;
            }
        }
        mutex::scoped_lock lk { _apply_mutex };
        size_t num_added = 0;
        for (const auto &[addr_bytes, change]: changes) {
            if (_store.has_balance(store::balance_row_id { addr_bytes, tx.hash })) {
                logger::debug("the balance of {} after tx {} has already been recorded", change.address, tx.hash);
                continue;
            }
            const auto kind = classify(tx.mint, change.net);
            const auto snapshot = previous_balance(addr_bytes) + change.net;
            if (append(change.address, tx.hash, slot, height, snapshot, kind, change.net)) {
                logger::info("tx {} {}: the balance of {} is {}", tx.hash, kind, change.address, snapshot);
                ++num_added;
            }
        }
        return num_added;
    }

    bool balance_ledger::append(const cardano::address &addr, const cardano::tx_hash &tx, const uint64_t slot, const uint64_t height,
        const cardano::value_map &snapshot, const store::tx_kind kind, const cardano::value_map &diff)
    {
        store::balance_row row {};
        row.address = addr.bytes();
        if (const auto pay_id = addr.pay_id(); pay_id)
            row.pay_cred = pay_id->hash;
        if (const auto stake_id = addr.stake_id(); stake_id)
            row.stake_cred = stake_id->hash;
        row.tx = tx;
        row.slot = slot;
        row.height = height;
        row.balance = snapshot;
        row.diff = diff;
        row.kind = kind;
        return _store.add_balance(row);
    }

    cardano::value_map balance_ledger::previous_balance(const buffer address) const
    {
        if (auto row = _store.latest_balance(address); row)
            return std::move(row->balance);
        return {};
    }

    std::optional<store::balance_row> balance_ledger::latest(const buffer address) const
    {
        return _store.latest_balance(address);
    }

    store::balance_row_list balance_ledger::history(const buffer address, const size_t limit) const
    {
        return _store.balance_history(address, limit);
    }

    store::balance_row_list balance_ledger::by_tx(const cardano::tx_hash &tx) const
    {
        return _store.balances_by_tx(tx);
    }

    store::balance_row_list balance_ledger::latest_by_payment_credential(const cardano::key_hash &hash) const
    {
        return _latest_where([&](const auto &row) { return row.pay_cred == hash; });
    }

    store::balance_row_list balance_ledger::latest_by_stake_credential(const cardano::key_hash &hash) const
    {
        return _latest_where([&](const auto &row) { return row.stake_cred == hash; });
    }

    store::balance_row_list balance_ledger::_latest_where(const std::function<bool(const store::balance_row &)> &pred) const
    {
        map<uint8_vector, store::balance_row> latest {};
        for (const auto &row: _store.balance_rows()) {
            if (pred(row))
                latest.insert_or_assign(row.address, row);
        }
        store::balance_row_list res {};
        res.reserve(latest.size());
        for (auto &&[addr, row]: latest)
            res.emplace_back(std::move(row));
        return res;
    }
}
