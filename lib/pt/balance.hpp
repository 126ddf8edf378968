/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_BALANCE_HPP
#define PROGRAMMABLE_TOKENS_BALANCE_HPP

#include <functional>
#include <pt/event.hpp>
#include <pt/mutex.hpp>
#include <pt/store/base.hpp>
#include <pt/utxo-index.hpp>

namespace programmable_tokens {
    // An append-only log of multi-asset balances of the addresses whose payment credential is tracked
    struct balance_ledger {
        // The first mint entry with a policy present in the net change decides the kind
        static store::tx_kind classify(const cardano::asset_list &mint, const cardano::value_map &net_change);

        explicit balance_ledger(store::base &st);

        // Folds the net effect of the transaction on each tracked address. Returns the number of appended rows.
        size_t apply(const transaction &tx, uint64_t slot, uint64_t height, const tracked_credentials &tracked, const utxo::index &utxos);
        bool append(const cardano::address &addr, const cardano::tx_hash &tx, uint64_t slot, uint64_t height,
            const cardano::value_map &snapshot, store::tx_kind kind, const cardano::value_map &diff);

        cardano::value_map previous_balance(buffer address) const;

        cardano::value_map current_balance(buffer address) const
        {
            return previous_balance(address);
        }

        std::optional<store::balance_row> latest(buffer address) const;
        // newest first, a zero limit returns the whole history
        store::balance_row_list history(buffer address, size_t limit=0) const;
        store::balance_row_list by_tx(const cardano::tx_hash &tx) const;
        store::balance_row_list latest_by_payment_credential(const cardano::key_hash &hash) const;
        store::balance_row_list latest_by_stake_credential(const cardano::key_hash &hash) const;
    private:
        store::base &_store;
        alignas(mutex::alignment) mutable mutex::mutex_type _apply_mutex {};

        store::balance_row_list _latest_where(const std::function<bool(const store::balance_row &)> &pred) const;
    };
}

#endif // !PROGRAMMABLE_TOKENS_BALANCE_HPP
