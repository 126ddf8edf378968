/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_STORE_MEMORY_HPP
#define PROGRAMMABLE_TOKENS_STORE_MEMORY_HPP

#include <pt/mutex.hpp>
#include <pt/store/base.hpp>

namespace programmable_tokens::store {
    struct memory: base {
        bool add_version(const protocol_version &ver) override;
        protocol_version_list versions() const override;
        bool has_version(const tx_hash &tx) const override;

        bool add_registry(const registry_row &row) override;
        bool has_registry(const registry_row_id &id) const override;
        registry_row_list registry_rows() const override;
        registry_row_list registry_rows(const tx_hash &version) const override;

        bool add_balance(const balance_row &row) override;
        bool has_balance(const balance_row_id &id) const override;
        std::optional<balance_row> latest_balance(buffer address) const override;
        balance_row_list balance_history(buffer address, size_t limit=0) const override;
        balance_row_list balances_by_tx(const tx_hash &tx) const override;
        balance_row_list balance_rows() const override;
    private:
        using index_list = vector<size_t>;

        alignas(mutex::alignment) mutable mutex::mutex_type _mutex {};
        protocol_version_list _versions {};
        set<tx_hash> _version_ids {};
        registry_row_list _registry {};
        set<registry_row_id> _registry_ids {};
        map<tx_hash, index_list> _registry_by_version {};
        balance_row_list _balances {};
        set<balance_row_id> _balance_ids {};
        map<uint8_vector, index_list> _balances_by_addr {};
        map<tx_hash, index_list> _balances_by_tx {};
    };
}

#endif // !PROGRAMMABLE_TOKENS_STORE_MEMORY_HPP
