/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_STORE_BASE_HPP
#define PROGRAMMABLE_TOKENS_STORE_BASE_HPP

#include <pt/store/types.hpp>

namespace programmable_tokens::store {
    using protocol_version_list = vector<protocol_version>;
    using registry_row_list = vector<registry_row>;
    using balance_row_list = vector<balance_row>;

    // Durable storage of the three append-only logs.
    // All add_ methods are idempotent by the natural key of a row and return false when the row is already known.
    // All queries return rows in their append order unless stated otherwise.
    struct base {
        virtual ~base() =default;

        virtual bool add_version(const protocol_version &ver) =0;
        virtual protocol_version_list versions() const =0;
        virtual bool has_version(const tx_hash &tx) const =0;

        virtual bool add_registry(const registry_row &row) =0;
        virtual bool has_registry(const registry_row_id &id) const =0;
        virtual registry_row_list registry_rows() const =0;
        virtual registry_row_list registry_rows(const tx_hash &version) const =0;

        virtual bool add_balance(const balance_row &row) =0;
        virtual bool has_balance(const balance_row_id &id) const =0;
        virtual std::optional<balance_row> latest_balance(buffer address) const =0;
        // newest first, a zero limit returns all rows
        virtual balance_row_list balance_history(buffer address, size_t limit=0) const =0;
        virtual balance_row_list balances_by_tx(const tx_hash &tx) const =0;
        virtual balance_row_list balance_rows() const =0;
    };
}

#endif // !PROGRAMMABLE_TOKENS_STORE_BASE_HPP
