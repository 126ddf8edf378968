/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_REGISTRY_HPP
#define PROGRAMMABLE_TOKENS_REGISTRY_HPP

#include <pt/mutex.hpp>
#include <pt/store/base.hpp>

namespace programmable_tokens {
    using registry_key = uint8_vector;
    using registry_key_list = vector<registry_key>;

    // The keys that must have left the list when a node's next pointer moves from old_target to new_target.
    // As a target, an empty key is the tail of the list and sorts after every other key.
    // As a member of active_keys, an empty key is the head and is never reported.
    extern registry_key_list orphaned_keys(buffer old_target, buffer new_target, const registry_key_list &active_keys);

    // Mirrors the on-chain sorted linked lists of registered token policies, one per protocol version.
    struct token_registry {
        explicit token_registry(store::base &st);

        // Records an observed node state together with the deletions that it implies.
        // A repeated observation only appends the implied deletions that are still missing.
        // Returns the number of newly appended rows.
        size_t apply(const store::registry_row &row);
        bool insert(const store::registry_row &row);

        store::registry_row_list registered_tokens(const cardano::tx_hash &version) const;
        store::registry_row_list all_nodes(const cardano::tx_hash &version) const;
        store::registry_row_list history(const cardano::tx_hash &version) const;
        std::optional<store::registry_row> find(const cardano::tx_hash &version, buffer key) const;
        bool is_registered(buffer policy) const;
        size_t count(const cardano::tx_hash &version) const;
        // the active keys in the list order, throws if the list has a gap, a cycle or is misordered
        registry_key_list chain(const cardano::tx_hash &version) const;
    private:
        using key_map = map<registry_key, store::registry_row>;

        store::base &_store;
        alignas(mutex::alignment) mutable mutex::mutex_type _apply_mutex {};
        alignas(mutex::alignment) mutable mutex::mutex_type _cache_mutex {};
        map<cardano::tx_hash, key_map> _latest {};

        void _cache(const store::registry_row &row);
        // the latest state of the row's key recorded before the row itself
        std::optional<store::registry_row> _previous_state(const store::registry_row &row) const;
        bool _insert(const store::registry_row &row);
    };
}

#endif // !PROGRAMMABLE_TOKENS_REGISTRY_HPP
