/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_PROTOCOL_VERSIONS_HPP
#define PROGRAMMABLE_TOKENS_PROTOCOL_VERSIONS_HPP

#include <memory>
#include <pt/mutex.hpp>
#include <pt/store/base.hpp>

namespace programmable_tokens {
    // The catalogue of deployed protocol configurations sorted by slot.
    // Readers work with an immutable snapshot that a writer replaces as a whole.
    struct protocol_version_registry {
        using snapshot_ptr = std::shared_ptr<const store::protocol_version_list>;

        explicit protocol_version_registry(store::base &st);

        // returns the existing entry when a version with the same tx hash is already known
        store::protocol_version save(const store::protocol_version &ver);
        std::optional<store::protocol_version> latest() const;
        std::optional<store::protocol_version> valid_at_slot(uint64_t slot) const;
        std::optional<store::protocol_version> by_tx_hash(const cardano::tx_hash &tx) const;
        std::optional<store::protocol_version> by_slot(uint64_t slot) const;
        bool exists(const cardano::tx_hash &tx) const;
        // all versions deployed at or before the slot
        store::protocol_version_list known_at_slot(uint64_t slot) const;
        snapshot_ptr all() const;
    private:
        store::base &_store;
        alignas(mutex::alignment) mutable mutex::mutex_type _write_mutex {};
        alignas(mutex::alignment) mutable mutex::mutex_type _snapshot_mutex {};
        snapshot_ptr _snapshot;
    };
}

#endif // !PROGRAMMABLE_TOKENS_PROTOCOL_VERSIONS_HPP
