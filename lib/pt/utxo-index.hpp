/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_UTXO_INDEX_HPP
#define PROGRAMMABLE_TOKENS_UTXO_INDEX_HPP

#include <memory>
#include <pt/event.hpp>
#include <pt/file.hpp>
#include <pt/mutex.hpp>

namespace programmable_tokens {
    // payment credentials whose outputs carry programmable tokens
    using tracked_credentials = set<cardano::key_hash>;
}

namespace programmable_tokens::utxo {
    bool is_tracked(const cardano::address &addr, const tracked_credentials &tracked);

    struct entry {
        cardano::address address;
        cardano::value_map amounts {};
    };

    struct index {
        virtual ~index() =default;
        virtual std::optional<entry> lookup(const cardano::tx_out_ref &ref) const =0;

        // called once a transaction is applied so that the following ones can spend its outputs
        virtual void observe(const transaction &, const tracked_credentials &)
        {
        }
    };

    struct index_memory: index {
        std::optional<entry> lookup(const cardano::tx_out_ref &ref) const override;
        // only the outputs at tracked payment credentials are kept
        void observe(const transaction &tx, const tracked_credentials &tracked) override;
        virtual void add(const cardano::tx_out_ref &ref, const entry &e);
        size_t size() const;
    private:
        alignas(mutex::alignment) mutable mutex::mutex_type _mutex {};
        map<cardano::tx_out_ref, entry> _entries {};
    };

    // Persists observed outputs to a CBOR log in the data directory
    struct index_file: index_memory {
        static constexpr std::string_view file_name { "utxos.cbor" };

        explicit index_file(const std::string &data_dir);
        void add(const cardano::tx_out_ref &ref, const entry &e) override;
    private:
        alignas(mutex::alignment) mutable mutex::mutex_type _write_mutex {};
        std::unique_ptr<file::append_stream> _os {};
    };
}

#endif // !PROGRAMMABLE_TOKENS_UTXO_INDEX_HPP
