/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_EVENT_HPP
#define PROGRAMMABLE_TOKENS_EVENT_HPP

#include <optional>
#include <pt/cardano/value.hpp>
#include <pt/json.hpp>

namespace programmable_tokens {
    struct tx_output {
        cardano::address address;
        cardano::value_map amounts {};
        std::optional<uint8_vector> datum {};
    };
    using tx_output_list = vector<tx_output>;

    struct transaction {
        cardano::tx_hash hash {};
        vector<cardano::tx_out_ref> inputs {};
        tx_output_list outputs {};
        // the declaration order is preserved as the first matching entry decides the transaction kind
        cardano::asset_list mint {};
    };
    using transaction_list = vector<transaction>;

    // The effects of a block delivered by an external event source
    struct block_batch {
        uint64_t slot = 0;
        uint64_t height = 0;
        transaction_list txs {};

        static block_batch from_json(const json::value &j);
    };
    using block_batch_list = vector<block_batch>;

    // Parses a JSON array of batches, hashes, addresses and datums being hex strings
    // and quantities being decimal strings or integers
    extern block_batch_list load_batches(const json::value &j);
    extern block_batch_list load_batches(const std::string &path);
}

#endif // !PROGRAMMABLE_TOKENS_EVENT_HPP
