/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/datum.hpp>
#include <pt/indexer.hpp>
#include <pt/store/file.hpp>
#include <pt/store/memory.hpp>
#include <pt/test.hpp>

using namespace programmable_tokens;
using namespace programmable_tokens::cardano;

namespace {
    key_hash filled(const uint8_t b)
    {
        key_hash h {};
        h.fill(b);
        return h;
    }

    tx_hash tx_id(const uint8_t b)
    {
        tx_hash h {};
        h.fill(b);
        return h;
    }

    const auto logic_cred = filled(0xCC);
    const auto registry_policy = filled(0x99);
    const auto params_policy = filled(0x77);
    const auto token_policy = filled(0xEE);
    const auto token = make_unit(token_policy, std::string_view { "TOK" });
    const std::string ada { lovelace_unit };
    const address script_addr { uint8_vector::from_hex("7188888888888888888888888888888888888888888888888888888888") };
    const address outsider { uint8_vector::from_hex("61DDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDD") };

    address programmable_address(const uint8_t stake)
    {
        uint8_vector bytes {};
        bytes << uint8_t { 0x11 } << logic_cred << filled(stake);
        return address { bytes };
    }

    const auto alice = programmable_address(0xA1);
    const auto bob = programmable_address(0xB2);

    value_map make_value(const std::initializer_list<std::pair<std::string, int64_t>> items)
    {
        value_map v {};
        for (const auto &[unit, qty]: items)
            v.add(unit, qty);
        return v;
    }

    transaction deploy_tx(const uint8_t id=0xD1)
    {
        transaction tx { tx_id(id) };
        const datum::protocol_params params { registry_policy, logic_cred };
        tx.outputs.emplace_back(tx_output {
            script_addr,
            make_value({ { ada, 2'000'000 }, { make_unit(params_policy, std::string_view { "ProtocolParams" }), 1 } }),
            params.to_data().as_cbor()
        });
        return tx;
    }

    tx_output registry_output(const datum::registry_node &node)
    {
        return tx_output {
            script_addr,
            make_value({ { ada, 1'500'000 }, { make_unit(registry_policy, node.key), 1 } }),
            node.to_data().as_cbor()
        };
    }

    // registers the token policy and mints 100 tokens to alice
    transaction register_tx()
    {
        transaction tx { tx_id(0x02) };
        datum::registry_node sentinel {};
        sentinel.next = token_policy;
        sentinel.transfer_logic = uint8_vector::from_hex("01");
        sentinel.third_party_logic = uint8_vector::from_hex("02");
        datum::registry_node node {};
        node.key = token_policy;
        node.transfer_logic = uint8_vector::from_hex("03");
        node.third_party_logic = uint8_vector::from_hex("04");
        tx.outputs.emplace_back(registry_output(sentinel));
        tx.outputs.emplace_back(registry_output(node));
        tx.outputs.emplace_back(tx_output { alice, make_value({ { ada, 1'000'000 }, { token, 100 } }) });
        tx.mint.emplace_back(asset_amount { token, 100 });
        return tx;
    }

    transaction transfer_tx()
    {
        transaction tx { tx_id(0x03) };
        tx.inputs.emplace_back(tx_out_ref { tx_id(0x02), 2 });
        tx.outputs.emplace_back(tx_output { bob, make_value({ { ada, 1'000'000 }, { token, 30 } }) });
        tx.outputs.emplace_back(tx_output { alice, make_value({ { ada, 900'000 }, { token, 70 } }) });
        return tx;
    }

    block_batch_list scenario()
    {
        return {
            block_batch { 100, 5, { deploy_tx() } },
            block_batch { 200, 10, { register_tx() } },
            block_batch { 300, 15, { transfer_tx() } }
        };
    }
}

suite indexer_suite = [] {
    "indexer"_test = [] {
        "deployment, registration and transfers"_test = [] {
            store::memory db {};
            utxo::index_memory utxos {};
            indexer idx { db, utxos };
            const auto batches = scenario();
            const auto s1 = idx.process(batches.at(0));
            test_same(s1.versions, 1ULL);
            const auto ver = idx.versions().latest();
            expect(fatal(ver.has_value()));
            test_same(ver->tx, tx_id(0xD1));
            test_same(ver->slot, 100ULL);
            test_same(ver->registry_policy, registry_policy);
            test_same(ver->base_credential, logic_cred);

            const auto s2 = idx.process(batches.at(1));
            test_same(s2.registry_rows, 2ULL);
            test_same(s2.balance_rows, 1ULL);
            test_same(s2.failures, 0ULL);
            test_same(registry_key_list { uint8_vector { token_policy } }, idx.registry().chain(ver->tx));
            expect(idx.registry().is_registered(token_policy));
            const auto minted = idx.ledger().latest(alice.bytes());
            expect(fatal(minted.has_value()));
            expect(minted->kind == store::tx_kind::mint);

            const auto s3 = idx.process(batches.at(2));
            test_same(s3.balance_rows, 2ULL);
            expect(idx.ledger().current_balance(alice.bytes()) == make_value({ { ada, 900'000 }, { token, 70 } }));
            expect(idx.ledger().current_balance(bob.bytes()) == make_value({ { ada, 1'000'000 }, { token, 30 } }));
            expect(idx.ledger().latest(bob.bytes())->kind == store::tx_kind::transfer);
            expect(!idx.ledger().latest(script_addr.bytes()));
            expect(idx.last_slot() == 300ULL);
            test_same(utxos.size(), 3ULL);
        };
        "nothing is tracked before a deployment"_test = [] {
            store::memory db {};
            utxo::index_memory utxos {};
            indexer idx { db, utxos };
            transaction early { tx_id(0x05) };
            early.outputs.emplace_back(tx_output { alice, make_value({ { ada, 5'000'000 }, { token, 5 } }) });
            const auto stats = idx.process(block_batch { 50, 2, { early } });
            test_same(stats.balance_rows, 0ULL);
            test_same(stats.registry_rows, 0ULL);
            test_same(utxos.size(), 0ULL);
            expect(db.balance_rows().empty());
            expect(!idx.versions().latest());
        };
        "a deployment applies from its own batch"_test = [] {
            store::memory db {};
            utxo::index_memory utxos {};
            indexer idx { db, utxos };
            auto tx = register_tx();
            const auto stats = idx.process(block_batch { 100, 5, { deploy_tx(), tx } });
            test_same(stats.versions, 1ULL);
            test_same(stats.registry_rows, 2ULL);
            test_same(stats.balance_rows, 1ULL);
        };
        "an undecodable registry datum is skipped"_test = [] {
            store::memory db {};
            utxo::index_memory utxos {};
            indexer idx { db, utxos };
            idx.process(block_batch { 100, 5, { deploy_tx() } });
            auto tx = register_tx();
            tx.outputs.at(1).datum = uint8_vector::from_hex("d87980");
            const auto stats = idx.process(block_batch { 200, 10, { tx } });
            test_same(stats.registry_rows, 1ULL);
            test_same(stats.failures, 0ULL);
            test_same(stats.balance_rows, 1ULL);
        };
        "only listed transactions deploy versions"_test = [] {
            indexer_config cfg {};
            cfg.deployment_txs.emplace(set<tx_hash> { tx_id(0xD2) });
            store::memory db {};
            utxo::index_memory utxos {};
            indexer idx { db, utxos, cfg };
            const auto s1 = idx.process(block_batch { 100, 5, { deploy_tx(0xD1) } });
            test_same(s1.versions, 0ULL);
            const auto s2 = idx.process(block_batch { 110, 6, { deploy_tx(0xD2) } });
            test_same(s2.versions, 1ULL);
            test_same(idx.versions().latest()->tx, tx_id(0xD2));
        };
        "an output without the params asset is not a deployment"_test = [] {
            store::memory db {};
            utxo::index_memory utxos {};
            indexer idx { db, utxos };
            auto tx = deploy_tx();
            tx.outputs.at(0).amounts = make_value({ { ada, 2'000'000 } });
            test_same(idx.process(block_batch { 100, 5, { tx } }).versions, 0ULL);
            auto bad = deploy_tx(0xD3);
            bad.outputs.at(0).datum = uint8_vector::from_hex("d87980");
            test_same(idx.process(block_batch { 110, 6, { bad } }).versions, 0ULL);
            expect(!idx.versions().latest());
        };
        "out of order batches are still applied"_test = [] {
            store::memory db {};
            utxo::index_memory utxos {};
            indexer idx { db, utxos };
            const auto batches = scenario();
            idx.process(batches.at(1));
            test_same(idx.process(batches.at(0)).versions, 1ULL);
            expect(idx.last_slot() == 200ULL);
            idx.process(block_batch { 150, 7, {} });
            expect(idx.last_slot() == 200ULL);
            idx.process(block_batch { 250, 12, {} });
            expect(idx.last_slot() == 250ULL);
        };
        "replay"_test = [] {
            const test_dir dir { "indexer-replay" };
            const auto batches = scenario();
            {
                store::file db { dir.path() };
                utxo::index_file utxos { dir.path() };
                indexer idx { db, utxos };
                for (const auto &b: batches)
                    idx.process(b);
            }
            store::file db { dir.path() };
            const auto num_registry = db.registry_rows().size();
            const auto num_balances = db.balance_rows().size();
            test_same(num_registry, 2ULL);
            test_same(num_balances, 3ULL);
            utxo::index_file utxos { dir.path() };
            test_same(utxos.size(), 3ULL);
            indexer idx { db, utxos };
            expect(idx.last_slot() == 300ULL);
            batch_stats total {};
            for (const auto &b: batches)
                total += idx.process(b);
            test_same(total.versions, 0ULL);
            test_same(total.registry_rows, 0ULL);
            test_same(total.balance_rows, 0ULL);
            test_same(num_registry, db.registry_rows().size());
            test_same(num_balances, db.balance_rows().size());
            expect(idx.ledger().current_balance(alice.bytes()) == make_value({ { ada, 900'000 }, { token, 70 } }));
        };
    };
};
