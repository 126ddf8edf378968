/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/balance.hpp>
#include <pt/store/memory.hpp>
#include <pt/test.hpp>

using namespace programmable_tokens;
using namespace programmable_tokens::cardano;

namespace {
    const auto logic_cred = key_hash::from_hex("CCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCC");
    const auto alice_stake = key_hash::from_hex("A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1A1");
    const auto bob_stake = key_hash::from_hex("B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2B2");
    const auto token_policy = policy_id::from_hex("EEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEE");
    const auto token = make_unit(token_policy, std::string_view { "TOK" });
    const std::string ada { lovelace_unit };

    address programmable_address(const key_hash &stake)
    {
        uint8_vector bytes {};
        bytes << uint8_t { 0x11 } << logic_cred << stake;
        return address { bytes };
    }

    const auto alice = programmable_address(alice_stake);
    const auto bob = programmable_address(bob_stake);
    const address outsider { uint8_vector::from_hex("61DDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDD") };
    const tracked_credentials tracked { logic_cred };

    value_map make_value(const int64_t lovelace, const int64_t tokens)
    {
        value_map v {};
        v.add(ada, lovelace);
        v.add(token, tokens);
        return v;
    }

    tx_hash make_hash(const uint8_t id)
    {
        tx_hash h {};
        h.fill(id);
        return h;
    }

    transaction mint_tx()
    {
        transaction tx { make_hash(1) };
        tx.inputs.emplace_back(tx_out_ref { make_hash(0xF0), 0 });
        tx.outputs.emplace_back(tx_output { alice, make_value(2'000'000, 100) });
        tx.outputs.emplace_back(tx_output { outsider, make_value(2'800'000, 0) });
        tx.mint.emplace_back(asset_amount { token, 100 });
        return tx;
    }

    transaction transfer_tx()
    {
        transaction tx { make_hash(2) };
        tx.inputs.emplace_back(tx_out_ref { make_hash(1), 0 });
        tx.outputs.emplace_back(tx_output { bob, make_value(1'500'000, 40) });
        tx.outputs.emplace_back(tx_output { alice, make_value(300'000, 60) });
        return tx;
    }

    transaction burn_tx()
    {
        transaction tx { make_hash(3) };
        tx.inputs.emplace_back(tx_out_ref { make_hash(2), 0 });
        tx.outputs.emplace_back(tx_output { bob, make_value(1'400'000, 30) });
        tx.mint.emplace_back(asset_amount { token, -10 });
        return tx;
    }

    struct ledger_fixture {
        store::memory db {};
        balance_ledger ledger { db };
        utxo::index_memory utxos {};

        ledger_fixture()
        {
            utxos.add(tx_out_ref { make_hash(0xF0), 0 }, utxo::entry { outsider, make_value(5'000'000, 0) });
        }

        size_t apply(const transaction &tx, const uint64_t slot)
        {
            const auto num_rows = ledger.apply(tx, slot, slot / 20, tracked, utxos);
            utxos.observe(tx, tracked);
            return num_rows;
        }
    };
}

suite balance_suite = [] {
    "balance_ledger"_test = [] {
        "mint, transfer and burn"_test = [] {
            ledger_fixture f {};
            test_same(f.apply(mint_tx(), 100), 1ULL);
            {
                const auto row = f.ledger.latest(alice.bytes());
                expect(fatal(row.has_value()));
                expect(row->kind == store::tx_kind::mint);
                expect(row->balance == make_value(2'000'000, 100));
                expect(row->diff == make_value(2'000'000, 100));
                expect(row->pay_cred == logic_cred);
                expect(row->stake_cred == alice_stake);
                test_same(row->slot, 100ULL);
                test_same(row->height, 5ULL);
            }
            test_same(f.apply(transfer_tx(), 200), 2ULL);
            {
                const auto row = f.ledger.latest(alice.bytes());
                expect(fatal(row.has_value()));
                expect(row->kind == store::tx_kind::transfer);
                expect(row->balance == make_value(300'000, 60));
                expect(row->diff == make_value(-1'700'000, -40));
                expect(f.ledger.current_balance(bob.bytes()) == make_value(1'500'000, 40));
            }
            test_same(f.apply(burn_tx(), 300), 1ULL);
            {
                const auto row = f.ledger.latest(bob.bytes());
                expect(fatal(row.has_value()));
                expect(row->kind == store::tx_kind::burn);
                expect(row->balance == make_value(1'400'000, 30));
                expect(row->diff == make_value(-100'000, -10));
            }
            expect(!f.ledger.latest(outsider.bytes()));
        };
        "each row extends the previous one"_test = [] {
            ledger_fixture f {};
            f.apply(mint_tx(), 100);
            f.apply(transfer_tx(), 200);
            f.apply(burn_tx(), 300);
            for (const auto &addr: { alice, bob }) {
                const auto hist = f.ledger.history(addr.bytes());
                value_map prev {};
                for (auto it = hist.rbegin(); it != hist.rend(); ++it) {
                    expect(prev + it->diff == it->balance);
                    prev = it->balance;
                }
            }
        };
        "history"_test = [] {
            ledger_fixture f {};
            f.apply(mint_tx(), 100);
            f.apply(transfer_tx(), 200);
            const auto hist = f.ledger.history(alice.bytes());
            test_same(hist.size(), 2ULL);
            test_same(hist.at(0).tx, make_hash(2));
            test_same(hist.at(1).tx, make_hash(1));
            test_same(f.ledger.history(alice.bytes(), 1).size(), 1ULL);
            test_same(f.ledger.by_tx(make_hash(2)).size(), 2ULL);
            test_same(f.ledger.by_tx(make_hash(3)).size(), 0ULL);
        };
        "repeated transactions are ignored"_test = [] {
            ledger_fixture f {};
            f.apply(mint_tx(), 100);
            f.apply(transfer_tx(), 200);
            test_same(f.apply(transfer_tx(), 200), 0ULL);
            test_same(f.apply(mint_tx(), 100), 0ULL);
            test_same(f.db.balance_rows().size(), 3ULL);
            expect(f.ledger.current_balance(alice.bytes()) == make_value(300'000, 60));
        };
        "unknown inputs count as zero"_test = [] {
            ledger_fixture f {};
            transaction tx { make_hash(7) };
            tx.inputs.emplace_back(tx_out_ref { make_hash(0xEE), 3 });
            tx.outputs.emplace_back(tx_output { alice, make_value(1'000'000, 5) });
            test_same(f.apply(tx, 100), 1ULL);
            expect(f.ledger.current_balance(alice.bytes()) == make_value(1'000'000, 5));
        };
        "a self transfer records an unchanged balance"_test = [] {
            ledger_fixture f {};
            f.apply(mint_tx(), 100);
            transaction tx { make_hash(8) };
            tx.inputs.emplace_back(tx_out_ref { make_hash(1), 0 });
            tx.outputs.emplace_back(tx_output { alice, make_value(2'000'000, 100) });
            test_same(f.apply(tx, 200), 1ULL);
            const auto row = f.ledger.latest(alice.bytes());
            expect(fatal(row.has_value()));
            expect(row->diff.empty());
            expect(row->balance == make_value(2'000'000, 100));
        };
        "untracked credentials"_test = [] {
            ledger_fixture f {};
            test_same(f.ledger.apply(mint_tx(), 100, 5, tracked_credentials {}, f.utxos), 0ULL);
            test_same(f.ledger.apply(mint_tx(), 100, 5, tracked_credentials { alice_stake }, f.utxos), 0ULL);
            expect(f.db.balance_rows().empty());
        };
        "credential queries"_test = [] {
            ledger_fixture f {};
            f.apply(mint_tx(), 100);
            f.apply(transfer_tx(), 200);
            const auto by_pay = f.ledger.latest_by_payment_credential(logic_cred);
            test_same(by_pay.size(), 2ULL);
            for (const auto &row: by_pay)
                test_same(row.tx, make_hash(2));
            const auto by_stake = f.ledger.latest_by_stake_credential(alice_stake);
            test_same(by_stake.size(), 1ULL);
            expect(by_stake.at(0).balance == make_value(300'000, 60));
            expect(f.ledger.latest_by_stake_credential(logic_cred).empty());
        };
        "classify"_test = [] {
            policy_id other_policy {};
            other_policy.fill(0x01);
            const auto other = make_unit(other_policy, std::string_view { "X" });
            expect(balance_ledger::classify({}, make_value(1, 1)) == store::tx_kind::transfer);
            expect(balance_ledger::classify({ { other, 5 } }, make_value(1, 1)) == store::tx_kind::transfer);
            expect(balance_ledger::classify({ { token, 5 } }, make_value(1, 0)) == store::tx_kind::transfer);
            expect(balance_ledger::classify({ { token, 5 } }, make_value(0, 5)) == store::tx_kind::mint);
            expect(balance_ledger::classify({ { other, 5 }, { token, -3 } }, make_value(0, -3)) == store::tx_kind::burn);
            expect(balance_ledger::classify({ { token, -3 }, { token, 5 } }, make_value(0, 2)) == store::tx_kind::burn);
        };
    };
};
