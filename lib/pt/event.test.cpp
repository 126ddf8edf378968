/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/event.hpp>
#include <pt/test.hpp>

using namespace programmable_tokens;

namespace {
    block_batch_list parse_batches(const std::string_view text)
    {
        return load_batches(json::parse(buffer { text }));
    }
}

suite event_suite = [] {
    "event"_test = [] {
        "load_batches"_test = [] {
            const auto batches = parse_batches(R"([
                {
                    "slot": 1000,
                    "blockHeight": 50,
                    "transactions": [
                        {
                            "hash": "0101010101010101010101010101010101010101010101010101010101010101",
                            "inputs": [ { "txHash": "0202020202020202020202020202020202020202020202020202020202020202", "outputIndex": 3 } ],
                            "outputs": [
                                {
                                    "address": "61DDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDD",
                                    "amounts": [
                                        { "unit": "lovelace", "quantity": "2000000" },
                                        { "unit": "EEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEEE544F4B", "quantity": 100 }
                                    ],
                                    "datum": "d87980"
                                }
                            ],
                            "mint": [ { "unit": "eeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee544f4b", "quantity": "-340282366920938463463374607431768211456" } ]
                        },
                        { "hash": "0303030303030303030303030303030303030303030303030303030303030303" }
                    ]
                },
                { "slot": 1020, "blockHeight": 51 }
            ])");
            test_same(batches.size(), 2ULL);
            const auto &b = batches.at(0);
            test_same(b.slot, 1000ULL);
            test_same(b.height, 50ULL);
            test_same(b.txs.size(), 2ULL);
            const auto &tx = b.txs.at(0);
            test_same(tx.hash, cardano::tx_hash::from_hex("0101010101010101010101010101010101010101010101010101010101010101"));
            test_same(tx.inputs.size(), 1ULL);
            test_same(tx.inputs.at(0).idx, 3U);
            test_same(tx.outputs.size(), 1ULL);
            const auto &out = tx.outputs.at(0);
            test_same(out.address.type(), 6);
            test_same(out.amounts.size(), 2ULL);
            expect(out.amounts.get("eeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee544f4b") == 100);
            expect(out.amounts.get(std::string { cardano::lovelace_unit }) == 2'000'000);
            expect(fatal(out.datum.has_value()));
            test_same(uint8_vector::from_hex("d87980"), *out.datum);
            test_same(tx.mint.size(), 1ULL);
            expect(tx.mint.at(0).quantity == big_int_from_string("-340282366920938463463374607431768211456"));
            const auto &empty_tx = b.txs.at(1);
            expect(empty_tx.inputs.empty());
            expect(empty_tx.outputs.empty());
            expect(empty_tx.mint.empty());
            expect(batches.at(1).txs.empty());
        };
        "a null datum is absent"_test = [] {
            const auto batches = parse_batches(R"([ { "slot": 1, "blockHeight": 1, "transactions": [ {
                "hash": "0101010101010101010101010101010101010101010101010101010101010101",
                "outputs": [ { "address": "61DDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDDD", "datum": null } ]
            } ] } ])");
            const auto &out = batches.at(0).txs.at(0).outputs.at(0);
            expect(!out.datum);
            expect(out.amounts.empty());
        };
        "malformed batches"_test = [] {
            expect(throws<error>([] { parse_batches(R"([ { "slot": -1, "blockHeight": 1 } ])"); }));
            expect(throws([] { parse_batches(R"([ { "blockHeight": 1 } ])"); }));
            expect(throws([] { parse_batches(R"({ "slot": 1, "blockHeight": 1 })"); }));
            expect(throws<error>([] { parse_batches(R"([ { "slot": 1, "blockHeight": 1, "transactions": [ {
                "hash": "0101010101010101010101010101010101010101010101010101010101010101",
                "mint": [ { "unit": "abc", "quantity": 1 } ] } ] } ])"); }));
            expect(throws<error>([] { parse_batches(R"([ { "slot": 1, "blockHeight": 1, "transactions": [ {
                "hash": "0101010101010101010101010101010101010101010101010101010101010101",
                "mint": [ { "unit": "lovelace", "quantity": 1.5 } ] } ] } ])"); }));
            expect(throws<error>([] { parse_batches(R"([ { "slot": 1, "blockHeight": 1, "transactions": [ {
                "hash": "0101010101010101010101010101010101010101010101010101010101010101",
                "inputs": [ { "txHash": "0202020202020202020202020202020202020202020202020202020202020202", "outputIndex": 4294967296 } ] } ] } ])"); }));
        };
        "load from a file"_test = [] {
            const test_dir dir { "event-load" };
            const auto path = dir.path() + "/events.json";
            file::write(path, std::string_view { R"([ { "slot": 7, "blockHeight": 2 } ])" });
            const auto batches = load_batches(path);
            test_same(batches.size(), 1ULL);
            test_same(batches.at(0).slot, 7ULL);
            expect(throws<error>([&] { load_batches(dir.path() + "/missing.json"); }));
        };
    };
};
