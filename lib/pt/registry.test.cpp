/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/registry.hpp>
#include <pt/store/file.hpp>
#include <pt/store/memory.hpp>
#include <pt/test.hpp>

using namespace programmable_tokens;

namespace {
    const auto version = cardano::tx_hash::from_hex("AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA");
    const registry_key head {};
    const auto key_a = registry_key::from_hex("0A");
    const auto key_c = registry_key::from_hex("0C");
    const auto key_d = registry_key::from_hex("0D");
    const auto key_f = registry_key::from_hex("0F");

    store::registry_row node(const registry_key &key, const registry_key &next, const uint8_t tx_id, const uint64_t slot)
    {
        store::registry_row row {};
        row.version = version;
        row.key = key;
        row.next = next;
        row.transfer_logic = uint8_vector::from_hex("11");
        row.third_party_logic = uint8_vector::from_hex("22");
        row.tx.fill(tx_id);
        row.slot = slot;
        row.height = slot / 20;
        return row;
    }

    // a sentinel and the nodes A -> C -> F
    void build_list(token_registry &reg)
    {
        test_same(reg.apply(node(head, head, 1, 10)), 1ULL);
        test_same(reg.apply(node(head, key_a, 2, 20)), 1ULL);
        test_same(reg.apply(node(key_a, head, 2, 20)), 1ULL);
        test_same(reg.apply(node(key_a, key_c, 3, 30)), 1ULL);
        test_same(reg.apply(node(key_c, head, 3, 30)), 1ULL);
        test_same(reg.apply(node(key_c, key_f, 4, 40)), 1ULL);
        test_same(reg.apply(node(key_f, head, 4, 40)), 1ULL);
    }
}

suite registry_suite = [] {
    "registry"_test = [] {
        "orphaned_keys"_test = [] {
            const registry_key_list active { head, key_a, key_c, key_d, key_f };
            expect(orphaned_keys(head, key_c, active).empty());
            expect(orphaned_keys(key_c, key_c, active).empty());
            expect(orphaned_keys(key_d, key_c, active).empty());
            test_same(registry_key_list { key_c, key_d, key_f }, orphaned_keys(key_c, head, active));
            test_same(registry_key_list { key_c, key_d }, orphaned_keys(key_c, key_f, active));
            test_same(registry_key_list { key_c }, orphaned_keys(key_c, key_d, active));
        };
        "insertion"_test = [] {
            store::memory db {};
            token_registry reg { db };
            build_list(reg);
            test_same(registry_key_list { key_a, key_c, key_f }, reg.chain(version));
            test_same(reg.count(version), 3ULL);
            test_same(reg.all_nodes(version).size(), 4ULL);
            test_same(reg.history(version).size(), 7ULL);
            const auto a = reg.find(version, key_a);
            expect(fatal(a.has_value()));
            test_same(key_c, a->next);
            test_same(a->slot, 30ULL);
        };
        "a rewrite removes the skipped nodes"_test = [] {
            store::memory db {};
            token_registry reg { db };
            build_list(reg);
            test_same(reg.apply(node(key_a, key_d, 5, 50)), 2ULL);
            test_same(reg.apply(node(key_d, key_f, 5, 50)), 1ULL);
            test_same(registry_key_list { key_a, key_d, key_f }, reg.chain(version));
            const auto c = reg.find(version, key_c);
            expect(fatal(c.has_value()));
            expect(c->deleted);
            test_same(c->slot, 50ULL);
            test_same(c->tx, node(key_a, key_d, 5, 50).tx);
            test_same(key_f, c->next);
            expect(!reg.find(version, key_f)->deleted);
            expect(!reg.is_registered(key_c));
            expect(reg.is_registered(key_d));
            test_same(reg.count(version), 3ULL);
        };
        "removal of the last node"_test = [] {
            store::memory db {};
            token_registry reg { db };
            build_list(reg);
            test_same(reg.apply(node(key_c, head, 5, 50)), 2ULL);
            test_same(registry_key_list { key_a, key_c }, reg.chain(version));
            expect(reg.find(version, key_f)->deleted);
            expect(!reg.is_registered(key_f));
        };
        "repeated observations are ignored"_test = [] {
            store::memory db {};
            token_registry reg { db };
            build_list(reg);
            test_same(reg.apply(node(key_a, key_d, 5, 50)), 2ULL);
            const auto num_rows = db.registry_rows().size();
            test_same(reg.apply(node(key_a, key_d, 5, 50)), 0ULL);
            test_same(reg.apply(node(key_c, head, 3, 30)), 0ULL);
            test_same(num_rows, db.registry_rows().size());
        };
        "versions are independent"_test = [] {
            store::memory db {};
            token_registry reg { db };
            build_list(reg);
            auto other = node(key_d, head, 9, 90);
            other.version.fill(0xBB);
            test_same(reg.apply(other), 1ULL);
            test_same(reg.count(version), 3ULL);
            test_same(reg.count(other.version), 1ULL);
            expect(!reg.find(version, key_d));
            expect(reg.is_registered(key_d));
            expect(!reg.is_registered(head));
        };
        "broken lists"_test = [] {
            {
                store::memory db {};
                token_registry reg { db };
                expect(reg.chain(version).empty());
                expect(reg.insert(node(key_a, head, 1, 10)));
                expect(throws<error>([&] { reg.chain(version); }));
            }
            {
                store::memory db {};
                token_registry reg { db };
                expect(reg.insert(node(head, key_a, 1, 10)));
                expect(reg.insert(node(key_a, key_c, 1, 10)));
                expect(throws<error>([&] { reg.chain(version); }));
            }
            {
                store::memory db {};
                token_registry reg { db };
                expect(reg.insert(node(head, key_c, 1, 10)));
                expect(reg.insert(node(key_c, key_a, 1, 10)));
                expect(reg.insert(node(key_a, head, 1, 10)));
                expect(throws<error>([&] { reg.chain(version); }));
            }
            {
                store::memory db {};
                token_registry reg { db };
                expect(reg.insert(node(head, key_a, 1, 10)));
                expect(reg.insert(node(key_a, key_a, 1, 10)));
                expect(throws<error>([&] { reg.chain(version); }));
            }
            {
                store::memory db {};
                token_registry reg { db };
                expect(reg.insert(node(head, head, 1, 10)));
                expect(reg.insert(node(key_a, head, 1, 10)));
                expect(throws<error>([&] { reg.chain(version); }));
            }
        };
        "reload"_test = [] {
            const test_dir dir { "registry-reload" };
            {
                store::file db { dir.path() };
                token_registry reg { db };
                build_list(reg);
                test_same(reg.apply(node(key_a, key_d, 5, 50)), 2ULL);
                test_same(reg.apply(node(key_d, key_f, 5, 50)), 1ULL);
            }
            store::file db { dir.path() };
            token_registry reg { db };
            test_same(registry_key_list { key_a, key_d, key_f }, reg.chain(version));
            expect(reg.find(version, key_c)->deleted);
            test_same(reg.apply(node(key_d, key_f, 5, 50)), 0ULL);
        };
        "deletions lost before a restart are restored"_test = [] {
            const test_dir dir { "registry-lost-deletions" };
            {
                store::file db { dir.path() };
                token_registry reg { db };
                build_list(reg);
                // the rewrite is recorded without the deletion of C that it implies
                expect(db.add_registry(node(key_a, key_d, 5, 50)));
            }
            store::file db { dir.path() };
            token_registry reg { db };
            expect(!reg.find(version, key_c)->deleted);
            test_same(reg.apply(node(key_a, key_d, 5, 50)), 1ULL);
            const auto c = reg.find(version, key_c);
            expect(fatal(c.has_value()));
            expect(c->deleted);
            test_same(c->tx, node(key_a, key_d, 5, 50).tx);
            test_same(reg.apply(node(key_d, key_f, 5, 50)), 1ULL);
            test_same(registry_key_list { key_a, key_d, key_f }, reg.chain(version));
            test_same(reg.apply(node(key_a, key_d, 5, 50)), 0ULL);
        };
        "a replay does not remove nodes inserted later"_test = [] {
            store::memory db {};
            token_registry reg { db };
            build_list(reg);
            test_same(reg.apply(node(key_a, key_d, 5, 50)), 2ULL);
            test_same(reg.apply(node(key_d, key_f, 5, 50)), 1ULL);
            // C is registered again between A and D
            test_same(reg.apply(node(key_a, key_c, 7, 70)), 1ULL);
            test_same(reg.apply(node(key_c, key_d, 7, 70)), 1ULL);
            const auto num_rows = db.registry_rows().size();
            test_same(reg.apply(node(key_a, key_d, 5, 50)), 0ULL);
            test_same(num_rows, db.registry_rows().size());
            test_same(registry_key_list { key_a, key_c, key_d, key_f }, reg.chain(version));
            expect(reg.is_registered(key_c));
        };
    };
};
