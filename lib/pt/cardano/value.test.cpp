/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cardano/value.hpp>
#include <pt/test.hpp>

using namespace programmable_tokens;
using namespace programmable_tokens::cardano;

suite cardano_value_suite = [] {
    "cardano::value"_test = [] {
        static const auto policy = policy_id::from_hex("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa");
        static const std::string token_unit { "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa544f4b454e" };
        "units"_test = [] {
            test_same(token_unit, make_unit(policy, std::string_view { "TOKEN" }));
            test_same(token_unit, normalize_unit("AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA544F4B454E"));
            test_same(std::string { "lovelace" }, normalize_unit("lovelace"));
            expect(!unit_policy(lovelace_unit));
            expect(unit_policy(token_unit) == policy);
            test_same(uint8_vector { std::string_view { "TOKEN" } }, unit_asset_name(token_unit));
            expect(unit_asset_name(std::string_view { token_unit }.substr(0, 56)).empty());
            expect(throws<error>([] { normalize_unit("aaaa"); }));
            expect(throws<error>([] { normalize_unit("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa5"); }));
            expect(throws<error>([] { normalize_unit("zzaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"); }));
        };
        "arithmetic"_test = [] {
            value_map a {};
            a.add(std::string { lovelace_unit }, 1'000'000);
            a.add(token_unit, 100);
            value_map b {};
            b.add(token_unit, 100);
            const auto diff = a - b;
            test_same(size_t { 1 }, diff.size());
            expect(diff.get(std::string { lovelace_unit }) == 1'000'000);
            expect(diff.get(token_unit) == 0);
            const auto neg = b - a;
            expect(neg.get(std::string { lovelace_unit }) == -1'000'000);
            expect(neg + a == b);
            expect((a - a).empty());
            test_same(size_t { 1 }, a.policies().size());
            expect(b.policies().contains(policy));
            expect(diff.policies().empty());
        };
        "from assets"_test = [] {
            const auto v = value_map::from_assets({
                { token_unit, 5 },
                { std::string { lovelace_unit }, 0 },
                { token_unit, 7 }
            });
            test_same(size_t { 1 }, v.size());
            expect(v.get(token_unit) == 12);
        };
        "big amounts"_test = [] {
            value_map v {};
            v.add(token_unit, big_int_from_string("340282366920938463463374607431768211456"));
            v.add(token_unit, big_int_from_string("-340282366920938463463374607431768211455"));
            expect(v.get(token_unit) == 1);
        };
    };
};
