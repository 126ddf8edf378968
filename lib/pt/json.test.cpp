/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/json.hpp>
#include <pt/test.hpp>

using namespace programmable_tokens;

suite json_suite = [] {
    "json"_test = [] {
        "serialize_pretty"_test = [] {
            const auto j = json::parse(buffer { std::string_view { R"({"a":[1,"x"],"b":{},"c":[],"d":null})" } });
            test_same(std::string { "{\n  \"a\": [\n    1,\n    \"x\"\n  ],\n  \"b\": {},\n  \"c\": [],\n  \"d\": null\n}" }, json::serialize_pretty(j));
            test_same(std::string { "true" }, json::serialize_pretty(json::value { true }));
        };
        "parse"_test = [] {
            expect(throws([] { json::parse(buffer { std::string_view { "{\"a\":" } }); }));
        };
    };
};
