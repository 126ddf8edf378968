/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli.hpp>
#include <pt/test.hpp>

using namespace programmable_tokens;
using namespace programmable_tokens::cli;

namespace {
    struct echo_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "echo";
            cmd.desc = "echo the arguments";
            cmd.args.expect({ "<data-dir>", "[<policy-id>]" });
            cmd.opts.try_emplace("limit", option_config { "the maximum number of rows", "10", validate_uint });
            cmd.opts.try_emplace("all", option_config { "include deleted rows" });
        }

        void run(const arguments &, const options &) const override
        {
        }
    };

    config echo_config()
    {
        config cfg {};
        echo_cmd {}.configure(cfg);
        return cfg;
    }
}

suite cli_suite = [] {
    "cli"_test = [] {
        "parse"_test = [] {
            const echo_cmd cmd {};
            const auto cfg = echo_config();
            test_same(cfg.args.min, 1ULL);
            test_same(cfg.args.max, 2ULL);
            {
                const auto pr = cmd.parse(cfg, { "data", "--all" });
                test_same(pr.args.size(), 1ULL);
                expect(pr.opts.contains("all"));
                expect(!pr.opts.at("all"));
                test_same(std::string { "10" }, *pr.opts.at("limit"));
            }
            {
                const auto pr = cmd.parse(cfg, { "data", "aabb", "--limit=3" });
                test_same(pr.args.size(), 2ULL);
                test_same(std::string { "3" }, *pr.opts.at("limit"));
                expect(!pr.opts.contains("all"));
            }
        };
        "invalid command lines"_test = [] {
            const echo_cmd cmd {};
            const auto cfg = echo_config();
            expect(throws<error>([&] { cmd.parse(cfg, {}); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "a", "b", "c" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "data", "--unknown" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "data", "--all", "--all" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "data", "--limit=-1" }); }));
            expect(throws<error>([&] { cmd.parse(cfg, { "data", "--limit" }); }));
        };
        "validate_uint"_test = [] {
            expect(!validate_uint("0"));
            expect(!validate_uint("18446744073709551615"));
            expect(validate_uint("18446744073709551616").has_value());
            expect(validate_uint("12a").has_value());
            expect(validate_uint("").has_value());
            expect(validate_uint(std::optional<std::string> {}).has_value());
        };
        "usage"_test = [] {
            test_same(std::string { "[options] <data-dir> [<policy-id>] - echo the arguments" }, echo_config().make_usage());
        };
    };
};
