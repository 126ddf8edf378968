/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <iostream>
#include <pt/config.hpp>
#include <pt/logger.hpp>
#include <pt/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace programmable_tokens;
    consider_bin_dir(argv[0]);
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-test finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
