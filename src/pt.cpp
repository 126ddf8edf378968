/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace programmable_tokens;
    consider_bin_dir(argv[0]);
    return cli::run(argc, argv);
}
