/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CARDANO_BECH32_HPP
#define PROGRAMMABLE_TOKENS_CARDANO_BECH32_HPP

#include <string>
#include <string_view>
#include <pt/bytes.hpp>

namespace programmable_tokens::cardano::bech32 {
    struct decoded {
        std::string prefix {};
        uint8_vector data {};
    };

    extern decoded decode(std::string_view text);
    extern std::string encode(std::string_view prefix, buffer data);
}

#endif // !PROGRAMMABLE_TOKENS_CARDANO_BECH32_HPP
