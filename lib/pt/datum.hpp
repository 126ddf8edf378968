/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_DATUM_HPP
#define PROGRAMMABLE_TOKENS_DATUM_HPP

#include <optional>
#include <pt/cardano/types.hpp>
#include <pt/plutus/data.hpp>

namespace programmable_tokens::datum {
    using cardano::key_hash;
    using cardano::policy_id;

    struct protocol_params {
        policy_id registry_policy {};
        key_hash base_credential {};

        plutus::data to_data() const;
        bool operator==(const protocol_params &o) const =default;
    };

    struct registry_node {
        uint8_vector key {};
        uint8_vector next {};
        uint8_vector transfer_logic {};
        uint8_vector third_party_logic {};
        // empty when the datum has only four fields
        uint8_vector global_state_policy {};

        bool is_sentinel() const
        {
            return key.empty();
        }

        plutus::data to_data() const;
        bool operator==(const registry_node &o) const =default;
    };

    // Both decoders report any shape mismatch or CBOR decoding failure as an absent value
    extern std::optional<protocol_params> decode_protocol_params(buffer bytes);
    extern std::optional<registry_node> decode_registry_node(buffer bytes);
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::datum::protocol_params>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[registry policy: {} base credential: {}]", v.registry_policy, v.base_credential);
        }
    };

    template<>
    struct formatter<programmable_tokens::datum::registry_node>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[key: #{} next: #{}]", v.key, v.next);
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_DATUM_HPP
