/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CARDANO_TYPES_HPP
#define PROGRAMMABLE_TOKENS_CARDANO_TYPES_HPP

#include <compare>
#include <optional>
#include <string>
#include <pt/array.hpp>

namespace programmable_tokens::cardano {
    using tx_hash = byte_array<32>;
    using key_hash = byte_array<28>;
    using script_hash = byte_array<28>;
    using policy_id = script_hash;

    struct tx_out_ref {
        tx_hash hash {};
        uint32_t idx = 0;

        std::strong_ordering operator<=>(const tx_out_ref &o) const
        {
            if (const auto cmp = hash.span() <=> o.hash.span(); cmp != 0)
                return cmp;
            return idx <=> o.idx;
        }

        bool operator==(const tx_out_ref &o) const
        {
            return hash == o.hash && idx == o.idx;
        }
    };

    struct credential {
        key_hash hash {};
        bool script = false;

        bool operator==(const credential &o) const =default;
    };

    struct address {
        // Accepts bech32 and hex-encoded addresses, the latter optionally prefixed with "#" or "0x"
        static address from_string(std::string_view text);

        address(buffer bytes);

        uint8_t type() const
        {
            return (_bytes[0] >> 4) & 0xF;
        }

        uint8_t network() const
        {
            return _bytes[0] & 0xF;
        }

        bool is_byron() const
        {
            return type() == 0b1000;
        }

        buffer bytes() const
        {
            return _bytes;
        }

        std::optional<credential> pay_id() const;
        std::optional<credential> stake_id() const;
        std::string to_string() const;

        bool operator==(const address &o) const
        {
            return _bytes == o._bytes;
        }
    private:
        uint8_vector _bytes;
    };
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::cardano::tx_out_ref>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}#{}", v.hash, v.idx);
        }
    };

    template<>
    struct formatter<programmable_tokens::cardano::credential>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}-{}", v.script ? "script" : "key", v.hash);
        }
    };

    template<>
    struct formatter<programmable_tokens::cardano::address>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_CARDANO_TYPES_HPP
