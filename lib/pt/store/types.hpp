/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_STORE_TYPES_HPP
#define PROGRAMMABLE_TOKENS_STORE_TYPES_HPP

#include <optional>
#include <pt/cardano/value.hpp>
#include <pt/cbor/zero.hpp>
#include <pt/json.hpp>

namespace programmable_tokens::store {
    using cardano::tx_hash;
    using cardano::key_hash;
    using cardano::policy_id;
    using cardano::value_map;

    struct protocol_version {
        tx_hash tx {};
        uint64_t slot = 0;
        uint64_t height = 0;
        policy_id registry_policy {};
        key_hash base_credential {};

        static protocol_version from_cbor(cbor::zero::value v);
        void to_cbor(cbor::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const protocol_version &o) const =default;
    };

    struct registry_row {
        // the id of the protocol version governing the node
        tx_hash version {};
        uint8_vector key {};
        uint8_vector next {};
        uint8_vector transfer_logic {};
        uint8_vector third_party_logic {};
        uint8_vector global_state_policy {};
        tx_hash tx {};
        uint64_t slot = 0;
        uint64_t height = 0;
        bool deleted = false;

        static registry_row from_cbor(cbor::zero::value v);
        void to_cbor(cbor::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const registry_row &o) const =default;

        bool is_sentinel() const
        {
            return key.empty();
        }
    };

    struct registry_row_id {
        tx_hash version {};
        uint8_vector key {};
        tx_hash tx {};
        bool deleted = false;

        static registry_row_id from_row(const registry_row &r)
        {
            return { r.version, r.key, r.tx, r.deleted };
        }

        std::strong_ordering operator<=>(const registry_row_id &o) const
        {
            if (const auto cmp = version.span() <=> o.version.span(); cmp != 0)
                return cmp;
            if (const auto cmp = key <=> o.key; cmp != 0)
                return cmp;
            if (const auto cmp = tx.span() <=> o.tx.span(); cmp != 0)
                return cmp;
            return deleted <=> o.deleted;
        }

        bool operator==(const registry_row_id &o) const
        {
            return (*this <=> o) == 0;
        }
    };

    enum class tx_kind: uint8_t {
        transfer, mint, burn
    };
    extern tx_kind tx_kind_from_string(std::string_view name);

    struct balance_row {
        uint8_vector address {};
        std::optional<key_hash> pay_cred {};
        std::optional<key_hash> stake_cred {};
        tx_hash tx {};
        uint64_t slot = 0;
        uint64_t height = 0;
        value_map balance {};
        value_map diff {};
        tx_kind kind = tx_kind::transfer;

        static balance_row from_cbor(cbor::zero::value v);
        void to_cbor(cbor::encoder &enc) const;
        json::object to_json() const;
        bool operator==(const balance_row &o) const =default;
    };

    struct balance_row_id {
        uint8_vector address {};
        tx_hash tx {};

        std::strong_ordering operator<=>(const balance_row_id &o) const
        {
            if (const auto cmp = address <=> o.address; cmp != 0)
                return cmp;
            return tx.span() <=> o.tx.span();
        }

        bool operator==(const balance_row_id &o) const
        {
            return (*this <=> o) == 0;
        }
    };

    extern void value_to_cbor(cbor::encoder &enc, const value_map &val);
    extern value_map value_from_cbor(cbor::zero::value v);
    extern json::object value_to_json(const value_map &val);
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::store::tx_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using programmable_tokens::store::tx_kind;
            switch (v) {
                case tx_kind::transfer: return fmt::format_to(ctx.out(), "TRANSFER");
                case tx_kind::mint: return fmt::format_to(ctx.out(), "MINT");
                case tx_kind::burn: return fmt::format_to(ctx.out(), "BURN");
                default: throw programmable_tokens::error(fmt::format("unsupported tx_kind value: {}", static_cast<int>(v)));
            }
        }
    };

    template<>
    struct formatter<programmable_tokens::store::protocol_version>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[tx: {} slot: {} height: {} registry policy: {} base credential: {}]",
                v.tx, v.slot, v.height, v.registry_policy, v.base_credential);
        }
    };

    template<>
    struct formatter<programmable_tokens::store::registry_row>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[key: #{} next: #{} tx: {} slot: {}{}]",
                v.key, v.next, v.tx, v.slot, v.deleted ? " deleted" : "");
        }
    };

    template<>
    struct formatter<programmable_tokens::store::balance_row>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[address: #{} tx: {} slot: {} {} balance: {} diff: {}]",
                v.address, v.tx, v.slot, v.kind, v.balance, v.diff);
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_STORE_TYPES_HPP
