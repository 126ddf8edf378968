/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cardano/bech32.hpp>
#include <pt/cardano/types.hpp>

namespace programmable_tokens::cardano {
    address address::from_string(const std::string_view text)
    {
        static constexpr std::string_view prefix1 { "#" };
        static constexpr std::string_view prefix2 { "0x" };
        if (text.starts_with(prefix1))
            return address { uint8_vector::from_hex(text.substr(prefix1.size())) };
        if (text.starts_with(prefix2))
            return address { uint8_vector::from_hex(text.substr(prefix2.size())) };
        if (text.starts_with("addr") || text.starts_with("stake"))
            return address { bech32::decode(text).data };
        return address { uint8_vector::from_hex(text) };
    }

    address::address(const buffer bytes): _bytes { bytes }
    {
        if (_bytes.size() < 2)
            throw error("cardano address must have at least two bytes!");
        switch (type()) {
            case 0b0000: // base address: keyhash28,keyhash28
            case 0b0001: // base address: scripthash28,keyhash28
            case 0b0010: // base address: keyhash28,scripthash28
            case 0b0011: // base address: scripthash28,scripthash28
                if (_bytes.size() != 57)
                    throw error(fmt::format("shelley base address must have 57 bytes but got {}: {}", _bytes.size(), _bytes));
                break;
            case 0b0100: // keyhash28, pointer
            case 0b0101: // scripthash28, pointer
                if (_bytes.size() < 32)
                    throw error(fmt::format("pointer address must have at least 32 bytes but got {}: {}", _bytes.size(), _bytes));
                break;
            case 0b0110: // enterprise key
            case 0b0111: // enterprise script
            case 0b1110: // reward key
            case 0b1111: // reward script
                if (_bytes.size() != 29)
                    throw error(fmt::format("enterprise and reward addresses must have 29 bytes but got {}: {}", _bytes.size(), _bytes));
                break;
            case 0b1000: // byron
                break;
            default:
                throw error(fmt::format("unsupported address type: {}!", type()));
        }
    }

    std::optional<credential> address::pay_id() const
    {
        switch (const auto typ = type(); typ) {
            case 0b0000:
            case 0b0001:
            case 0b0010:
            case 0b0011:
            case 0b0100:
            case 0b0101:
            case 0b0110:
            case 0b0111:
                return credential { _bytes.span().subbuf(1, 28), (typ & 0x1) != 0 };
            default:
                return {};
        }
    }

    std::optional<credential> address::stake_id() const
    {
        switch (const auto typ = type(); typ) {
            case 0b0000:
            case 0b0001:
            case 0b0010:
            case 0b0011:
                return credential { _bytes.span().subbuf(29, 28), (typ & 0x2) != 0 };
            case 0b1110:
            case 0b1111:
                return credential { _bytes.span().subbuf(1, 28), (typ & 0x1) != 0 };
            default:
                return {};
        }
    }

    std::string address::to_string() const
    {
        if (is_byron())
            return fmt::format("#{}", buffer_lowercase { _bytes.data(), _bytes.size() });
        const bool mainnet = network() == 1;
        if (type() >= 0b1110)
            return bech32::encode(mainnet ? "stake" : "stake_test", _bytes);
        return bech32::encode(mainnet ? "addr" : "addr_test", _bytes);
    }
}
