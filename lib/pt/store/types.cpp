/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/store/types.hpp>

namespace programmable_tokens::store {
    static void _expect_size(const cbor::zero::value::array_iterator &it, const size_t sz, const std::string_view name)
    {
        if (it.size() != sz) [[unlikely]]
            throw error(fmt::format("a serialized {} must have {} items but has {}", name, sz, it.size()));
    }

    static bool _is_null(const cbor::zero::value v)
    {
        return v.type() == cbor::major_type::simple && v.special() == cbor::special_val::s_null;
    }

    static std::optional<key_hash> _opt_hash_from_cbor(const cbor::zero::value v)
    {
        if (_is_null(v))
            return {};
        return key_hash { v.bytes() };
    }

    static void _opt_hash_to_cbor(cbor::encoder &enc, const std::optional<key_hash> &h)
    {
        if (h)
            enc.bytes(*h);
        else
            enc.s_null();
    }

    static std::string _hex(const buffer b)
    {
        return fmt::format("{}", buffer_lowercase { b.data(), b.size() });
    }

    static json::value _opt_hash_to_json(const std::optional<key_hash> &h)
    {
        if (h)
            return json::value(fmt::format("{}", *h));
        return nullptr;
    }

    void value_to_cbor(cbor::encoder &enc, const value_map &val)
    {
        enc.map(val.size());
        for (const auto &[unit, qty]: val) {
            enc.text(unit);
            big_int_to_cbor(enc, qty);
        }
    }

    value_map value_from_cbor(const cbor::zero::value v)
    {
        value_map res {};
        auto it = v.map();
        while (!it.done()) {
            const auto [k, qty] = it.next();
            res.add(std::string { k.text() }, qty.big_int());
        }
        return res;
    }

    json::object value_to_json(const value_map &val)
    {
        json::object res {};
        for (const auto &[unit, qty]: val)
            res.emplace(unit, big_int_to_string(qty));
        return res;
    }

    tx_kind tx_kind_from_string(const std::string_view name)
    {
        if (name == "TRANSFER")
            return tx_kind::transfer;
        if (name == "MINT")
            return tx_kind::mint;
        if (name == "BURN")
            return tx_kind::burn;
        throw error(fmt::format("unsupported transaction kind: {}", name));
    }

    protocol_version protocol_version::from_cbor(const cbor::zero::value v)
    {
        auto it = v.array();
        _expect_size(it, 5, "protocol version");
        protocol_version res {};
        res.tx = it.next().bytes();
        res.slot = it.next().uint();
        res.height = it.next().uint();
        res.registry_policy = it.next().bytes();
        res.base_credential = it.next().bytes();
        return res;
    }

    void protocol_version::to_cbor(cbor::encoder &enc) const
    {
        enc.array(5)
            .bytes(tx)
            .uint(slot)
            .uint(height)
            .bytes(registry_policy)
            .bytes(base_credential);
    }

    json::object protocol_version::to_json() const
    {
        return json::object {
            { "txHash", fmt::format("{}", tx) },
            { "slot", slot },
            { "blockHeight", height },
            { "registryPolicyId", fmt::format("{}", registry_policy) },
            { "baseCredential", fmt::format("{}", base_credential) }
        };
    }

    registry_row registry_row::from_cbor(const cbor::zero::value v)
    {
        auto it = v.array();
        _expect_size(it, 10, "registry row");
        registry_row res {};
        res.version = it.next().bytes();
        res.key = it.next().bytes();
        res.next = it.next().bytes();
        res.transfer_logic = it.next().bytes();
        res.third_party_logic = it.next().bytes();
        res.global_state_policy = it.next().bytes();
        res.tx = it.next().bytes();
        res.slot = it.next().uint();
        res.height = it.next().uint();
        res.deleted = it.next().simple() == cbor::special_val::s_true;
        return res;
    }

    void registry_row::to_cbor(cbor::encoder &enc) const
    {
        enc.array(10)
            .bytes(version)
            .bytes(key)
            .bytes(next)
            .bytes(transfer_logic)
            .bytes(third_party_logic)
            .bytes(global_state_policy)
            .bytes(tx)
            .uint(slot)
            .uint(height)
            .boolean(deleted);
    }

    json::object registry_row::to_json() const
    {
        return json::object {
            { "protocolVersion", fmt::format("{}", version) },
            { "key", _hex(key) },
            { "next", _hex(next) },
            { "transferLogicScript", _hex(transfer_logic) },
            { "thirdPartyTransferLogicScript", _hex(third_party_logic) },
            { "globalStatePolicyId", _hex(global_state_policy) },
            { "txHash", fmt::format("{}", tx) },
            { "slot", slot },
            { "blockHeight", height },
            { "isDeleted", deleted }
        };
    }

    balance_row balance_row::from_cbor(const cbor::zero::value v)
    {
        auto it = v.array();
        _expect_size(it, 9, "balance row");
        balance_row res {};
        res.address = it.next().bytes();
        res.pay_cred = _opt_hash_from_cbor(it.next());
        res.stake_cred = _opt_hash_from_cbor(it.next());
        res.tx = it.next().bytes();
        res.slot = it.next().uint();
        res.height = it.next().uint();
        res.balance = value_from_cbor(it.next());
        res.diff = value_from_cbor(it.next());
        const auto kind = it.next().uint();
        if (kind > static_cast<uint64_t>(tx_kind::burn)) [[unlikely]]
            throw error(fmt::format("unsupported serialized transaction kind: {}", kind));
        res.kind = static_cast<tx_kind>(kind);
        return res;
    }

    void balance_row::to_cbor(cbor::encoder &enc) const
    {
        enc.array(9).bytes(address);
        _opt_hash_to_cbor(enc, pay_cred);
        _opt_hash_to_cbor(enc, stake_cred);
        enc.bytes(tx)
            .uint(slot)
            .uint(height);
        value_to_cbor(enc, balance);
        value_to_cbor(enc, diff);
        enc.uint(static_cast<uint64_t>(kind));
    }

    json::object balance_row::to_json() const
    {
        return json::object {
            { "address", cardano::address { address }.to_string() },
            { "paymentCredential", _opt_hash_to_json(pay_cred) },
            { "stakeCredential", _opt_hash_to_json(stake_cred) },
            { "txHash", fmt::format("{}", tx) },
            { "slot", slot },
            { "blockHeight", height },
            { "balance", value_to_json(balance) },
            { "diff", value_to_json(diff) },
            { "transactionType", fmt::format("{}", kind) }
        };
    }
}
