/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <limits>
#include <pt/event.hpp>
#include <pt/logger.hpp>

namespace programmable_tokens {
    static std::string_view _str(const json::value &j)
    {
        return static_cast<std::string_view>(j.as_string());
    }

    static uint64_t _uint(const json::value &j)
    {
        if (j.is_uint64())
            return j.get_uint64();
        if (j.is_int64() && j.get_int64() >= 0)
            return static_cast<uint64_t>(j.get_int64());
        throw error(fmt::format("expected a non-negative integer but got {}", json::serialize(j)));
    }

    static cpp_int _quantity(const json::value &j)
    {
        switch (j.kind()) {
            case json::kind::string: return big_int_from_string(_str(j));
            case json::kind::int64: return cpp_int { j.get_int64() };
            case json::kind::uint64: return cpp_int { j.get_uint64() };
            default: throw error(fmt::format("a quantity must be a decimal string or an integer but got {}", json::serialize(j)));
        }
    }

    static cardano::asset_list _assets(const json::value *j)
    {
        cardano::asset_list res {};
        if (!j || j->is_null())
            return res;
        for (const auto &j_asset: j->as_array()) {
            const auto &obj = j_asset.as_object();
            res.emplace_back(cardano::asset_amount { cardano::normalize_unit(_str(obj.at("unit"))), _quantity(obj.at("quantity")) });
        }
        return res;
    }

    static tx_output _output(const json::object &obj)
    {
        tx_output out { cardano::address::from_string(_str(obj.at("address"))) };
        out.amounts = cardano::value_map::from_assets(_assets(obj.if_contains("amounts")));
        if (const auto *j_datum = obj.if_contains("datum"); j_datum && !j_datum->is_null())
            out.datum = uint8_vector::from_hex(_str(*j_datum));
        return out;
    }

    static transaction _transaction(const json::object &obj)
    {
        transaction tx {};
        tx.hash = cardano::tx_hash::from_hex(_str(obj.at("hash")));
        if (const auto *j_inputs = obj.if_contains("inputs"); j_inputs) {
            for (const auto &j_in: j_inputs->as_array()) {
                const auto &in = j_in.as_object();
                const auto idx = _uint(in.at("outputIndex"));
                if (idx > std::numeric_limits<uint32_t>::max())
                    throw error(fmt::format("an output index is too large: {}", idx));
                tx.inputs.emplace_back(cardano::tx_out_ref { cardano::tx_hash::from_hex(_str(in.at("txHash"))), static_cast<uint32_t>(idx) });
            }
        }
        if (const auto *j_outputs = obj.if_contains("outputs"); j_outputs) {
            for (const auto &j_out: j_outputs->as_array())
                tx.outputs.emplace_back(_output(j_out.as_object()));
        }
        tx.mint = _assets(obj.if_contains("mint"));
        return tx;
    }

    block_batch block_batch::from_json(const json::value &j)
    {
        const auto &obj = j.as_object();
        block_batch b {};
        b.slot = _uint(obj.at("slot"));
        b.height = _uint(obj.at("blockHeight"));
        if (const auto *j_txs = obj.if_contains("transactions"); j_txs) {
            for (const auto &j_tx: j_txs->as_array())
                b.txs.emplace_back(_transaction(j_tx.as_object()));
        }
        return b;
    }

    block_batch_list load_batches(const json::value &j)
    {
        block_batch_list res {};
        for (const auto &j_batch: j.as_array())
            res.emplace_back(block_batch::from_json(j_batch));
        return res;
    }

    block_batch_list load_batches(const std::string &path)
    {
        try {
            auto res = load_batches(json::load(path));
            logger::debug("loaded {} batches from {}", res.size(), path);
            return res;
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load batches from {}", path), ex);
        }
    }
}
