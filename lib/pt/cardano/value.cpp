/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cardano/value.hpp>

namespace programmable_tokens::cardano {
    static constexpr size_t policy_hex_size = 56;
    static constexpr size_t max_asset_name_size = 32;

    std::string make_unit(const policy_id &policy, const buffer asset_name)
    {
        if (asset_name.size() > max_asset_name_size)
            throw error(fmt::format("asset names must not exceed {} bytes but got {}", max_asset_name_size, asset_name.size()));
        return fmt::format("{}{}", policy, buffer_lowercase { asset_name.data(), asset_name.size() });
    }

    std::string normalize_unit(const std::string_view unit)
    {
        if (unit == lovelace_unit)
            return std::string { unit };
        if (unit.size() < policy_hex_size || unit.size() % 2 != 0 || unit.size() > policy_hex_size + max_asset_name_size * 2)
            throw error(fmt::format("invalid asset unit: '{}'", unit));
        const auto bytes = uint8_vector::from_hex(unit);
        return to_hex(bytes);
    }

    std::optional<policy_id> unit_policy(const std::string_view unit)
    {
        if (unit == lovelace_unit)
            return {};
        if (unit.size() < policy_hex_size)
            throw error(fmt::format("invalid asset unit: '{}'", unit));
        return policy_id::from_hex(unit.substr(0, policy_hex_size));
    }

    uint8_vector unit_asset_name(const std::string_view unit)
    {
        if (unit == lovelace_unit)
            return {};
        if (unit.size() < policy_hex_size)
            throw error(fmt::format("invalid asset unit: '{}'", unit));
        return uint8_vector::from_hex(unit.substr(policy_hex_size));
    }

    value_map value_map::from_assets(const asset_list &assets)
    {
        value_map res {};
        for (const auto &a: assets)
            res.add(a.unit, a.quantity);
        return res;
    }

    void value_map::add(const std::string &unit, const cpp_int &quantity)
    {
        if (quantity == 0)
            return;
        auto [it, created] = try_emplace(unit, quantity);
        if (!created) {
            it->second += quantity;
            if (it->second == 0)
                erase(it);
        }
    }

    value_map &value_map::operator+=(const value_map &o)
    {
        for (const auto &[unit, qty]: o)
            add(unit, qty);
        return *this;
    }

    value_map &value_map::operator-=(const value_map &o)
    {
        for (const auto &[unit, qty]: o)
            add(unit, -qty);
        return *this;
    }

    value_map value_map::operator+(const value_map &o) const
    {
        value_map res = *this;
        res += o;
        return res;
    }

    value_map value_map::operator-(const value_map &o) const
    {
        value_map res = *this;
        res -= o;
        return res;
    }

    set<policy_id> value_map::policies() const
    {
        set<policy_id> res {};
        for (const auto &[unit, qty]: *this) {
            if (const auto policy = unit_policy(unit); policy)
                res.emplace(*policy);
        }
        return res;
    }

    cpp_int value_map::get(const std::string &unit) const
    {
        if (const auto it = find(unit); it != end())
            return it->second;
        return 0;
    }
}
