/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CARDANO_VALUE_HPP
#define PROGRAMMABLE_TOKENS_CARDANO_VALUE_HPP

#include <pt/big-int.hpp>
#include <pt/cardano/types.hpp>
#include <pt/container.hpp>

namespace programmable_tokens::cardano {
    // A unit is either "lovelace" or the hex of a policy id followed by the hex of an asset name
    static constexpr std::string_view lovelace_unit { "lovelace" };

    extern std::string make_unit(const policy_id &policy, buffer asset_name);
    // Validates a unit and brings its hex to the lower case
    extern std::string normalize_unit(std::string_view unit);
    extern std::optional<policy_id> unit_policy(std::string_view unit);
    extern uint8_vector unit_asset_name(std::string_view unit);

    struct asset_amount {
        std::string unit {};
        cpp_int quantity {};

        bool operator==(const asset_amount &o) const =default;
    };
    using asset_list = vector<asset_amount>;

    // Units with a zero amount are never stored
    struct value_map: flat_map<std::string, cpp_int> {
        using base_type = flat_map<std::string, cpp_int>;
        using base_type::base_type;

        static value_map from_assets(const asset_list &assets);

        void add(const std::string &unit, const cpp_int &quantity);
        value_map &operator+=(const value_map &o);
        value_map &operator-=(const value_map &o);
        value_map operator+(const value_map &o) const;
        value_map operator-(const value_map &o) const;
        set<policy_id> policies() const;
        cpp_int get(const std::string &unit) const;
    };
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::cardano::value_map>: formatter<programmable_tokens::flat_map<std::string, programmable_tokens::cpp_int>> {
    };

    template<>
    struct formatter<programmable_tokens::cardano::asset_amount>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}={}", v.unit, v.quantity);
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_CARDANO_VALUE_HPP
