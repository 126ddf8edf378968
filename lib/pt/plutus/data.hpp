/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_PLUTUS_DATA_HPP
#define PROGRAMMABLE_TOKENS_PLUTUS_DATA_HPP

#include <variant>
#include <pt/big-int.hpp>
#include <pt/cbor/encoder.hpp>
#include <pt/container.hpp>

namespace programmable_tokens::plutus {
    struct data;
    struct data_pair;
    using data_list = vector<data>;
    using data_map = vector<data_pair>;

    struct data_constr {
        uint64_t tag = 0;
        data_list fields {};

        bool operator==(const data_constr &o) const;
    };

    struct data {
        using value_type = std::variant<data_constr, data_map, data_list, cpp_int, uint8_vector>;

        static data from_cbor(buffer bytes);
        static data constr(uint64_t tag, data_list fields);
        static data bytes(buffer bytes);
        static data bint(cpp_int val);
        static data list(data_list items);
        static data map(data_map pairs);

        value_type val;

        const data_constr &as_constr() const;
        const data_map &as_map() const;
        const data_list &as_list() const;
        const cpp_int &as_bint() const;
        const uint8_vector &as_bytes() const;

        bool operator==(const data &o) const;
        void to_cbor(cbor::encoder &enc) const;
        uint8_vector as_cbor() const;
        std::string to_string() const;
    };

    struct data_pair {
        data first;
        data second;

        bool operator==(const data_pair &o) const;
    };
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::plutus::data>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_PLUTUS_DATA_HPP
