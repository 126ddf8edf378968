/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CBOR_TYPES_HPP
#define PROGRAMMABLE_TOKENS_CBOR_TYPES_HPP

#include <cstdint>
#include <iterator>
#include <string_view>
#include <pt/format.hpp>

namespace programmable_tokens::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::cbor::special_val>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const programmable_tokens::cbor::special_val &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using programmable_tokens::cbor::special_val;
            switch (v) {
                case special_val::s_false: return formatter<std::string_view>::format("false", ctx);
                case special_val::s_true: return formatter<std::string_view>::format("true", ctx);
                case special_val::s_null: return formatter<std::string_view>::format("null", ctx);
                case special_val::s_undefined: return formatter<std::string_view>::format("undefined", ctx);
                case special_val::s_break: return formatter<std::string_view>::format("break", ctx);
                default: return fmt::format_to(ctx.out(), "simple({})", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<programmable_tokens::cbor::major_type>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const programmable_tokens::cbor::major_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            static constexpr std::string_view names[] { "uint", "nint", "bytes", "text", "array", "map", "tag", "simple" };
            const auto idx = static_cast<size_t>(v);
            if (idx < std::size(names))
                return formatter<std::string_view>::format(names[idx], ctx);
            return fmt::format_to(ctx.out(), "major_type({})", idx);
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_CBOR_TYPES_HPP
