/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_FORMAT_HPP
#define PROGRAMMABLE_TOKENS_FORMAT_HPP

#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>
#ifndef _MSC_VER
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpragmas"
#ifndef __clang__
#   pragma GCC diagnostic ignored "-Wdangling-reference"
#endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#pragma GCC diagnostic pop
#endif

namespace programmable_tokens {
    using fmt::format;

    template<typename R>
    auto format_range(const R &items, auto out_it) -> decltype(out_it)
    {
        bool first = true;
        for (const auto &item: items) {
            out_it = fmt::format_to(out_it, "{}{}", first ? "" : ", ", item);
            first = false;
        }
        return out_it;
    }
}

namespace fmt {
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (uint8_t v: data) {
                out_it = fmt::format_to(out_it, "{:02X}", v);
            }
            return out_it;
        }
    };

    template<size_t SZ>
    struct formatter<std::span<const uint8_t, SZ>>: formatter<std::span<const uint8_t>> {
    };

    template<typename T, typename A>
    struct formatter<std::vector<T, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::vector<T, A> &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return programmable_tokens::format_range(v, ctx.out());
        }
    };

    template<typename T, typename A>
    struct formatter<std::set<T, std::less<T>, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::set<T, std::less<T>, A> &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return programmable_tokens::format_range(v, ctx.out());
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "none");
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_FORMAT_HPP
