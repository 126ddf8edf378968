/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_ARRAY_HPP
#define PROGRAMMABLE_TOKENS_ARRAY_HPP

#include <array>
#include <cstring>
#include <span>
#include <pt/bytes.hpp>

namespace programmable_tokens {
    // hashes and other fixed-size binary identifiers; printed as lower-case hex
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const buffer s)
        {
            _assign(s);
        }

        byte_array &operator=(const buffer s)
        {
            _assign(s);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        buffer span() const noexcept
        {
            return { base_type::data(), SZ };
        }
    private:
        void _assign(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("expected {} bytes but got {}: {}", SZ, s.size(), s));
            memcpy(base_type::data(), s.data(), SZ);
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<programmable_tokens::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", programmable_tokens::buffer_lowercase { v.data(), v.size() });
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_ARRAY_HPP
