/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_BIG_INT_HPP
#define PROGRAMMABLE_TOKENS_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <iterator>
#include <limits>
#include <boost/multiprecision/cpp_int.hpp>
#include <pt/bytes.hpp>
#include <pt/cbor/encoder.hpp>

namespace programmable_tokens {
    using boost::multiprecision::cpp_int;

    static constexpr size_t big_int_max_size = 8192;

    inline cpp_int big_uint_from_bytes(const buffer data)
    {
        if (data.size() > big_int_max_size)
            throw error(fmt::format("big ints larger than {} bytes are not supported but got: {}!", big_int_max_size, data.size()));
        cpp_int val = 0;
        for (const uint8_t b: data) {
            val <<= 8;
            val |= b;
        }
        return val;
    }

    // Amounts arrive as decimal strings with an optional sign
    inline cpp_int big_int_from_string(const std::string_view text)
    {
        if (text.empty())
            throw error("an empty string is not a valid integer!");
        size_t pos = text[0] == '-' || text[0] == '+' ? 1 : 0;
        if (pos == text.size())
            throw error(fmt::format("not a valid integer: '{}'", text));
        cpp_int val = 0;
        for (; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (c < '0' || c > '9')
                throw error(fmt::format("not a valid integer: '{}'", text));
            val *= 10;
            val += c - '0';
        }
        if (text[0] == '-')
            val = -val;
        return val;
    }

    inline std::string big_int_to_string(const cpp_int &val)
    {
        return val.str();
    }

    // integers beyond 64 bits are encoded as tagged big-endian byte strings: tag 2 for n and tag 3 for -1 - n
    inline void big_int_to_cbor(cbor::encoder &enc, const cpp_int &val)
    {
        const bool negative = val < 0;
        const cpp_int arg = negative ? cpp_int { -(val + 1) } : val;
        if (arg <= std::numeric_limits<uint64_t>::max()) {
            if (negative)
                enc.nint(static_cast<uint64_t>(arg));
            else
                enc.uint(static_cast<uint64_t>(arg));
            return;
        }
        uint8_vector bytes {};
        boost::multiprecision::export_bits(arg, std::back_inserter(bytes), 8);
        enc.tag(negative ? 3 : 2).bytes(bytes);
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<std::string> {
        template<typename FormatContext>
        auto format(const boost::multiprecision::number<T> &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string>::format(v.str(), ctx);
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_BIG_INT_HPP
