/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <array>
#include <cctype>
#include <pt/cardano/bech32.hpp>

namespace programmable_tokens::cardano::bech32 {
    static constexpr char separator = '1';
    static constexpr std::string_view charset { "qpzry9x8gf2tvdw0s3jn54khce6mua7l" };
    static constexpr size_t checksum_size = 6;

    static uint8_t decode_char(const char k)
    {
        const auto pos = charset.find(static_cast<char>(std::tolower(k)));
        if (pos == charset.npos) [[unlikely]]
            throw error(fmt::format("unsupported bech32 data char: '{}'", k));
        return static_cast<uint8_t>(pos);
    }

    static uint32_t polymod(const std::vector<uint8_t> &vals)
    {
        static constexpr std::array<uint32_t, 5> gen { 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
        uint32_t chk = 1;
        for (const auto v: vals) {
            const uint32_t b = chk >> 25;
            chk = (chk & 0x1ffffff) << 5 ^ v;
            for (size_t i = 0; i < gen.size(); ++i)
                chk ^= (b >> i) & 1 ? gen[i] : 0;
        }
        return chk;
    }

    static std::vector<uint8_t> expand_prefix(const std::string_view prefix)
    {
        std::vector<uint8_t> x {};
        x.reserve(prefix.size() * 2 + 1);
        for (const auto k: prefix)
            x.push_back(std::tolower(k) >> 5);
        x.push_back(0);
        for (const auto k: prefix)
            x.push_back(std::tolower(k) & 31);
        return x;
    }

    decoded decode(const std::string_view text)
    {
        const auto sep_pos = text.rfind(separator);
        if (sep_pos == text.npos || sep_pos == 0)
            throw error(fmt::format("can't find bech32 separator '{}' in '{}'", separator, text));
        const auto prefix = text.substr(0, sep_pos);
        const auto data = text.substr(sep_pos + 1);
        if (data.size() < checksum_size)
            throw error(fmt::format("bech32 data part must be at least {} characters long: {}", checksum_size, data));
        std::vector<uint8_t> u5_data {};
        u5_data.reserve(data.size());
        for (const auto k: data)
            u5_data.push_back(decode_char(k));
        auto chk_data = expand_prefix(prefix);
        chk_data.insert(chk_data.end(), u5_data.begin(), u5_data.end());
        if (polymod(chk_data) != 1)
            throw error(fmt::format("bech32 checksum verification failed: {}", text));

        decoded res { std::string { prefix }, {} };
        uint32_t acc = 0;
        uint32_t bits = 0;
        for (size_t i = 0; i < u5_data.size() - checksum_size; ++i) {
            acc = (acc << 5) | u5_data[i];
            bits += 5;
            while (bits >= 8) {
                bits -= 8;
                res.data.emplace_back((acc >> bits) & 0xFF);
            }
        }
        if (bits >= 5)
            throw error(fmt::format("bech32 data has an incomplete byte with more than 4 padding bits: {}", text));
        if ((acc & ((1U << bits) - 1)) != 0)
            throw error(fmt::format("bech32 padding bits must be zero: {}", text));
        return res;
    }

    std::string encode(const std::string_view prefix, const buffer data)
    {
        std::vector<uint8_t> u5_data {};
        u5_data.reserve(data.size() * 8 / 5 + 1);
        uint32_t acc = 0;
        uint32_t bits = 0;
        for (const auto b: data) {
            acc = (acc << 8) | b;
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                u5_data.push_back((acc >> bits) & 31);
            }
        }
        if (bits > 0)
            u5_data.push_back((acc << (5 - bits)) & 31);

        auto chk_data = expand_prefix(prefix);
        chk_data.insert(chk_data.end(), u5_data.begin(), u5_data.end());
        chk_data.insert(chk_data.end(), checksum_size, 0);
        const auto chk = polymod(chk_data) ^ 1;

        std::string res { prefix };
        res.reserve(prefix.size() + 1 + u5_data.size() + checksum_size);
        res += separator;
        for (const auto v: u5_data)
            res += charset[v];
        for (size_t i = 0; i < checksum_size; ++i)
            res += charset[(chk >> (5 * (checksum_size - 1 - i))) & 31];
        return res;
    }
}
