/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CBOR_ENCODER_HPP
#define PROGRAMMABLE_TOKENS_CBOR_ENCODER_HPP

#include <limits>
#include <pt/bytes.hpp>
#include <pt/cbor/types.hpp>

namespace programmable_tokens::cbor {
    /*
     * Appends CBOR items to an internal buffer. Containers are opened with their item count
     * or, when the count is omitted, as indefinite ones that must be closed with s_break.
     */
    struct encoder {
        encoder &array()
        {
            return _indefinite(major_type::array);
        }

        encoder &array(const size_t sz)
        {
            return _head(major_type::array, sz);
        }

        encoder &map(const size_t sz)
        {
            return _head(major_type::map, sz);
        }

        encoder &uint(const uint64_t val)
        {
            return _head(major_type::uint, val);
        }

        // val is the CBOR argument, so the encoded number is -1 - val
        encoder &nint(const uint64_t val)
        {
            return _head(major_type::nint, val);
        }

        encoder &bytes()
        {
            return _indefinite(major_type::bytes);
        }

        encoder &bytes(const buffer buf)
        {
            _head(major_type::bytes, buf.size());
            _buf << buf;
            return *this;
        }

        encoder &text(const std::string_view sv)
        {
            _head(major_type::text, sv.size());
            _buf << buffer { sv };
            return *this;
        }

        encoder &tag(const uint64_t id)
        {
            return _head(major_type::tag, id);
        }

        encoder &boolean(const bool val)
        {
            return _simple(val ? special_val::s_true : special_val::s_false);
        }

        encoder &s_null()
        {
            return _simple(special_val::s_null);
        }

        encoder &s_break()
        {
            return _simple(special_val::s_break);
        }

        [[nodiscard]] uint8_vector &cbor()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &cbor() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        encoder &_initial_byte(const major_type typ, const uint8_t info)
        {
            _buf.emplace_back((static_cast<uint8_t>(typ) << 5) | (info & 0x1F));
            return *this;
        }

        encoder &_simple(const special_val sv)
        {
            return _initial_byte(major_type::simple, static_cast<uint8_t>(sv));
        }

        encoder &_indefinite(const major_type typ)
        {
            return _initial_byte(typ, static_cast<uint8_t>(special_val::s_break));
        }

        encoder &_head(const major_type typ, const uint64_t val)
        {
            if (val < 24)
                return _initial_byte(typ, static_cast<uint8_t>(val));
            size_t num_bytes = 8;
            special_val info = special_val::eight_bytes;
            if (val <= std::numeric_limits<uint8_t>::max()) {
                num_bytes = 1;
                info = special_val::one_byte;
            } else if (val <= std::numeric_limits<uint16_t>::max()) {
                num_bytes = 2;
                info = special_val::two_bytes;
            } else if (val <= std::numeric_limits<uint32_t>::max()) {
                num_bytes = 4;
                info = special_val::four_bytes;
            }
            _initial_byte(typ, static_cast<uint8_t>(info));
            for (size_t i = num_bytes; i > 0; --i)
                _buf.emplace_back(static_cast<uint8_t>(val >> ((i - 1) * 8)));
            return *this;
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_CBOR_ENCODER_HPP
