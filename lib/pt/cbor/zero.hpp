/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

/*
 * A zero-copy CBOR parser. Values reference the parsed buffer, so the buffer must outlive them.
 * Datums are small, so random access recomputes offsets instead of caching them.
 */
#ifndef PROGRAMMABLE_TOKENS_CBOR_ZERO_HPP
#define PROGRAMMABLE_TOKENS_CBOR_ZERO_HPP

#include <pt/big-int.hpp>
#include <pt/cbor/types.hpp>
#include <pt/container.hpp>

namespace programmable_tokens::cbor::zero {
    typedef programmable_tokens::error error;

    // datums come from untrusted transactions, so recursion is bounded
    static constexpr size_t max_nesting_depth = 256;

    // the initial byte of an item and the argument that follows it
    struct item_head {
        major_type type = major_type::uint;
        special_val info = special_val::s_false;
        uint64_t arg = 0;
        size_t size = 1;

        bool indefinite() const noexcept
        {
            return info == special_val::s_break;
        }

        bool is_break() const noexcept
        {
            return type == major_type::simple && info == special_val::s_break;
        }
    };

    inline item_head read_head(const buffer data)
    {
        if (data.empty()) [[unlikely]]
            throw error("insufficient data to parse a CBOR value");
        item_head h { static_cast<major_type>(data[0] >> 5), static_cast<special_val>(data[0] & 0x1F) };
        switch (h.info) {
            case special_val::one_byte: h.size = 2; break;
            case special_val::two_bytes: h.size = 3; break;
            case special_val::four_bytes: h.size = 5; break;
            case special_val::eight_bytes: h.size = 9; break;
            default:
                if (const auto info = static_cast<uint8_t>(h.info); info > 27 && info < 31) [[unlikely]]
                    throw error(fmt::format("reserved CBOR additional info value: {}", info));
                h.arg = static_cast<uint64_t>(h.info);
                return h;
        }
        if (data.size() < h.size) [[unlikely]]
            throw error("insufficient data to parse a CBOR value");
        for (size_t i = 1; i < h.size; ++i)
            h.arg = (h.arg << 8) | data[i];
        return h;
    }

    struct item_extent {
        size_t size = 0;
        // the number of items in an array or of pairs in a map
        uint64_t count = 0;
    };

    // Validates the item at the start of data and returns its encoded size
    inline item_extent measure(const buffer data, const size_t depth=0)
    {
        const auto h = read_head(data);
        switch (h.type) {
            case major_type::uint:
            case major_type::nint:
                if (h.indefinite()) [[unlikely]]
                    throw error("an integer cannot have an indefinite length");
                return { h.size };
            case major_type::simple:
                if (h.is_break()) [[unlikely]]
                    throw error("unexpected break outside of an indefinite-length item");
                return { h.size };
            case major_type::bytes:
            case major_type::text: {
                if (!h.indefinite()) {
                    if (h.arg > data.size() - h.size) [[unlikely]]
                        throw error("insufficient data to parse a CBOR value");
                    return { h.size + static_cast<size_t>(h.arg) };
                }
                size_t pos = h.size;
                for (;;) {
                    const auto chunk = read_head(data.subbuf(pos));
                    if (chunk.is_break())
                        return { pos + chunk.size };
                    if (chunk.type != h.type || chunk.indefinite()) [[unlikely]]
                        throw error(fmt::format("chunks of an indefinite {} string must be definite {} strings", h.type, h.type));
                    pos += measure(data.subbuf(pos), depth).size;
                }
            }
            case major_type::array:
            case major_type::map:
            case major_type::tag: {
                if (depth >= max_nesting_depth) [[unlikely]]
                    throw error(fmt::format("CBOR values nested deeper than {} levels are not supported!", max_nesting_depth));
                if (h.type == major_type::tag) {
                    if (h.indefinite()) [[unlikely]]
                        throw error("a tag cannot have an indefinite length");
                    return { h.size + measure(data.subbuf(h.size), depth + 1).size };
                }
                const size_t items_per_entry = h.type == major_type::map ? 2 : 1;
                item_extent ext { h.size };
                for (;;) {
                    if (h.indefinite()) {
                        if (const auto next = read_head(data.subbuf(ext.size)); next.is_break()) {
                            ext.size += next.size;
                            return ext;
                        }
                    } else if (ext.count == h.arg) {
                        return ext;
                    }
                    for (size_t i = 0; i < items_per_entry; ++i)
                        ext.size += measure(data.subbuf(ext.size), depth + 1).size;
                    ++ext.count;
                }
            }
            default:
                throw error(fmt::format("unsupported CBOR type {}", h.type));
        }
    }

    struct value;

    // reads consecutive items from a buffer
    struct decoder {
        decoder(const buffer data): _data { data }
        {
        }

        bool done() const noexcept
        {
            return _pos >= _data.size();
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        // true when the next byte closes an indefinite-length item
        bool at_break() const
        {
            return !done() && read_head(_data.subbuf(_pos)).is_break();
        }

        value read();
    private:
        buffer _data;
        size_t _pos = 0;
    };

    struct value {
        using map_item = std::pair<value, value>;
        using tag_item = std::pair<uint64_t, value>;

        template<typename T>
        struct sequence_iterator {
            sequence_iterator(const value &v): _dec { v._raw.subbuf(v._head.size) }, _size { v._count }
            {
            }

            sequence_iterator &skip(const size_t num_items)
            {
                for (size_t i = 0; i < num_items; ++i)
                    next();
                return *this;
            }

            T next()
            {
                if (done()) [[unlikely]]
                    throw error(fmt::format("iteration past the end of a sequence of {} items", _size));
                ++_pos;
                if constexpr (std::is_same_v<T, map_item>) {
                    auto k = _dec.read();
                    return { std::move(k), _dec.read() };
                } else {
                    return _dec.read();
                }
            }

            bool done() const noexcept
            {
                return _pos >= _size;
            }

            size_t size() const noexcept
            {
                return _size;
            }
        private:
            decoder _dec;
            uint64_t _pos = 0;
            uint64_t _size;
        };
        using array_iterator = sequence_iterator<value>;
        using map_iterator = sequence_iterator<map_item>;

        value(const buffer raw, const item_extent &ext): _raw { raw }, _head { read_head(raw) }, _count { ext.count }
        {
        }

        major_type type() const noexcept
        {
            return _head.type;
        }

        special_val special() const noexcept
        {
            return _head.info;
        }

        bool indefinite() const
        {
            switch (type()) {
                case major_type::bytes:
                case major_type::text:
                case major_type::array:
                case major_type::map:
                    return _head.indefinite();
                default:
                    throw error(fmt::format("only strings, arrays and maps can be indefinite but got {}", type()));
            }
        }

        uint64_t uint() const
        {
            if (type() != major_type::uint && type() != major_type::nint) [[unlikely]]
                throw error(fmt::format("expected an integer but got {}", type()));
            return _head.arg;
        }

        cpp_int big_int() const
        {
            switch (type()) {
                case major_type::uint:
                    return cpp_int { uint() };
                case major_type::nint:
                    return -1 - cpp_int { uint() };
                case major_type::tag: {
                    const auto [id, payload] = tag();
                    if (id != 2 && id != 3) [[unlikely]]
                        throw error(fmt::format("tag {} does not denote a big integer", id));
                    uint8_vector bytes {};
                    payload.bytes_alloc(bytes);
                    const auto n = big_uint_from_bytes(bytes);
                    return id == 2 ? n : cpp_int { -1 - n };
                }
                default:
                    throw error(fmt::format("cannot interpret cbor value as a bigint: {}", stringify()));
            }
        }

        buffer bytes() const
        {
            _expect(major_type::bytes);
            if (_head.indefinite()) [[unlikely]]
                throw error("an indefinite byte string must be read with bytes_alloc");
            return _raw.subbuf(_head.size);
        }

        // concatenates the chunks of an indefinite byte string
        uint8_vector &bytes_alloc(uint8_vector &res) const
        {
            _expect(major_type::bytes);
            res.clear();
            if (!_head.indefinite()) {
                res << _raw.subbuf(_head.size);
                return res;
            }
            decoder dec { _raw.subbuf(_head.size) };
            while (!dec.at_break())
                res << dec.read().bytes();
            return res;
        }

        std::string_view text() const
        {
            _expect(major_type::text);
            if (_head.indefinite()) [[unlikely]]
                throw error("indefinite text strings are not supported");
            return _raw.subbuf(_head.size).string_view();
        }

        size_t size() const
        {
            if (type() != major_type::array && type() != major_type::map) [[unlikely]]
                throw error(fmt::format("only arrays and maps have a number of items but got {}", type()));
            return _count;
        }

        array_iterator array() const
        {
            _expect(major_type::array);
            return { *this };
        }

        map_iterator map() const
        {
            _expect(major_type::map);
            return { *this };
        }

        value at(const size_t idx) const
        {
            return array().skip(idx).next();
        }

        tag_item tag() const
        {
            _expect(major_type::tag);
            return { _head.arg, decoder { _raw.subbuf(_head.size) }.read() };
        }

        special_val simple() const
        {
            _expect(major_type::simple);
            return _head.info;
        }

        std::string stringify(size_t max_seq_to_expand=0) const;
    private:
        buffer _raw;
        item_head _head;
        uint64_t _count;

        void _expect(const major_type typ) const
        {
            if (type() != typ) [[unlikely]]
                throw error(fmt::format("expected a CBOR {} but got {}", typ, type()));
        }
    };

    inline value decoder::read()
    {
        const auto rest = _data.subbuf(_pos);
        const auto ext = measure(rest);
        _pos += ext.size;
        return { rest.subbuf(0, ext.size), ext };
    }

    // a single-line rendering for log messages; sequences longer than max_seq_to_expand are summarized
    inline void _stringify(std::string &out, const value v, const size_t max_seq_to_expand)
    {
        const auto expand = [&](const size_t sz) {
            return max_seq_to_expand == 0 || sz <= max_seq_to_expand;
        };
        switch (v.type()) {
            case major_type::uint:
                fmt::format_to(std::back_inserter(out), "{}", v.uint());
                break;
            case major_type::nint:
                fmt::format_to(std::back_inserter(out), "-{}", cpp_int { cpp_int { v.uint() } + 1 });
                break;
            case major_type::bytes: {
                uint8_vector bytes {};
                v.bytes_alloc(bytes);
                fmt::format_to(std::back_inserter(out), "h'{}'", buffer_lowercase { bytes.data(), bytes.size() });
                break;
            }
            case major_type::text:
                fmt::format_to(std::back_inserter(out), "\"{}\"", v.text());
                break;
            case major_type::array:
                if (!expand(v.size())) {
                    fmt::format_to(std::back_inserter(out), "[{} items]", v.size());
                    break;
                }
                out += '[';
                for (auto it = v.array(); !it.done(); ) {
                    _stringify(out, it.next(), max_seq_to_expand);
                    if (!it.done())
                        out += ", ";
                }
                out += ']';
                break;
            case major_type::map:
                if (!expand(v.size())) {
                    fmt::format_to(std::back_inserter(out), "{{{} items}}", v.size());
                    break;
                }
                out += '{';
                for (auto it = v.map(); !it.done(); ) {
                    const auto [k, val] = it.next();
                    _stringify(out, k, max_seq_to_expand);
                    out += ": ";
                    _stringify(out, val, max_seq_to_expand);
                    if (!it.done())
                        out += ", ";
                }
                out += '}';
                break;
            case major_type::tag: {
                const auto t = v.tag();
                fmt::format_to(std::back_inserter(out), "{}(", t.first);
                _stringify(out, t.second, max_seq_to_expand);
                out += ')';
                break;
            }
            case major_type::simple:
                fmt::format_to(std::back_inserter(out), "{}", v.special());
                break;
            default:
                throw error(fmt::format("unsupported CBOR type {}", v.type()));
        }
    }

    inline std::string value::stringify(const size_t max_seq_to_expand) const
    {
        std::string res {};
        _stringify(res, *this, max_seq_to_expand);
        return res;
    }

    inline value parse(const buffer data)
    {
        decoder dec { data };
        return dec.read();
    }
}

namespace fmt {
    template<>
    struct formatter<programmable_tokens::cbor::zero::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.stringify());
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_CBOR_ZERO_HPP
