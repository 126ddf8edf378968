/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/cbor/zero.hpp>
#include <pt/plutus/data.hpp>

namespace programmable_tokens::plutus {
    static constexpr size_t max_bytes_chunk = 64;

    bool data_constr::operator==(const data_constr &o) const
    {
        return tag == o.tag && fields == o.fields;
    }

    bool data_pair::operator==(const data_pair &o) const
    {
        return first == o.first && second == o.second;
    }

    bool data::operator==(const data &o) const
    {
        return val == o.val;
    }

    data data::constr(const uint64_t tag, data_list fields)
    {
        return { data_constr { tag, std::move(fields) } };
    }

    data data::bytes(const buffer bytes)
    {
        return { uint8_vector { bytes } };
    }

    data data::bint(cpp_int val)
    {
        return { std::move(val) };
    }

    data data::list(data_list items)
    {
        return { std::move(items) };
    }

    data data::map(data_map pairs)
    {
        return { std::move(pairs) };
    }

    template<typename T>
    static const T &_as(const data::value_type &val, const std::string_view name)
    {
        if (const auto *ptr = std::get_if<T>(&val); ptr) [[likely]]
            return *ptr;
        throw error(fmt::format("expected plutus data of type {} but got alternative #{}", name, val.index()));
    }

    const data_constr &data::as_constr() const
    {
        return _as<data_constr>(val, "constr");
    }

    const data_map &data::as_map() const
    {
        return _as<data_map>(val, "map");
    }

    const data_list &data::as_list() const
    {
        return _as<data_list>(val, "list");
    }

    const cpp_int &data::as_bint() const
    {
        return _as<cpp_int>(val, "bint");
    }

    const uint8_vector &data::as_bytes() const
    {
        return _as<uint8_vector>(val, "bytes");
    }

    static data _from_cbor(cbor::zero::value v);

    static data_list _from_cbor(cbor::zero::value::array_iterator it)
    {
        data_list dl {};
        dl.reserve(it.size());
        while (!it.done())
            dl.emplace_back(_from_cbor(it.next()));
        return dl;
    }

    static data _from_cbor(const cbor::zero::value v)
    {
        switch (const auto typ = v.type(); typ) {
            case cbor::major_type::tag: {
                auto [id, val] = v.tag();
                switch (id) {
                    case 2:
                    case 3:
                        return data::bint(v.big_int());
                    default: {
                        if (id >= 121 && id < 128) {
                            id -= 121;
                        } else if (id >= 1280 && id < 1280 + 128) {
                            id -= 1280 - 7;
                        } else if (id == 102) {
                            auto it = val.array();
                            if (it.size() != 2)
                                throw error(fmt::format("a tag 102 constructor must be a two-element array but has {} elements", it.size()));
                            id = it.next().uint();
                            val = it.next();
                        } else {
                            throw error(fmt::format("unsupported tag id: {}", id));
                        }
                        return data::constr(id, _from_cbor(val.array()));
                    }
                }
            }
            case cbor::major_type::array:
                return data::list(_from_cbor(v.array()));
            case cbor::major_type::map: {
                data_map m {};
                auto it = v.map();
                while (!it.done()) {
                    const auto [k, val] = it.next();
                    auto kd = _from_cbor(k);
                    auto vd = _from_cbor(val);
                    m.emplace_back(data_pair { std::move(kd), std::move(vd) });
                }
                return data::map(std::move(m));
            }
            case cbor::major_type::bytes: {
                uint8_vector buf {};
                v.bytes_alloc(buf);
                return data::bytes(buf);
            }
            case cbor::major_type::uint:
            case cbor::major_type::nint:
                return data::bint(v.big_int());
            default:
                throw error(fmt::format("unsupported CBOR type {}!", typ));
        }
    }

    data data::from_cbor(const buffer bytes)
    {
        cbor::zero::decoder dec { bytes };
        auto res = _from_cbor(dec.read());
        if (!dec.done())
            throw error(fmt::format("plutus data is followed by {} unexpected bytes", dec.remaining()));
        return res;
    }

    static void _to_cbor(cbor::encoder &enc, const data &c);

    static void _to_cbor(cbor::encoder &enc, const uint8_vector &b)
    {
        if (b.size() <= max_bytes_chunk) {
            enc.bytes(b);
        } else {
            enc.bytes();
            for (size_t i = 0; i < b.size(); i += max_bytes_chunk)
                enc.bytes(buffer { b.data() + i, std::min(max_bytes_chunk, b.size() - i) });
            enc.s_break();
        }
    }

    static void _to_cbor(cbor::encoder &enc, const data_list &l)
    {
        if (!l.empty()) {
            enc.array();
            for (const auto &d: l)
                _to_cbor(enc, d);
            enc.s_break();
        } else {
            enc.array(0);
        }
    }

    static void _to_cbor(cbor::encoder &enc, const data &c)
    {
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, data_map>) {
                enc.map(v.size());
                for (const auto &p: v) {
                    _to_cbor(enc, p.first);
                    _to_cbor(enc, p.second);
                }
            } else if constexpr (std::is_same_v<T, data_constr>) {
                if (v.tag <= 6) {
                    enc.tag(v.tag + 121);
                } else if (v.tag <= 127) {
                    enc.tag(v.tag - 7 + 1280);
                } else {
                    enc.tag(102);
                    enc.array(2);
                    enc.uint(v.tag);
                }
                _to_cbor(enc, v.fields);
            } else if constexpr (std::is_same_v<T, cpp_int>) {
                big_int_to_cbor(enc, v);
            } else {
                _to_cbor(enc, v);
            }
        }, c.val);
    }

    void data::to_cbor(cbor::encoder &enc) const
    {
        _to_cbor(enc, *this);
    }

    uint8_vector data::as_cbor() const
    {
        cbor::encoder enc {};
        _to_cbor(enc, *this);
        return std::move(enc.cbor());
    }

    static void _to_string(std::string &out, const data &d)
    {
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, data_constr>) {
                out += fmt::format("Constr {} [", v.tag);
                for (auto it = v.fields.begin(); it != v.fields.end(); ++it) {
                    if (it != v.fields.begin())
                        out += ", ";
                    _to_string(out, *it);
                }
                out += "]";
            } else if constexpr (std::is_same_v<T, data_map>) {
                out += "Map [";
                for (auto it = v.begin(); it != v.end(); ++it) {
                    if (it != v.begin())
                        out += ", ";
                    out += "(";
                    _to_string(out, it->first);
                    out += ", ";
                    _to_string(out, it->second);
                    out += ")";
                }
                out += "]";
            } else if constexpr (std::is_same_v<T, data_list>) {
                out += "List [";
                for (auto it = v.begin(); it != v.end(); ++it) {
                    if (it != v.begin())
                        out += ", ";
                    _to_string(out, *it);
                }
                out += "]";
            } else if constexpr (std::is_same_v<T, cpp_int>) {
                out += fmt::format("I {}", v);
            } else {
                out += fmt::format("B #{}", buffer_lowercase { v.data(), v.size() });
            }
        }, d.val);
    }

    std::string data::to_string() const
    {
        std::string res {};
        _to_string(res, *this);
        return res;
    }
}
