/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_JSON_HPP
#define PROGRAMMABLE_TOKENS_JSON_HPP

#include <string>
#include <boost/json.hpp>
#include <pt/file.hpp>

namespace programmable_tokens::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf.string_view(), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    inline void _pretty(std::string &out, const json::value &jv, const size_t depth)
    {
        static constexpr size_t indent_step = 2;
        const auto sequence = [&](const char open, const char close, const size_t num_items, const auto &write_item) {
            if (num_items == 0) {
                out += open;
                out += close;
                return;
            }
            out += open;
            out += '\n';
            for (size_t i = 0; i < num_items; ++i) {
                out.append((depth + 1) * indent_step, ' ');
                write_item(i);
                if (i + 1 < num_items)
                    out += ',';
                out += '\n';
            }
            out.append(depth * indent_step, ' ');
            out += close;
        };
        switch (jv.kind()) {
            case json::kind::object: {
                const auto &obj = jv.get_object();
                auto it = obj.begin();
                sequence('{', '}', obj.size(), [&](size_t) {
                    out += json::serialize(it->key());
                    out += ": ";
                    _pretty(out, it->value(), depth + 1);
                    ++it;
                });
                break;
            }
            case json::kind::array: {
                const auto &arr = jv.get_array();
                sequence('[', ']', arr.size(), [&](const size_t i) {
                    _pretty(out, arr[i], depth + 1);
                });
                break;
            }
            default:
                out += json::serialize(jv);
                break;
        }
    }

    // objects and arrays one item per line, for the command-line output
    inline std::string serialize_pretty(const json::value &jv)
    {
        std::string res {};
        _pretty(res, jv, 0);
        return res;
    }
}

#endif // !PROGRAMMABLE_TOKENS_JSON_HPP
