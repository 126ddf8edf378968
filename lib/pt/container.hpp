/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_CONTAINER_HPP
#define PROGRAMMABLE_TOKENS_CONTAINER_HPP

#include <map>
#include <set>
#include <vector>
#include <boost/container/flat_map.hpp>
#include <pt/error.hpp>

namespace programmable_tokens {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    using map = std::map<K, V>;

    template<typename T, typename C=std::less<T>>
    using set = std::set<T, C>;

    // sorted vector storage for small maps that are copied and compared often
    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;
    };
}

namespace fmt {
    template<typename K, typename V>
    struct formatter<programmable_tokens::flat_map<K, V>>: formatter<int> {
        template<typename FormatContext>
        auto format(const programmable_tokens::flat_map<K, V> &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "{{");
            bool first = true;
            for (const auto &[k, val]: v) {
                out_it = fmt::format_to(out_it, "{}{}: {}", first ? "" : ", ", k, val);
                first = false;
            }
            return fmt::format_to(out_it, "}}");
        }
    };
}

#endif // !PROGRAMMABLE_TOKENS_CONTAINER_HPP
