/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/logger.hpp>
#include <pt/registry.hpp>

namespace programmable_tokens {
    registry_key_list orphaned_keys(const buffer old_target, const buffer new_target, const registry_key_list &active_keys)
    {
        registry_key_list res {};
        // the pointer moves to an earlier key only when a node is inserted, and a move away from the tail is impossible
        if (old_target.empty() || old_target == new_target)
            return res;
        if (!new_target.empty() && new_target < old_target)
            return res;
        for (const auto &k: active_keys) {
            if (k.empty())
                continue;
            if (k < old_target)
                continue;
            if (!new_target.empty() && !(k < new_target))
                continue;
            res.emplace_back(k);
        }
        return res;
    }

    token_registry::token_registry(store::base &st): _store { st }
    {
        const auto rows = _store.registry_rows();
        for (const auto &row: rows)
            _cache(row);
        logger::info("loaded {} registry rows of {} protocol versions", rows.size(), _latest.size());
    }

    size_t token_registry::apply(const store::registry_row &row)
    {
        mutex::scoped_lock lk { _apply_mutex };
        std::optional<store::registry_row> prev {};
        size_t num_added = 0;
        if (_store.has_registry(store::registry_row_id::from_row(row))) {
            // the deletions implied by an already recorded state may have been lost before they were written
            logger::debug("registry node {} of version {} has already been observed", row, row.version);
            prev = _previous_state(row);
        } else {
            prev = find(row.version, row.key);
            if (!_insert(row))
                return 0;
            ++num_added;
        }
        if (prev && !prev->deleted) {
            registry_key_list active {};
            for (const auto &r: all_nodes(row.version)) {
                // nodes changed after this observation are not affected by it
                if (!r.deleted && r.slot <= row.slot)
                    active.emplace_back(r.key);
            }
            for (const auto &key: orphaned_keys(prev->next, row.next, active)) {
                auto del = *find(row.version, key);
                del.deleted = true;
                del.tx = row.tx;
                del.slot = row.slot;
                del.height = row.height;
                if (_insert(del)) {
                    logger::info("registry node #{} of version {} is removed by tx {}", key, row.version, row.tx);
                    ++num_added;
                }
            }
        }
        return num_added;
    }

    std::optional<store::registry_row> token_registry::_previous_state(const store::registry_row &row) const
    {
        const auto id = store::registry_row_id::from_row(row);
        std::optional<store::registry_row> prev {};
        for (auto &&r: _store.registry_rows(row.version)) {
            if (store::registry_row_id::from_row(r) == id)
                break;
            if (r.key == row.key)
                prev = std::move(r);
        }
        return prev;
    }

    bool token_registry::insert(const store::registry_row &row)
    {
        mutex::scoped_lock lk { _apply_mutex };
        return _insert(row);
    }

    store::registry_row_list token_registry::registered_tokens(const cardano::tx_hash &version) const
    {
        store::registry_row_list res {};
        for (auto &&row: all_nodes(version)) {
            if (!row.deleted && !row.is_sentinel())
                res.emplace_back(std::move(row));
        }
        return res;
    }

    store::registry_row_list token_registry::all_nodes(const cardano::tx_hash &version) const
    {
        store::registry_row_list res {};
        mutex::scoped_lock lk { _cache_mutex };
        if (const auto it = _latest.find(version); it != _latest.end()) {
            res.reserve(it->second.size());
            for (const auto &[key, row]: it->second)
                res.emplace_back(row);
        }
        return res;
    }

    store::registry_row_list token_registry::history(const cardano::tx_hash &version) const
    {
        return _store.registry_rows(version);
    }

    std::optional<store::registry_row> token_registry::find(const cardano::tx_hash &version, const buffer key) const
    {
        mutex::scoped_lock lk { _cache_mutex };
        if (const auto it = _latest.find(version); it != _latest.end()) {
            if (const auto k_it = it->second.find(registry_key { key }); k_it != it->second.end())
                return k_it->second;
        }
        return {};
    }

    bool token_registry::is_registered(const buffer policy) const
    {
        if (policy.empty())
            return false;
        mutex::scoped_lock lk { _cache_mutex };
        const registry_key key { policy };
        for (const auto &[ver, keys]: _latest) {
            if (const auto it = keys.find(key); it != keys.end() && !it->second.deleted)
                return true;
        }
        return false;
    }

    size_t token_registry::count(const cardano::tx_hash &version) const
    {
        return registered_tokens(version).size();
    }

    registry_key_list token_registry::chain(const cardano::tx_hash &version) const
    {
        key_map active {};
        for (auto &&row: all_nodes(version)) {
            if (!row.deleted)
                active.try_emplace(row.key, row);
        }
        registry_key_list res {};
        if (active.empty())
            return res;
        const auto head_it = active.find(registry_key {});
        if (head_it == active.end())
            throw error(fmt::format("the registry of version {} has active nodes but no sentinel", version));
        set<registry_key> seen {};
        registry_key prev {};
        for (auto cur = head_it->second.next; !cur.empty(); ) {
            const auto it = active.find(cur);
            if (it == active.end())
                throw error(fmt::format("the registry of version {} has a gap: node #{} after #{} is not active", version, cur, prev));
            if (!seen.emplace(cur).second)
                throw error(fmt::format("the registry of version {} has a cycle at node #{}", version, cur));
            if (!prev.empty() && !(prev < cur))
                throw error(fmt::format("the registry of version {} is misordered: #{} follows #{}", version, cur, prev));
            res.emplace_back(cur);
            prev = cur;
            cur = it->second.next;
        }
        if (res.size() + 1 != active.size())
            throw error(fmt::format("the registry of version {} has {} active nodes unreachable from the sentinel", version, active.size() - 1 - res.size()));
        return res;
    }

    void token_registry::_cache(const store::registry_row &row)
    {
        mutex::scoped_lock lk { _cache_mutex };
        auto &keys = _latest[row.version];
        auto [it, created] = keys.try_emplace(row.key, row);
        if (!created && row.slot >= it->second.slot)
            it->second = row;
    }

    bool token_registry::_insert(const store::registry_row &row)
    {
        if (!_store.add_registry(row))
            return false;
        _cache(row);
        return true;
    }
}
