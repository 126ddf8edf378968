/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/logger.hpp>
#include <pt/store/memory.hpp>

namespace programmable_tokens::store {
    bool memory::add_version(const protocol_version &ver)
    {
        mutex::scoped_lock lk { _mutex };
        if (const auto [it, created] = _version_ids.emplace(ver.tx); !created) {
            logger::debug("protocol version {} is already known", ver.tx);
            return false;
        }
        _versions.emplace_back(ver);
        return true;
    }

    protocol_version_list memory::versions() const
    {
        mutex::scoped_lock lk { _mutex };
        return _versions;
    }

    bool memory::has_version(const tx_hash &tx) const
    {
        mutex::scoped_lock lk { _mutex };
        return _version_ids.contains(tx);
    }

    bool memory::add_registry(const registry_row &row)
    {
        mutex::scoped_lock lk { _mutex };
        if (const auto [it, created] = _registry_ids.emplace(registry_row_id::from_row(row)); !created) {
            logger::debug("registry row {} is already known", row);
            return false;
        }
        _registry_by_version[row.version].emplace_back(_registry.size());
        _registry.emplace_back(row);
        return true;
    }

    bool memory::has_registry(const registry_row_id &id) const
    {
        mutex::scoped_lock lk { _mutex };
        return _registry_ids.contains(id);
    }

    registry_row_list memory::registry_rows() const
    {
        mutex::scoped_lock lk { _mutex };
        return _registry;
    }

    registry_row_list memory::registry_rows(const tx_hash &version) const
    {
        registry_row_list res {};
        mutex::scoped_lock lk { _mutex };
        if (const auto it = _registry_by_version.find(version); it != _registry_by_version.end()) {
            res.reserve(it->second.size());
            for (const auto idx: it->second)
                res.emplace_back(_registry[idx]);
        }
        return res;
    }

    bool memory::add_balance(const balance_row &row)
    {
        mutex::scoped_lock lk { _mutex };
        if (const auto [it, created] = _balance_ids.emplace(balance_row_id { row.address, row.tx }); !created) {
            logger::debug("balance row of {} for tx {} is already known", row.address, row.tx);
            return false;
        }
        const auto idx = _balances.size();
        _balances_by_addr[row.address].emplace_back(idx);
        _balances_by_tx[row.tx].emplace_back(idx);
        _balances.emplace_back(row);
        return true;
    }

    bool memory::has_balance(const balance_row_id &id) const
    {
        mutex::scoped_lock lk { _mutex };
        return _balance_ids.contains(id);
    }

    std::optional<balance_row> memory::latest_balance(const buffer address) const
    {
        mutex::scoped_lock lk { _mutex };
        if (const auto it = _balances_by_addr.find(uint8_vector { address }); it != _balances_by_addr.end() && !it->second.empty())
            return _balances[it->second.back()];
        return {};
    }

    balance_row_list memory::balance_history(const buffer address, const size_t limit) const
    {
        balance_row_list res {};
        mutex::scoped_lock lk { _mutex };
        if (const auto it = _balances_by_addr.find(uint8_vector { address }); it != _balances_by_addr.end()) {
            for (auto idx_it = it->second.rbegin(); idx_it != it->second.rend(); ++idx_it) {
                if (limit > 0 && res.size() >= limit)
                    break;
                res.emplace_back(_balances[*idx_it]);
            }
        }
        return res;
    }

    balance_row_list memory::balances_by_tx(const tx_hash &tx) const
    {
        balance_row_list res {};
        mutex::scoped_lock lk { _mutex };
        if (const auto it = _balances_by_tx.find(tx); it != _balances_by_tx.end()) {
            for (const auto idx: it->second)
                res.emplace_back(_balances[idx]);
        }
        return res;
    }

    balance_row_list memory::balance_rows() const
    {
        mutex::scoped_lock lk { _mutex };
        return _balances;
    }
}
