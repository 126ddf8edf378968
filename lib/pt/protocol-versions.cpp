/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <algorithm>
#include <pt/logger.hpp>
#include <pt/protocol-versions.hpp>

namespace programmable_tokens {
    static bool _slot_less(const uint64_t slot, const store::protocol_version &v)
    {
        return slot < v.slot;
    }

    protocol_version_registry::protocol_version_registry(store::base &st): _store { st }
    {
        auto versions = _store.versions();
        std::stable_sort(versions.begin(), versions.end(), [](const auto &a, const auto &b) {
            return a.slot < b.slot;
        });
        logger::info("loaded {} protocol versions", versions.size());
        _snapshot = std::make_shared<const store::protocol_version_list>(std::move(versions));
    }

    store::protocol_version protocol_version_registry::save(const store::protocol_version &ver)
    {
        mutex::scoped_lock write_lk { _write_mutex };
        const auto snap = all();
        for (const auto &v: *snap) {
            if (v.tx == ver.tx)
                return v;
        }
        _store.add_version(ver);
        auto updated = std::make_shared<store::protocol_version_list>();
        updated->reserve(snap->size() + 1);
        const auto pos = std::upper_bound(snap->begin(), snap->end(), ver.slot, _slot_less);
        updated->insert(updated->end(), snap->begin(), pos);
        updated->emplace_back(ver);
        updated->insert(updated->end(), pos, snap->end());
        {
            mutex::scoped_lock lk { _snapshot_mutex };
            _snapshot = std::move(updated);
        }
        logger::info("new protocol version {}", ver);
        return ver;
    }

    std::optional<store::protocol_version> protocol_version_registry::latest() const
    {
        const auto snap = all();
        if (snap->empty())
            return {};
        return snap->back();
    }

    std::optional<store::protocol_version> protocol_version_registry::valid_at_slot(const uint64_t slot) const
    {
        const auto snap = all();
        for (auto it = snap->rbegin(); it != snap->rend(); ++it) {
            if (it->slot <= slot)
                return *it;
        }
        return {};
    }

    std::optional<store::protocol_version> protocol_version_registry::by_tx_hash(const cardano::tx_hash &tx) const
    {
        const auto snap = all();
        const auto it = std::find_if(snap->begin(), snap->end(), [&](const auto &v) { return v.tx == tx; });
        if (it != snap->end())
            return *it;
        return {};
    }

    std::optional<store::protocol_version> protocol_version_registry::by_slot(const uint64_t slot) const
    {
        const auto snap = all();
        const auto it = std::find_if(snap->begin(), snap->end(), [&](const auto &v) { return v.slot == slot; });
        if (it != snap->end())
            return *it;
        return {};
    }

    bool protocol_version_registry::exists(const cardano::tx_hash &tx) const
    {
        return by_tx_hash(tx).has_value();
    }

    store::protocol_version_list protocol_version_registry::known_at_slot(const uint64_t slot) const
    {
        const auto snap = all();
        return { snap->begin(), std::upper_bound(snap->begin(), snap->end(), slot, _slot_less) };
    }

    protocol_version_registry::snapshot_ptr protocol_version_registry::all() const
    {
        mutex::scoped_lock lk { _snapshot_mutex };
        return _snapshot;
    }
}
