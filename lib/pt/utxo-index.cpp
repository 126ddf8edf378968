/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <filesystem>
#include <pt/logger.hpp>
#include <pt/store/file.hpp>
#include <pt/utxo-index.hpp>

namespace programmable_tokens::utxo {
    bool is_tracked(const cardano::address &addr, const tracked_credentials &tracked)
    {
        const auto pay_id = addr.pay_id();
        return pay_id && tracked.contains(pay_id->hash);
    }

    std::optional<entry> index_memory::lookup(const cardano::tx_out_ref &ref) const
    {
        mutex::scoped_lock lk { _mutex };
        if (const auto it = _entries.find(ref); it != _entries.end())
            return it->second;
        return {};
    }

    void index_memory::observe(const transaction &tx, const tracked_credentials &tracked)
    {
        for (size_t i = 0; i < tx.outputs.size(); ++i) {
            const auto &out = tx.outputs[i];
            if (is_tracked(out.address, tracked))
                add(cardano::tx_out_ref { tx.hash, static_cast<uint32_t>(i) }, entry { out.address, out.amounts });
        }
    }

    void index_memory::add(const cardano::tx_out_ref &ref, const entry &e)
    {
        mutex::scoped_lock lk { _mutex };
        _entries.insert_or_assign(ref, e);
    }

    size_t index_memory::size() const
    {
        mutex::scoped_lock lk { _mutex };
        return _entries.size();
    }

    index_file::index_file(const std::string &data_dir)
    {
        std::filesystem::create_directories(data_dir);
        const auto path = (std::filesystem::path { data_dir } / file_name).string();
        const auto num_loaded = store::load_records(path, [&](const auto v) {
            auto it = v.array();
            if (it.size() != 4)
                throw error(fmt::format("a serialized utxo must have 4 items but has {}", it.size()));
            cardano::tx_out_ref ref {};
            ref.hash = it.next().bytes();
            ref.idx = static_cast<uint32_t>(it.next().uint());
            cardano::address addr { it.next().bytes() };
            index_memory::add(ref, entry { std::move(addr), store::value_from_cbor(it.next()) });
        });
        logger::info("{}: loaded {} outputs", path, num_loaded);
        _os = std::make_unique<file::append_stream>(path);
    }

    void index_file::add(const cardano::tx_out_ref &ref, const entry &e)
    {
        mutex::scoped_lock lk { _write_mutex };
        if (index_memory::lookup(ref))
            return;
        cbor::encoder enc {};
        enc.array(4)
            .bytes(ref.hash)
            .uint(ref.idx)
            .bytes(e.address.bytes());
        store::value_to_cbor(enc, e.amounts);
        _os->write(enc.cbor());
        index_memory::add(ref, e);
    }
}
