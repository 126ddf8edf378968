/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <filesystem>
#include <pt/logger.hpp>
#include <pt/store/file.hpp>
#include <pt/timer.hpp>

namespace programmable_tokens::store {
    size_t load_records(const std::string &path, const std::function<void(cbor::zero::value)> &on_record)
    {
        if (!std::filesystem::exists(path))
            return 0;
        const auto bytes = programmable_tokens::file::read(path);
        cbor::zero::decoder dec { bytes };
        size_t num_records = 0;
        while (!dec.done()) {
            const auto offset = bytes.size() - dec.remaining();
            std::optional<cbor::zero::value> rec {};
            try {
                rec.emplace(dec.read());
            } catch (const error &ex) {
                logger::warn("{}: an incomplete record at offset {} is cut off: {}", path, offset, ex.what());
                programmable_tokens::file::truncate(path, offset);
                break;
            }
            try {
                on_record(*rec);
            } catch (const std::exception &ex) {
                throw error(fmt::format("{}: a corrupted record at offset {}", path, offset), ex);
            }
            ++num_records;
        }
        return num_records;
    }

    file::file(const std::string &data_dir): _data_dir { data_dir }
    {
        timer t { fmt::format("load the data directory {}", _data_dir), logger::level::debug };
        std::filesystem::create_directories(_data_dir);
        const auto num_versions = load_records(_path(versions_name), [&](const auto v) {
            memory::add_version(protocol_version::from_cbor(v));
        });
        const auto num_registry = load_records(_path(registry_name), [&](const auto v) {
            memory::add_registry(registry_row::from_cbor(v));
        });
        const auto num_balances = load_records(_path(balances_name), [&](const auto v) {
            memory::add_balance(balance_row::from_cbor(v));
        });
        logger::info("{}: loaded {} protocol versions, {} registry rows and {} balance rows",
            _data_dir, num_versions, num_registry, num_balances);
        _versions_os = std::make_unique<programmable_tokens::file::append_stream>(_path(versions_name));
        _registry_os = std::make_unique<programmable_tokens::file::append_stream>(_path(registry_name));
        _balances_os = std::make_unique<programmable_tokens::file::append_stream>(_path(balances_name));
    }

    bool file::add_version(const protocol_version &ver)
    {
        mutex::scoped_lock lk { _write_mutex };
        if (memory::has_version(ver.tx))
            return false;
        cbor::encoder enc {};
        ver.to_cbor(enc);
        _versions_os->write(enc.cbor());
        return memory::add_version(ver);
    }

    bool file::add_registry(const registry_row &row)
    {
        mutex::scoped_lock lk { _write_mutex };
        if (memory::has_registry(registry_row_id::from_row(row)))
            return false;
        cbor::encoder enc {};
        row.to_cbor(enc);
        _registry_os->write(enc.cbor());
        return memory::add_registry(row);
    }

    bool file::add_balance(const balance_row &row)
    {
        mutex::scoped_lock lk { _write_mutex };
        if (memory::has_balance(balance_row_id { row.address, row.tx }))
            return false;
        cbor::encoder enc {};
        row.to_cbor(enc);
        _balances_os->write(enc.cbor());
        return memory::add_balance(row);
    }

    std::string file::_path(const std::string_view name) const
    {
        return (std::filesystem::path { _data_dir } / name).string();
    }
}
