/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */
#ifndef PROGRAMMABLE_TOKENS_STORE_FILE_HPP
#define PROGRAMMABLE_TOKENS_STORE_FILE_HPP

#include <functional>
#include <memory>
#include <pt/file.hpp>
#include <pt/store/memory.hpp>

namespace programmable_tokens::store {
    // Keeps each log as a sequence of CBOR records in a data directory and serves queries from memory.
    // A record is written to disk before it becomes visible to readers.
    struct file: memory {
        static constexpr std::string_view versions_name { "protocol-versions.cbor" };
        static constexpr std::string_view registry_name { "registry.cbor" };
        static constexpr std::string_view balances_name { "balances.cbor" };

        explicit file(const std::string &data_dir);

        bool add_version(const protocol_version &ver) override;
        bool add_registry(const registry_row &row) override;
        bool add_balance(const balance_row &row) override;

        const std::string &data_dir() const noexcept
        {
            return _data_dir;
        }
    private:
        const std::string _data_dir;
        alignas(mutex::alignment) mutable mutex::mutex_type _write_mutex {};
        std::unique_ptr<programmable_tokens::file::append_stream> _versions_os {};
        std::unique_ptr<programmable_tokens::file::append_stream> _registry_os {};
        std::unique_ptr<programmable_tokens::file::append_stream> _balances_os {};

        std::string _path(std::string_view name) const;
    };

    // Calls on_record for each complete record and cuts off an incomplete trailing one.
    // Returns the number of records loaded.
    extern size_t load_records(const std::string &path, const std::function<void(cbor::zero::value)> &on_record);
}

#endif // !PROGRAMMABLE_TOKENS_STORE_FILE_HPP
