/* This file is part of the programmable-tokens project.
 * Copyright (c) 2025 the programmable-tokens contributors */

#include <pt/datum.hpp>
#include <pt/logger.hpp>

namespace programmable_tokens::datum {
    static const plutus::data_list &_fields(const plutus::data &d)
    {
        if (const auto *c = std::get_if<plutus::data_constr>(&d.val); c)
            return c->fields;
        return d.as_list();
    }

    // a credential is Constr 0 [hash] for a key and Constr 1 [hash] for a script
    static const uint8_vector &_credential_hash(const plutus::data &d)
    {
        const auto &c = d.as_constr();
        if (c.fields.empty())
            throw error(fmt::format("a credential constructor {} has no fields", c.tag));
        return c.fields.front().as_bytes();
    }

    template<typename T>
    static T _sized(const uint8_vector &bytes, const std::string_view name)
    {
        if (bytes.size() != sizeof(T))
            throw error(fmt::format("{} must be {} bytes long but has {}", name, sizeof(T), bytes.size()));
        return T { bytes };
    }

    plutus::data protocol_params::to_data() const
    {
        return plutus::data::constr(0, {
            plutus::data::bytes(registry_policy),
            plutus::data::constr(1, { plutus::data::bytes(base_credential) })
        });
    }

    plutus::data registry_node::to_data() const
    {
        plutus::data_list fields {};
        fields.emplace_back(plutus::data::bytes(key));
        fields.emplace_back(plutus::data::bytes(next));
        fields.emplace_back(plutus::data::constr(1, { plutus::data::bytes(transfer_logic) }));
        fields.emplace_back(plutus::data::constr(1, { plutus::data::bytes(third_party_logic) }));
        if (!global_state_policy.empty())
            fields.emplace_back(plutus::data::bytes(global_state_policy));
        return plutus::data::constr(0, std::move(fields));
    }

    std::optional<protocol_params> decode_protocol_params(const buffer bytes)
    {
        try {
            const auto d = plutus::data::from_cbor(bytes);
            const auto &fields = _fields(d);
            if (fields.size() < 2)
                throw error(fmt::format("protocol params must have at least two fields but have {}", fields.size()));
            const auto &cred = std::holds_alternative<uint8_vector>(fields[1].val) ? fields[1].as_bytes() : _credential_hash(fields[1]);
            return protocol_params {
                _sized<policy_id>(fields[0].as_bytes(), "registry policy id"),
                _sized<key_hash>(cred, "base credential hash")
            };
        } catch (const std::exception &ex) {
            logger::debug("not a protocol params datum: {}", ex.what());
        }
        return {};
    }

    std::optional<registry_node> decode_registry_node(const buffer bytes)
    {
        try {
            const auto d = plutus::data::from_cbor(bytes);
            const auto &fields = _fields(d);
            if (fields.size() < 4 || fields.size() > 5)
                throw error(fmt::format("a registry node must have four or five fields but has {}", fields.size()));
            registry_node node {
                fields[0].as_bytes(),
                fields[1].as_bytes(),
                _credential_hash(fields[2]),
                _credential_hash(fields[3])
            };
            if (fields.size() == 5)
                node.global_state_policy = fields[4].as_bytes();
            return node;
        } catch (const std::exception &ex) {
            logger::debug("not a registry node datum: {}", ex.what());
        }
        return {};
    }
}
