/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CONFIG_HPP
#define ZK_ACCOUNT_SOUNDNESS_CONFIG_HPP

#include <chrono>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <zkas/chain/types.hpp>
#include <zkas/json.hpp>

namespace zk_account_soundness {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            const auto *val = find(name);
            if (!val)
                throw config_error("configuration does not have the element {}!", name);
            return *val;
        }

        [[nodiscard]] const json::value *find(const std::string_view &name) const
        {
            return object().if_contains(name);
        }

        [[nodiscard]] const json::object &object() const
        {
            return _object_impl();
        }

        [[nodiscard]] std::optional<std::string> get_string(const std::string_view &name) const;
        [[nodiscard]] std::optional<uint64_t> get_uint(const std::string_view &name) const;
    private:
        virtual const json::object &_object_impl() const =0;
    };

    // Used as a config mock and as the empty config when no file is given
    struct config_json: config {
        explicit config_json(json::object &&json={})
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::object &_object_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        explicit config_file(const std::string &path);
    private:
        json::object _parsed;

        const json::object &_object_impl() const override
        {
            return _parsed;
        }
    };

    // a snapshot of the environment variables the runner is interested in
    struct environment {
        using map_type = std::map<std::string, std::string>;

        static environment capture(std::initializer_list<std::string_view> names);

        explicit environment(map_type &&vars={}): _vars { std::move(vars) }
        {
        }

        [[nodiscard]] std::optional<std::string> get(const std::string &name) const
        {
            if (const auto it = _vars.find(name); it != _vars.end() && !it->second.empty())
                return it->second;
            return {};
        }
    private:
        map_type _vars;
    };

    // the fully validated configuration of a comparison run
    struct settings {
        static constexpr std::chrono::seconds default_timeout { 30 };
        static constexpr size_t default_max_in_flight = 8;
        static constexpr size_t default_retries = 0;
        static constexpr std::chrono::seconds max_timeout { 86400 };
        static constexpr size_t max_retries = 10;

        std::string rpc_a {};
        std::string rpc_b {};
        chain::block_ref block_a = chain::block_ref::latest();
        chain::block_ref block_b = chain::block_ref::latest();
        chain::address_list addresses {};
        std::chrono::seconds timeout = default_timeout;
        size_t max_in_flight = default_max_in_flight;
        size_t retries = default_retries;
        bool json = false;
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CONFIG_HPP
