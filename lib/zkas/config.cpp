/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <zkas/config.hpp>
#include <zkas/logger.hpp>

namespace zk_account_soundness {
    std::optional<std::string> config::get_string(const std::string_view &name) const
    {
        const auto *val = find(name);
        if (!val || val->is_null())
            return {};
        if (!val->is_string())
            throw config_error("configuration element {} must be a string", name);
        return std::string { val->get_string() };
    }

    std::optional<uint64_t> config::get_uint(const std::string_view &name) const
    {
        const auto *val = find(name);
        if (!val || val->is_null())
            return {};
        if (val->is_uint64())
            return val->get_uint64();
        if (val->is_int64() && val->get_int64() >= 0)
            return static_cast<uint64_t>(val->get_int64());
        throw config_error("configuration element {} must be a non-negative integer", name);
    }

    static json::object load_object(const std::string &path)
    {
        try {
            auto jv = json::load(path);
            if (!jv.is_object())
                throw config_error("configuration file {} must contain a JSON object", path);
            logger::debug("loaded configuration file: {}", path);
            return std::move(jv.as_object());
        } catch (const config_error &) {
            throw;
        } catch (const std::exception &ex) {
            throw config_error("cannot load configuration file {}: {}", path, ex.what());
        }
    }

    config_file::config_file(const std::string &path)
        : _parsed { load_object(path) }
    {
    }

    environment environment::capture(const std::initializer_list<std::string_view> names)
    {
        map_type vars {};
        for (const auto &name: names) {
            const std::string name_s { name };
            if (const char *val = std::getenv(name_s.c_str()); val != nullptr)
                vars.emplace(name_s, val);
        }
        return environment { std::move(vars) };
    }
}
