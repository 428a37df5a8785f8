/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_JSON_HPP
#define ZK_ACCOUNT_SOUNDNESS_JSON_HPP

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <boost/json.hpp>
#include <zkas/common/error.hpp>

namespace zk_account_soundness::json {
    using namespace boost::json;

    inline json::value parse_text(const std::string_view text, json::storage_ptr sp={})
    {
        try {
            return boost::json::parse(text, sp);
        } catch (const std::exception &ex) {
            throw error("invalid JSON: {}", ex.what());
        }
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error("cannot open {} for reading", path);
        const std::string text { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        return parse_text(text, sp);
    }

    inline void save_pretty(std::ostream& os, json::value const &jv, std::string *indent = nullptr)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if(!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case json::kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(it->key()) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case json::kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case json::kind::string:
                os << json::serialize(jv.get_string());
                break;
            case json::kind::uint64:
                os << jv.get_uint64();
                break;
            case json::kind::int64:
                os << jv.get_int64();
                break;
            case json::kind::double_:
                os << jv.get_double();
                break;
            case json::kind::bool_:
                if(jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case json::kind::null:
                os << "null";
                break;
        }
    }

    inline std::string serialize_pretty(const json::value &jv)
    {
        std::ostringstream os {};
        save_pretty(os, jv);
        return os.str();
    }
}

#endif // !ZK_ACCOUNT_SOUNDNESS_JSON_HPP
