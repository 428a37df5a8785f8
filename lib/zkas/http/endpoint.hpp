/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_HTTP_ENDPOINT_HPP
#define ZK_ACCOUNT_SOUNDNESS_HTTP_ENDPOINT_HPP

#include <string>
#include <string_view>
#include <zkas/common/format.hpp>

namespace zk_account_soundness::http {
    // The parts of an http:// or https:// URL needed to open a connection and address a request
    struct endpoint {
        std::string scheme {};
        std::string host {};
        std::string port {};
        std::string target {};

        // throws error for malformed URLs and for schemes other than http and https
        static endpoint parse(std::string_view url);

        bool secure() const
        {
            return scheme == "https";
        }

        // host:port, the key under which connections are reused
        std::string authority() const
        {
            return fmt::format("{}:{}", host, port);
        }

        bool operator==(const endpoint &o) const =default;
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_HTTP_ENDPOINT_HPP
