/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cctype>
#include <boost/url.hpp>
#include <zkas/http/endpoint.hpp>

namespace zk_account_soundness::http {
    endpoint endpoint::parse(const std::string_view url)
    {
        auto parsed = boost::urls::parse_uri(url);
        if (!parsed)
            throw error("invalid URL '{}': {}", url, parsed.error().message());
        const auto &uri = *parsed;
        endpoint ep {};
        ep.scheme = std::string { uri.scheme() };
        for (auto &c: ep.scheme)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (ep.scheme != "http" && ep.scheme != "https")
            throw error("only http and https URLs are supported but got '{}'", url);
        if (!uri.has_authority() || uri.encoded_host().empty())
            throw error("the URL '{}' does not specify a host", url);
        ep.host = std::string { uri.encoded_host() };
        if (uri.has_port()) {
            if (uri.port_number() == 0)
                throw error("the URL '{}' has an invalid port", url);
            ep.port = std::to_string(uri.port_number());
        } else {
            ep.port = ep.secure() ? "443" : "80";
        }
        ep.target = std::string { uri.encoded_path() };
        if (ep.target.empty())
            ep.target = "/";
        if (uri.has_query())
            ep.target += fmt::format("?{}", std::string_view { uri.encoded_query() });
        return ep;
    }
}
