/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_HTTP_RPC_SERVER_MOCK_HPP
#define ZK_ACCOUNT_SOUNDNESS_HTTP_RPC_SERVER_MOCK_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <zkas/json.hpp>

namespace zk_account_soundness::http {
    // An in-process JSON-RPC server listening on an ephemeral loopback port, for tests
    struct rpc_server_mock {
        struct reply {
            json::value body {};
            unsigned status = 200;
            std::chrono::milliseconds delay { 0 };
            // close the connection without sending a response
            bool drop = false;
            // sent instead of the serialized body when set
            std::optional<std::string> raw {};
        };

        using handler_type = std::function<reply(const json::object &req)>;

        static reply result(const json::object &req, json::value res)
        {
            return reply { json::object { { "jsonrpc", "2.0" }, { "id", req.at("id") }, { "result", std::move(res) } } };
        }

        static reply rpc_error(const json::object &req, const int64_t code, const std::string_view msg)
        {
            return reply { json::object {
                { "jsonrpc", "2.0" },
                { "id", req.at("id") },
                { "error", json::object { { "code", code }, { "message", msg } } }
            } };
        }

        explicit rpc_server_mock(const handler_type &handler);
        ~rpc_server_mock();
        std::string url() const;
        uint16_t port() const;
        size_t num_requests() const;
        size_t num_connections() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_HTTP_RPC_SERVER_MOCK_HPP
