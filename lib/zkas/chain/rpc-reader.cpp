/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <memory>
#include <zkas/chain/rpc-reader.hpp>
#include <zkas/logger.hpp>

namespace zk_account_soundness::chain {
    fetch_error::kind_type fetch_error_kind(const http::failure_kind k)
    {
        switch (k) {
            case http::failure_kind::timeout: return fetch_error::kind_type::timeout;
            case http::failure_kind::connection: return fetch_error::kind_type::connection_refused;
            case http::failure_kind::protocol: return fetch_error::kind_type::invalid_response;
            case http::failure_kind::cancelled: return fetch_error::kind_type::cancelled;
            default: throw error("unsupported failure_kind: {}", static_cast<int>(k));
        }
    }

    namespace {
        // joins the balance and the nonce responses of a single account
        struct pending_fetch {
            address addr;
            reader::handler_type handler;
            alignas(mutex::padding) mutex::unique_lock::mutex_type state_mutex {};
            std::optional<cpp_int> balance {};
            std::optional<uint64_t> nonce {};
            std::optional<fetch_error> err {};
            size_t remaining = 2;

            pending_fetch(const address &a, const reader::handler_type &h): addr { a }, handler { h }
            {
            }

            template<typename F>
            void complete(const std::string_view method, http::rpc_queue::result &&res, const F &parse)
            {
                {
                    mutex::scoped_lock lk { state_mutex };
                    if (res.error) {
                        if (!err)
                            err.emplace(fetch_error { fetch_error_kind(res.error->kind), fmt::format("{}: {}", method, res.error->message) });
                    } else {
                        try {
                            if (!res.value.is_string())
                                throw error("expected a hex quantity but got {}", json::serialize(res.value));
                            parse(std::string_view { res.value.as_string() });
                        } catch (const std::exception &ex) {
                            if (!err)
                                err.emplace(fetch_error { fetch_error::kind_type::invalid_response, fmt::format("{}: {}", method, ex.what()) });
                        }
                    }
                    if (--remaining > 0)
                        return;
                }
                if (err)
                    handler(fetch_result { std::move(*err) });
                else
                    handler(fetch_result { account_state { addr, std::move(*balance), *nonce } });
            }
        };
    }

    rpc_reader::rpc_reader(const std::string &endpoint, http::rpc_queue &queue, const std::chrono::milliseconds timeout)
        : _endpoint { endpoint }, _queue { queue }, _timeout { timeout }
    {
    }

    void rpc_reader::_fetch_async_impl(const address &addr, const block_ref &block, const handler_type &handler)
    {
        auto pending = std::make_shared<pending_fetch>(addr, handler);
        const auto addr_hex = addr.to_string();
        const auto block_param = block.rpc_param();
        _queue.call_async(_endpoint, "eth_getBalance", json::array { addr_hex, block_param }, _timeout, [pending](auto &&res) {
            pending->complete("eth_getBalance", std::move(res), [&](const std::string_view q) {
                pending->balance.emplace(big_uint_from_quantity(q));
            });
        });
        _queue.call_async(_endpoint, "eth_getTransactionCount", json::array { addr_hex, block_param }, _timeout, [pending](auto &&res) {
            pending->complete("eth_getTransactionCount", std::move(res), [&](const std::string_view q) {
                pending->nonce.emplace(uint64_from_quantity(q));
            });
        });
    }

    void rpc_reader::_cancel_impl()
    {
        logger::debug("cancelling the outstanding requests to {}", _endpoint);
        _queue.cancel_all();
    }
}
