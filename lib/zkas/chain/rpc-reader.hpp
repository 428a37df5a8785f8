/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CHAIN_RPC_READER_HPP
#define ZK_ACCOUNT_SOUNDNESS_CHAIN_RPC_READER_HPP

#include <chrono>
#include <zkas/chain/reader.hpp>
#include <zkas/http/rpc-queue.hpp>

namespace zk_account_soundness::chain {
    // Fetches balances and nonces with eth_getBalance and eth_getTransactionCount
    struct rpc_reader: reader {
        rpc_reader(const std::string &endpoint, http::rpc_queue &queue, std::chrono::milliseconds timeout=http::rpc_queue::default_timeout);
    private:
        const std::string _endpoint;
        http::rpc_queue &_queue;
        const std::chrono::milliseconds _timeout;

        void _fetch_async_impl(const address &addr, const block_ref &block, const handler_type &handler) override;
        void _cancel_impl() override;

        const std::string &_endpoint_impl() const override
        {
            return _endpoint;
        }
    };

    extern fetch_error::kind_type fetch_error_kind(http::failure_kind k);
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CHAIN_RPC_READER_HPP
