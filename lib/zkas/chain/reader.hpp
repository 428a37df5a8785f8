/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CHAIN_READER_HPP
#define ZK_ACCOUNT_SOUNDNESS_CHAIN_READER_HPP

#include <condition_variable>
#include <functional>
#include <string>
#include <zkas/chain/types.hpp>
#include <zkas/mutex.hpp>

namespace zk_account_soundness::chain {
    // Reads account states from a single endpoint. Failures are delivered as fetch_error values.
    struct reader {
        using handler_type = std::function<void(fetch_result &&)>;

        virtual ~reader() =default;

        // the handler may be called from another thread and exactly once per call
        void fetch_async(const address &addr, const block_ref &block, const handler_type &handler)
        {
            _fetch_async_impl(addr, block, handler);
        }

        fetch_result fetch(const address &addr, const block_ref &block)
        {
            alignas(mutex::padding) mutex::unique_lock::mutex_type m {};
            alignas(mutex::padding) std::condition_variable_any cv {};
            std::optional<fetch_result> res {};
            fetch_async(addr, block, [&](auto &&r) {
                mutex::scoped_lock lk { m };
                res.emplace(std::move(r));
                cv.notify_one();
            });
            mutex::unique_lock lk { m };
            cv.wait(lk, [&] { return res.has_value(); });
            return std::move(*res);
        }

        // aborts the outstanding fetches, their handlers receive a cancelled fetch_error
        void cancel()
        {
            _cancel_impl();
        }

        const std::string &endpoint() const
        {
            return _endpoint_impl();
        }
    private:
        virtual void _fetch_async_impl(const address &addr, const block_ref &block, const handler_type &handler) =0;
        virtual void _cancel_impl() =0;
        virtual const std::string &_endpoint_impl() const =0;
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CHAIN_READER_HPP
