/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_HTTP_RPC_QUEUE_HPP
#define ZK_ACCOUNT_SOUNDNESS_HTTP_RPC_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <zkas/json.hpp>
#include <zkas/mutex.hpp>

namespace zk_account_soundness::asio {
    struct worker;
}

namespace zk_account_soundness::http {
    enum class failure_kind {
        timeout,
        // the endpoint could not be resolved, connected to, or dropped the connection
        connection,
        // a non-200 HTTP status, a malformed body, or a JSON-RPC error object
        protocol,
        cancelled
    };

    extern const char *failure_kind_name(failure_kind k);

    struct rpc_queue {
        static constexpr std::chrono::seconds default_timeout { 30 };

        struct failure {
            failure_kind kind = failure_kind::protocol;
            std::string message {};
        };

        struct result {
            std::string url {};
            std::string method {};
            // the "result" member of the JSON-RPC response
            json::value value {};
            std::optional<failure> error {};

            explicit operator bool() const
            {
                return !static_cast<bool>(error);
            }
        };

        using handler_type = std::function<void(result &&)>;

        struct request {
            std::string url {};
            std::string method {};
            json::array params {};
            std::chrono::milliseconds timeout = default_timeout;
            handler_type handler {};
            size_t attempts = 0;
        };

        using cancel_predicate = std::function<bool(const request &req)>;

        virtual ~rpc_queue() =default;

        // drops the queued requests matching pred, their handlers receive a cancelled failure
        size_t cancel(const cancel_predicate &pred)
        {
            return _cancel_impl(pred);
        }

        // drops all queued requests and aborts those in flight
        void cancel_all()
        {
            _cancel_all_impl();
        }

        void call_async(const std::string &url, const std::string &method, json::array params,
            const std::chrono::milliseconds timeout, const handler_type &handler)
        {
            _call_async_impl(request { url, method, std::move(params), timeout, handler });
        }

        json::value call(const std::string &url, const std::string &method, json::array params={},
            const std::chrono::milliseconds timeout=default_timeout)
        {
            alignas(mutex::padding) mutex::unique_lock::mutex_type m {};
            alignas(mutex::padding) std::condition_variable_any cv {};
            bool ready = false;
            result res {};
            call_async(url, method, std::move(params), timeout, [&](auto &&r) {
                mutex::scoped_lock lk { m };
                res = std::move(r);
                ready = true;
                cv.notify_one();
            });
            {
                mutex::unique_lock lk { m };
                cv.wait(lk, [&] { return ready; });
            }
            if (res.error)
                throw error("{} call to {} failed: {}", method, url, res.error->message);
            return std::move(res.value);
        }
    private:
        virtual size_t _cancel_impl(const cancel_predicate &/*pred*/)
        {
            throw error("cancellation is not supported!");
        }

        virtual void _cancel_all_impl()
        {
            _cancel_impl([](const auto &) { return true; });
        }

        virtual void _call_async_impl(request &&req) =0;
    };

    struct rpc_queue_async: rpc_queue {
        static constexpr size_t default_max_connections = 8;

        explicit rpc_queue_async(size_t max_connections=default_max_connections, size_t retries=0);
        explicit rpc_queue_async(asio::worker &asio_worker, size_t max_connections=default_max_connections, size_t retries=0);
        ~rpc_queue_async() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        size_t _cancel_impl(const cancel_predicate &pred) override;
        void _cancel_all_impl() override;
        void _call_async_impl(request &&req) override;
    };
}

namespace fmt {
    template<>
    struct formatter<zk_account_soundness::http::failure_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", zk_account_soundness::http::failure_kind_name(v));
        }
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_HTTP_RPC_QUEUE_HPP
