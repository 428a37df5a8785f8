/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <zkas/asio.hpp>
#include <zkas/http/endpoint.hpp>
#include <zkas/http/rpc-queue.hpp>
#include <zkas/logger.hpp>
#include <zkas/mutex.hpp>

namespace zk_account_soundness::http {
    namespace beast = boost::beast;
    namespace bhttp = beast::http;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    const char *failure_kind_name(const failure_kind k)
    {
        switch (k) {
            case failure_kind::timeout: return "timeout";
            case failure_kind::connection: return "connection";
            case failure_kind::protocol: return "protocol";
            case failure_kind::cancelled: return "cancelled";
            default: throw error("unsupported failure_kind: {}", static_cast<int>(k));
        }
    }

    struct rpc_queue_async::impl {
        static constexpr size_t body_limit = 1 << 20;

        impl(asio::worker &asio_worker, const size_t max_connections, const size_t retries)
            : _asio_worker { asio_worker }, _max_connections { max_connections }, _retries { retries }
        {
            if (_max_connections == 0)
                throw error("max_connections must be positive!");
            _ssl_ctx.set_default_verify_paths();
            _ssl_ctx.set_verify_mode(ssl::verify_peer);
        }

        ~impl()
        {
            cancel_all();
            while (_queue_size.load() > 0 || _num_conns.load() > 0 || _pending_posts.load() > 0) {
                logger::trace("destroying rpc_queue with {} active connections: waiting for them to finish", _num_conns.load());
                std::this_thread::sleep_for(std::chrono::milliseconds { 10 });
            }
        }

        void call_async(request &&req)
        {
            _add_request(std::move(req));
        }

        size_t cancel(const cancel_predicate &pred)
        {
            std::vector<request> cancelled {};
            {
                mutex::scoped_lock lk { _queue_mutex };
                for (auto it = _queue.begin(); it != _queue.end(); ) {
                    if (pred(*it)) {
                        cancelled.emplace_back(std::move(*it));
                        it = _queue.erase(it);
                    } else {
                        ++it;
                    }
                }
                _queue_size = _queue.size();
            }
            for (auto &req: cancelled) {
                result res { req.url, req.method, {}, failure { failure_kind::cancelled, "the request has been cancelled before being sent" } };
                _notify(req, std::move(res));
            }
            if (!cancelled.empty())
                logger::debug("rpc_queue: cancelled {} queued requests", cancelled.size());
            return cancelled.size();
        }

        void cancel_all()
        {
            cancel([](const auto &) { return true; });
            _post([this] {
                std::vector<std::shared_ptr<connection>> live {};
                {
                    mutex::scoped_lock lk { _conns_mutex };
                    for (const auto &[id, wp]: _conns) {
                        if (auto conn = wp.lock(); conn)
                            live.emplace_back(std::move(conn));
                    }
                }
                for (auto &conn: live)
                    conn->cancel();
            });
        }
    private:
        struct connection: std::enable_shared_from_this<connection> {
            connection(impl &q, const uint64_t id)
                : _q { q }, _id { id }
            {
            }

            ~connection()
            {
                _q._connection_finished(_id);
            }

            void run()
            {
                _take_request();
            }

            void cancel()
            {
                _cancelled = true;
                logger::trace("rpc connection #{}: cancelling", _id);
                _resolver.cancel();
                _resolve_timer.cancel();
                if (_plain)
                    _plain->close();
                if (_tls)
                    beast::get_lowest_layer(*_tls).close();
            }
        private:
            impl &_q;
            const uint64_t _id;
            tcp::resolver _resolver { _q._asio_worker.io_context() };
            net::steady_timer _resolve_timer { _q._asio_worker.io_context() };
            bool _resolving = false;
            bool _resolve_expired = false;
            bool _cancelled = false;
            std::optional<endpoint> _endpoint {};
            std::optional<tcp::resolver::results_type> _connect_endpoint {};
            std::optional<beast::tcp_stream> _plain {};
            std::optional<beast::ssl_stream<beast::tcp_stream>> _tls {};
            beast::flat_buffer _buffer {};
            std::optional<bhttp::request<bhttp::string_body>> _http_req {};
            std::optional<bhttp::response_parser<bhttp::string_body>> _http_parser {};
            request _req {};
            uint64_t _rpc_id = 0;
            std::chrono::steady_clock::time_point _deadline {};
            bool _reused = false;
            bool _reconnected = false;

            bool _connected() const
            {
                return _plain || _tls;
            }

            void _close()
            {
                beast::error_code ec {};
                if (_plain) {
                    _plain->socket().shutdown(tcp::socket::shutdown_both, ec);
                    _plain->close();
                    _plain.reset();
                }
                if (_tls) {
                    beast::get_lowest_layer(*_tls).close();
                    _tls.reset();
                }
            }

            template<typename F>
            void _with_stream(F &&f)
            {
                if (_tls) {
                    beast::get_lowest_layer(*_tls).expires_at(_deadline);
                    f(*_tls);
                } else {
                    _plain->expires_at(_deadline);
                    f(*_plain);
                }
            }

            void _take_request()
            {
                if (_cancelled)
                    return;
                auto req = _q._take_request();
                if (!req)
                    return;
                _req = std::move(*req);
                _deadline = std::chrono::steady_clock::now() + _req.timeout;
                _reconnected = false;
                std::optional<endpoint> ep {};
                try {
                    ep.emplace(endpoint::parse(_req.url));
                } catch (const std::exception &ex) {
                    _report(failure { failure_kind::connection, ex.what() });
                    _take_request();
                    return;
                }
                _rpc_id = ++_q._next_rpc_id;
                json::object body {
                    { "jsonrpc", "2.0" },
                    { "id", _rpc_id },
                    { "method", _req.method },
                    { "params", _req.params }
                };
                _http_req.emplace();
                _http_req->version(11);
                _http_req->keep_alive(true);
                _http_req->method(bhttp::verb::post);
                _http_req->target(ep->target);
                _http_req->set(bhttp::field::host, ep->port == (ep->secure() ? "443" : "80") ? ep->host : ep->authority());
                _http_req->set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
                _http_req->set(bhttp::field::content_type, "application/json");
                _http_req->set(bhttp::field::accept, "application/json");
                _http_req->body() = json::serialize(body);
                _http_req->prepare_payload();
                _resolve(std::move(*ep));
            }

            void _report(failure &&f)
            {
                _q._report_result(std::move(_req), result { _req.url, _req.method, {}, std::move(f) });
            }

            void _report(json::value &&val)
            {
                _q._report_result(std::move(_req), result { _req.url, _req.method, std::move(val) });
            }

            void _handle_error(const beast::error_code &ec, const std::string_view &stage)
            {
                auto kind = failure_kind::connection;
                std::string msg = fmt::format("{} failed: {}", stage, ec.message());
                if (_cancelled) {
                    kind = failure_kind::cancelled;
                    msg = "the request has been cancelled while in flight";
                } else if (ec == beast::error::timeout || _resolve_expired) {
                    kind = failure_kind::timeout;
                    msg = fmt::format("no response within {} ms during {}", _req.timeout.count(), stage);
                } else if (_reused && !_reconnected) {
                    // the server may have dropped an idle keep-alive connection
                    logger::debug("{}: {} on a reused connection, reconnecting", _req.url, msg);
                    _reconnected = true;
                    _reused = false;
                    _close();
                    _connect();
                    return;
                }
                logger::debug("{} {}: {}", _req.method, _req.url, msg);
                _close();
                _report(failure { kind, std::move(msg) });
                _take_request();
            }

            void _resolve(endpoint &&ep)
            {
                if (_endpoint && _endpoint->authority() == ep.authority() && _endpoint->scheme == ep.scheme && _connect_endpoint) {
                    logger::trace("{}: skipping resolving {} - cached", _req.url, ep.authority());
                    _endpoint = std::move(ep);
                    _connect();
                    return;
                }
                if (_connected()) {
                    logger::debug("{}: closing the connection because the target endpoint has changed", _req.url);
                    _close();
                }
                logger::trace("{}: resolving {}", _req.url, ep.authority());
                _endpoint = std::move(ep);
                _connect_endpoint.reset();
                _resolving = true;
                _resolve_expired = false;
                _resolve_timer.expires_at(_deadline);
                _resolve_timer.async_wait([self = shared_from_this()](const beast::error_code &ec) {
                    if (!ec && self->_resolving) {
                        self->_resolve_expired = true;
                        self->_resolver.cancel();
                    }
                });
                _resolver.async_resolve(_endpoint->host, _endpoint->port, beast::bind_front_handler(&connection::_on_resolve, shared_from_this()));
            }

            void _on_resolve(beast::error_code ec, tcp::resolver::results_type results)
            {
                _resolving = false;
                _resolve_timer.cancel();
                if (ec) {
                    _handle_error(ec, "resolve");
                    return;
                }
                _resolve_expired = false;
                _connect_endpoint.emplace(std::move(results));
                _connect();
            }

            void _connect()
            {
                if (_connected()) {
                    logger::trace("{}: reusing the connection to {}", _req.url, _endpoint->authority());
                    _reused = true;
                    _write();
                    return;
                }
                logger::trace("{}: connecting to {}", _req.url, _endpoint->authority());
                _reused = false;
                if (_endpoint->secure()) {
                    _tls.emplace(_q._asio_worker.io_context(), _q._ssl_ctx);
                    if (!SSL_set_tlsext_host_name(_tls->native_handle(), _endpoint->host.c_str())) {
                        const beast::error_code ec { static_cast<int>(::ERR_get_error()), net::error::get_ssl_category() };
                        _handle_error(ec, "tls server name setup");
                        return;
                    }
                    _tls->set_verify_callback(ssl::host_name_verification(_endpoint->host));
                    beast::get_lowest_layer(*_tls).expires_at(_deadline);
                    beast::get_lowest_layer(*_tls).async_connect(*_connect_endpoint, beast::bind_front_handler(&connection::_on_connect, shared_from_this()));
                } else {
                    _plain.emplace(_q._asio_worker.io_context());
                    _plain->expires_at(_deadline);
                    _plain->async_connect(*_connect_endpoint, beast::bind_front_handler(&connection::_on_connect, shared_from_this()));
                }
            }

            void _on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
            {
                if (ec) {
                    _handle_error(ec, "connect");
                    return;
                }
                if (_tls) {
                    beast::get_lowest_layer(*_tls).expires_at(_deadline);
                    _tls->async_handshake(ssl::stream_base::client, beast::bind_front_handler(&connection::_on_handshake, shared_from_this()));
                    return;
                }
                _write();
            }

            void _on_handshake(beast::error_code ec)
            {
                if (ec) {
                    _handle_error(ec, "tls handshake");
                    return;
                }
                _write();
            }

            void _write()
            {
                logger::trace("{}: sending {} #{}", _req.url, _req.method, _rpc_id);
                _with_stream([&](auto &s) {
                    bhttp::async_write(s, *_http_req, beast::bind_front_handler(&connection::_on_write, shared_from_this()));
                });
            }

            void _on_write(beast::error_code ec, std::size_t /*bytes_transferred*/)
            {
                if (ec) {
                    _handle_error(ec, "write");
                    return;
                }
                _http_parser.emplace();
                _http_parser->body_limit(body_limit);
                _buffer.clear();
                _with_stream([&](auto &s) {
                    bhttp::async_read(s, _buffer, *_http_parser, beast::bind_front_handler(&connection::_on_read, shared_from_this()));
                });
            }

            void _on_read(beast::error_code ec, std::size_t /*bytes_transferred*/)
            {
                if (ec) {
                    if (ec == bhttp::error::body_limit) {
                        _close();
                        _report(failure { failure_kind::protocol, fmt::format("the response body exceeds {} bytes", body_limit) });
                        _take_request();
                        return;
                    }
                    _handle_error(ec, "read");
                    return;
                }
                if (!_http_parser->keep_alive()) {
                    logger::trace("{}: remote turns down keep-alive, closing the connection", _req.url);
                    _close();
                }
                const auto &res = _http_parser->get();
                const auto http_status = res.result_int();
                if (http_status != 200) {
                    _report(failure { failure_kind::protocol, fmt::format("bad http status: {}", http_status) });
                } else {
                    try {
                        _report(_extract_result(res.body()));
                    } catch (const std::exception &ex) {
                        _report(failure { failure_kind::protocol, ex.what() });
                    }
                }
                _take_request();
            }

            json::value _extract_result(const std::string_view body) const
            {
                auto jv = json::parse_text(body);
                if (!jv.is_object())
                    throw error("the JSON-RPC response is not an object");
                auto &obj = jv.as_object();
                if (const auto *id = obj.if_contains("id"); !id || !id->is_number() || id->to_number<uint64_t>() != _rpc_id)
                    throw error("the JSON-RPC response id does not match the request id {}", _rpc_id);
                if (const auto *err = obj.if_contains("error"); err && !err->is_null()) {
                    if (err->is_object()) {
                        const auto &err_obj = err->as_object();
                        const auto *code = err_obj.if_contains("code");
                        const auto *msg = err_obj.if_contains("message");
                        throw error("JSON-RPC error {}: {}",
                            code ? json::serialize(*code) : std::string { "?" },
                            msg && msg->is_string() ? std::string { msg->as_string() } : std::string { "no message" });
                    }
                    throw error("JSON-RPC error: {}", json::serialize(*err));
                }
                auto *val = obj.if_contains("result");
                if (!val)
                    throw error("the JSON-RPC response has neither a result nor an error");
                return std::move(*val);
            }
        };

        asio::worker &_asio_worker;
        const size_t _max_connections;
        const size_t _retries;
        ssl::context _ssl_ctx { ssl::context::tls_client };
        alignas(mutex::padding) mutex::unique_lock::mutex_type _queue_mutex {};
        std::deque<request> _queue {};
        std::atomic_size_t _queue_size { 0 };
        alignas(mutex::padding) mutex::unique_lock::mutex_type _conns_mutex {};
        std::map<uint64_t, std::weak_ptr<connection>> _conns {};
        std::atomic_size_t _num_conns { 0 };
        std::atomic_size_t _pending_posts { 0 };
        uint64_t _next_conn_id = 0;
        std::atomic_uint64_t _next_rpc_id { 0 };

        void _add_request(request &&req)
        {
            {
                mutex::scoped_lock lk { _queue_mutex };
                _queue.emplace_back(std::move(req));
                _queue_size = _queue.size();
            }
            _post([this] { _spawn_connections(); });
        }

        // the destructor waits for the posted actions since they refer to this instance
        template<typename F>
        void _post(F &&act)
        {
            ++_pending_posts;
            net::post(_asio_worker.io_context(), [this, act=std::forward<F>(act)] {
                logger::run_log_errors(act);
                --_pending_posts;
            });
        }

        // executed on the I/O thread only
        void _spawn_connections()
        {
            while (_queue_size.load() > 0 && _num_conns.load() < _max_connections) {
                const auto id = ++_next_conn_id;
                auto conn = std::make_shared<connection>(*this, id);
                {
                    mutex::scoped_lock lk { _conns_mutex };
                    _conns.emplace(id, conn);
                }
                ++_num_conns;
                // if successful a copy of the shared_ptr will be kept in the I/O context
                conn->run();
                logger::trace("created rpc connection #{} use_count: {}", id, conn.use_count());
            }
        }

        void _connection_finished(const uint64_t id)
        {
            {
                mutex::scoped_lock lk { _conns_mutex };
                _conns.erase(id);
            }
            --_num_conns;
        }

        std::optional<request> _take_request()
        {
            std::optional<request> res {};
            mutex::scoped_lock lk { _queue_mutex };
            if (!_queue.empty()) {
                res.emplace(std::move(_queue.front()));
                _queue.pop_front();
                _queue_size = _queue.size();
            }
            return res;
        }

        void _report_result(request &&req, result &&res)
        {
            if (res.error) {
                if (res.error->kind == failure_kind::connection && req.attempts < _retries) {
                    ++req.attempts;
                    logger::debug("retrying {} {} after a connection failure: {} attempt: {}", req.method, req.url, res.error->message, req.attempts);
                    _add_request(std::move(req));
                    return;
                }
                logger::trace("{} {} failed: {}", req.method, req.url, res.error->message);
            } else {
                logger::trace("{} {} succeeded", req.method, req.url);
            }
            _notify(req, std::move(res));
        }

        static void _notify(const request &req, result &&res)
        {
            try {
                req.handler(std::move(res));
            } catch (const std::exception &ex) {
                logger::error("a handler of {} {} has failed: {}", req.method, req.url, ex.what());
            }
        }
    };

    rpc_queue_async::rpc_queue_async(const size_t max_connections, const size_t retries)
        : rpc_queue_async { asio::worker::get(), max_connections, retries }
    {
    }

    rpc_queue_async::rpc_queue_async(asio::worker &asio_worker, const size_t max_connections, const size_t retries)
        : _impl { std::make_unique<impl>(asio_worker, max_connections, retries) }
    {
    }

    rpc_queue_async::~rpc_queue_async() =default;

    size_t rpc_queue_async::_cancel_impl(const cancel_predicate &pred)
    {
        return _impl->cancel(pred);
    }

    void rpc_queue_async::_cancel_all_impl()
    {
        _impl->cancel_all();
    }

    void rpc_queue_async::_call_async_impl(request &&req)
    {
        _impl->call_async(std::move(req));
    }
}
