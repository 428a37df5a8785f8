/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <thread>
#include <vector>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <zkas/http/rpc-server-mock.hpp>
#include <zkas/logger.hpp>
#include <zkas/mutex.hpp>

namespace zk_account_soundness::http {
    namespace beast = boost::beast;
    namespace bhttp = beast::http;
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    struct rpc_server_mock::impl {
        explicit impl(const handler_type &handler)
            : _handler { handler }
        {
            _acceptor.open(tcp::v4());
            _acceptor.set_option(net::socket_base::reuse_address(true));
            _acceptor.bind(tcp::endpoint { net::ip::make_address("127.0.0.1"), 0 });
            _acceptor.listen(net::socket_base::max_listen_connections);
            _port = _acceptor.local_endpoint().port();
            _do_accept();
            _io_thread = std::thread { [this] { _ioc.run(); } };
        }

        ~impl()
        {
            _shutdown = true;
            net::post(_ioc, [this] {
                beast::error_code ec {};
                _acceptor.close(ec);
            });
            _io_thread.join();
            {
                mutex::scoped_lock lk { _sessions_mutex };
                for (auto &sock: _sockets) {
                    beast::error_code ec {};
                    sock->shutdown(tcp::socket::shutdown_both, ec);
                }
            }
            for (auto &t: _sessions)
                t.join();
        }

        uint16_t port() const
        {
            return _port;
        }

        size_t num_requests() const
        {
            return _num_requests.load();
        }

        size_t num_connections() const
        {
            return _num_connections.load();
        }
    private:
        handler_type _handler;
        net::io_context _ioc {};
        tcp::acceptor _acceptor { _ioc };
        uint16_t _port = 0;
        std::atomic_bool _shutdown { false };
        std::atomic_size_t _num_requests { 0 };
        std::atomic_size_t _num_connections { 0 };
        alignas(mutex::padding) mutex::unique_lock::mutex_type _sessions_mutex {};
        std::vector<std::shared_ptr<tcp::socket>> _sockets {};
        std::vector<std::thread> _sessions {};
        std::thread _io_thread {};

        void _do_accept()
        {
            _acceptor.async_accept([this](const beast::error_code &ec, tcp::socket socket) {
                if (ec) {
                    if (!_shutdown)
                        logger::error("rpc_server_mock accept: {}", ec.message());
                    return;
                }
                ++_num_connections;
                auto sock = std::make_shared<tcp::socket>(std::move(socket));
                {
                    mutex::scoped_lock lk { _sessions_mutex };
                    _sockets.emplace_back(sock);
                    _sessions.emplace_back([this, sock] { _do_session(*sock); });
                }
                _do_accept();
            });
        }

        void _do_session(tcp::socket &sock)
        {
            beast::error_code ec {};
            beast::flat_buffer buffer {};
            for (;;) {
                bhttp::request<bhttp::string_body> req {};
                bhttp::read(sock, buffer, req, ec);
                if (ec)
                    break;
                ++_num_requests;
                reply rep {};
                try {
                    const auto jv = json::parse_text(req.body());
                    rep = _handler(jv.as_object());
                } catch (const std::exception &ex) {
                    logger::warn("rpc_server_mock: the handler has failed: {}", ex.what());
                    rep = reply { json::value {}, 500 };
                }
                if (rep.delay.count() > 0)
                    std::this_thread::sleep_for(rep.delay);
                if (rep.drop || _shutdown)
                    break;
                bhttp::response<bhttp::string_body> resp { static_cast<bhttp::status>(rep.status), req.version() };
                resp.set(bhttp::field::server, BOOST_BEAST_VERSION_STRING);
                resp.set(bhttp::field::content_type, "application/json");
                resp.keep_alive(req.keep_alive());
                resp.body() = rep.raw ? *rep.raw : json::serialize(rep.body);
                resp.prepare_payload();
                bhttp::write(sock, resp, ec);
                if (ec || !req.keep_alive())
                    break;
            }
            sock.shutdown(tcp::socket::shutdown_both, ec);
        }
    };

    rpc_server_mock::rpc_server_mock(const handler_type &handler)
        : _impl { std::make_unique<impl>(handler) }
    {
    }

    rpc_server_mock::~rpc_server_mock() =default;

    std::string rpc_server_mock::url() const
    {
        return fmt::format("http://127.0.0.1:{}/", _impl->port());
    }

    uint16_t rpc_server_mock::port() const
    {
        return _impl->port();
    }

    size_t rpc_server_mock::num_requests() const
    {
        return _impl->num_requests();
    }

    size_t rpc_server_mock::num_connections() const
    {
        return _impl->num_connections();
    }
}
