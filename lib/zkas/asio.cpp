/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <optional>
#include <thread>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <zkas/asio.hpp>
#include <zkas/logger.hpp>

namespace zk_account_soundness::asio {
    namespace net = boost::asio;

    struct worker::impl {
        explicit impl() =default;

        ~impl()
        {
            _shutdown = true;
            _guard.reset();
            _ioc.stop();
            _worker.join();
        }

        void post(const action_type &act)
        {
            net::post(_ioc, [act] { _run_isolated("posted action", act); });
        }

        net::io_context &io_context()
        {
            return _ioc;
        }
    private:
        static void _run_isolated(const std::string_view &name, const action_type &act)
        {
            try {
                act();
            } catch (const error &ex) {
                logger::error("asio {} failed: {}", name, ex.what());
            } catch (const std::exception &ex) {
                logger::error("asio {} std::exception: {}", name, ex.what());
            }
        }

        void _io_thread()
        {
            for (;;) {
                static std::string_view loop_name { "asio loop" };
                _run_isolated(loop_name, [&] {
                    _ioc.run();
                });
                if (_shutdown)
                    break;
                // a handler has thrown: the remaining handlers are still to be served
                if (_ioc.stopped())
                    _ioc.restart();
            }
        }

        std::atomic_bool _shutdown { false };
        net::io_context _ioc {};
        std::optional<net::executor_work_guard<net::io_context::executor_type>> _guard { net::make_work_guard(_ioc) };
        std::thread _worker { [&] { _io_thread(); } };
    };

    worker &worker::get()
    {
        static worker w {};
        return w;
    }

    worker::worker(): _impl { std::make_unique<impl>() }
    {
    }

    worker::~worker() =default;

    void worker::post(const action_type &act)
    {
        _impl->post(act);
    }

    net::io_context &worker::io_context()
    {
        return _impl->io_context();
    }
}
