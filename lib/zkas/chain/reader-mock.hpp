/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CHAIN_READER_MOCK_HPP
#define ZK_ACCOUNT_SOUNDNESS_CHAIN_READER_MOCK_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <thread>
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <zkas/asio.hpp>
#include <zkas/chain/reader.hpp>
#include <zkas/mutex.hpp>

namespace zk_account_soundness::chain {
    // Serves scripted account states and errors. Completions are delivered from the asio worker
    // after a per-address delay, which allows tests to control the completion order.
    // Unknown accounts are reported with a zero balance and a zero nonce like a real node does.
    struct reader_mock: reader {
        explicit reader_mock(const std::string &endpoint, asio::worker &asio_worker=asio::worker::get())
            : _endpoint { endpoint }, _asio_worker { asio_worker }
        {
        }

        ~reader_mock() override
        {
            cancel();
            while (_num_pending.load() > 0)
                std::this_thread::sleep_for(std::chrono::milliseconds { 1 });
        }

        reader_mock &set_state(const account_state &st)
        {
            mutex::scoped_lock lk { _script_mutex };
            _script.insert_or_assign(st.addr, fetch_result { st });
            return *this;
        }

        reader_mock &set_state(const address &addr, const cpp_int &balance, const uint64_t nonce)
        {
            return set_state(account_state { addr, balance, nonce });
        }

        reader_mock &set_error(const address &addr, const fetch_error &err)
        {
            mutex::scoped_lock lk { _script_mutex };
            _script.insert_or_assign(addr, fetch_result { err });
            return *this;
        }

        reader_mock &set_delay(const address &addr, const std::chrono::milliseconds delay)
        {
            mutex::scoped_lock lk { _script_mutex };
            _delays.insert_or_assign(addr, delay);
            return *this;
        }

        size_t num_fetches() const
        {
            return _num_fetches.load();
        }

        // the blocks the fetches were requested at, in the order of the calls
        std::vector<block_ref> blocks() const
        {
            mutex::scoped_lock lk { _script_mutex };
            return _blocks;
        }
    private:
        using timer_ptr = std::shared_ptr<boost::asio::steady_timer>;

        const std::string _endpoint;
        asio::worker &_asio_worker;
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _script_mutex {};
        std::map<address, fetch_result> _script {};
        std::map<address, std::chrono::milliseconds> _delays {};
        std::vector<block_ref> _blocks {};
        std::set<timer_ptr> _timers {};
        std::atomic_size_t _num_fetches { 0 };
        std::atomic_size_t _num_pending { 0 };

        void _fetch_async_impl(const address &addr, const block_ref &block, const handler_type &handler) override
        {
            ++_num_fetches;
            ++_num_pending;
            fetch_result res { account_state { addr, 0, 0 } };
            std::chrono::milliseconds delay { 0 };
            auto timer = std::make_shared<boost::asio::steady_timer>(_asio_worker.io_context());
            {
                mutex::scoped_lock lk { _script_mutex };
                if (const auto it = _script.find(addr); it != _script.end())
                    res = it->second;
                if (const auto it = _delays.find(addr); it != _delays.end())
                    delay = it->second;
                _blocks.emplace_back(block);
                _timers.emplace(timer);
            }
            timer->expires_after(delay);
            timer->async_wait([this, timer, handler, res=std::move(res)](const auto &ec) mutable {
                {
                    mutex::scoped_lock lk { _script_mutex };
                    _timers.erase(timer);
                }
                if (ec)
                    handler(fetch_result { fetch_error { fetch_error::kind_type::cancelled, "the fetch has been cancelled" } });
                else
                    handler(std::move(res));
                --_num_pending;
            });
        }

        void _cancel_impl() override
        {
            mutex::scoped_lock lk { _script_mutex };
            for (const auto &t: _timers)
                t->cancel();
        }

        const std::string &_endpoint_impl() const override
        {
            return _endpoint;
        }
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CHAIN_READER_MOCK_HPP
