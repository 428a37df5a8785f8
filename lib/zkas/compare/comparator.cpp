/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <condition_variable>
#include <optional>
#include <zkas/compare/comparator.hpp>
#include <zkas/logger.hpp>
#include <zkas/report/builder.hpp>
#include <zkas/timer.hpp>

namespace zk_account_soundness::compare {
    struct comparator::run_state {
        struct slot {
            std::optional<chain::fetch_result> a {};
            std::optional<chain::fetch_result> b {};
        };

        explicit run_state(const size_t num_accounts): slots(num_accounts)
        {
        }

        alignas(mutex::padding) mutex::unique_lock::mutex_type state_mutex {};
        alignas(mutex::padding) std::condition_variable_any cv {};
        std::vector<slot> slots;
        size_t remaining = 0;
        size_t accounts_done = 0;
        bool cancelled = false;

        void complete(const size_t idx, const bool side_a, chain::fetch_result &&res)
        {
            mutex::unique_lock lk { state_mutex };
            if (std::holds_alternative<chain::fetch_error>(res) && std::get<chain::fetch_error>(res).kind == chain::fetch_error::kind_type::cancelled)
                cancelled = true;
            auto &s = slots.at(idx);
            (side_a ? s.a : s.b).emplace(std::move(res));
            if (s.a && s.b) {
                ++accounts_done;
                logger::debug("compared {}/{}: {}", accounts_done, slots.size(), classify(*s.a, *s.b));
            }
            --remaining;
            lk.unlock();
            cv.notify_all();
        }
    };

    comparator::comparator(chain::reader &reader_a, chain::reader &reader_b)
        : _reader_a { reader_a }, _reader_b { reader_b }
    {
    }

    run_summary comparator::compare(const chain::source_ref &source_a, const chain::source_ref &source_b, const chain::address_list &addrs)
    {
        if (addrs.empty())
            throw error("the list of accounts to compare must not be empty");
        if (source_a.endpoint != _reader_a.endpoint() || source_b.endpoint != _reader_b.endpoint())
            throw error("the sources {} and {} do not match the configured readers", source_a.endpoint, source_b.endpoint);
        const auto timestamp = std::chrono::system_clock::now();
        timer t { "account comparison", logger::level::debug };
        auto st = std::make_shared<run_state>(addrs.size());
        st->remaining = addrs.size() * 2;
        {
            mutex::scoped_lock lk { _active_mutex };
            if (_cancelled)
                throw run_cancelled("the comparison has been cancelled before it started");
            _active = st;
        }
        logger::debug("comparing {} accounts: {} at {} vs {} at {}", addrs.size(), source_a.endpoint, source_a.block, source_b.endpoint, source_b.block);
        for (size_t i = 0; i < addrs.size(); ++i) {
            // the handlers own the state so that late completions after a cancellation stay valid
            _reader_a.fetch_async(addrs[i], source_a.block, [st, i](auto &&res) { st->complete(i, true, std::move(res)); });
            _reader_b.fetch_async(addrs[i], source_b.block, [st, i](auto &&res) { st->complete(i, false, std::move(res)); });
        }
        {
            mutex::unique_lock lk { st->state_mutex };
            st->cv.wait(lk, [&] { return st->remaining == 0 || st->cancelled; });
        }
        {
            mutex::scoped_lock lk { _active_mutex };
            _active.reset();
        }
        if (_cancelled || st->cancelled) {
            // make sure that the outstanding fetches of the other side are stopped as well
            _reader_a.cancel();
            _reader_b.cancel();
            throw run_cancelled("the comparison has been cancelled");
        }
        std::vector<account_comparison> results {};
        results.reserve(addrs.size());
        for (size_t i = 0; i < addrs.size(); ++i) {
            auto &s = st->slots[i];
            results.emplace_back(account_comparison::from_states(addrs[i], std::move(*s.a), std::move(*s.b)));
        }
        return report::build(std::move(results), source_a, source_b, timestamp, t.stop());
    }

    void comparator::cancel()
    {
        std::shared_ptr<run_state> st {};
        {
            mutex::scoped_lock lk { _active_mutex };
            _cancelled = true;
            st = _active;
        }
        logger::info("cancelling the comparison");
        if (st) {
            {
                mutex::scoped_lock lk { st->state_mutex };
                st->cancelled = true;
            }
            st->cv.notify_all();
        }
        _reader_a.cancel();
        _reader_b.cancel();
    }
}
