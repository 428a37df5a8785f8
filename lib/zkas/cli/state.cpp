/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <condition_variable>
#include <zkas/chain/rpc-reader.hpp>
#include <zkas/cli.hpp>
#include <zkas/cli/common.hpp>
#include <zkas/cli/state.hpp>
#include <zkas/http/rpc-queue.hpp>
#include <zkas/report/builder.hpp>
#include <zkas/report/renderer.hpp>
#include <zkas/timer.hpp>

namespace zk_account_soundness::cli::state {
    int execute(const settings &s, chain::reader &reader, std::ostream &os)
    {
        report::state_report rep { chain::source_ref { s.rpc_a, s.block_a } };
        rep.timestamp = std::chrono::system_clock::now();
        timer t { "state fetch", logger::level::debug };
        struct shared_state {
            alignas(mutex::padding) mutex::unique_lock::mutex_type state_mutex {};
            alignas(mutex::padding) std::condition_variable_any cv {};
            std::vector<std::optional<chain::fetch_result>> results {};
            size_t remaining = 0;
        };
        auto st = std::make_shared<shared_state>();
        st->results.resize(s.addresses.size());
        st->remaining = s.addresses.size();
        for (size_t i = 0; i < s.addresses.size(); ++i) {
            reader.fetch_async(s.addresses[i], s.block_a, [st, i](auto &&res) {
                {
                    mutex::scoped_lock lk { st->state_mutex };
                    st->results[i].emplace(std::move(res));
                    --st->remaining;
                }
                st->cv.notify_all();
            });
        }
        {
            mutex::unique_lock lk { st->state_mutex };
            st->cv.wait(lk, [&] { return st->remaining == 0; });
        }
        rep.elapsed_seconds = t.stop();
        bool all_ok = true;
        for (size_t i = 0; i < s.addresses.size(); ++i) {
            auto &res = *st->results[i];
            if (!chain::ok(res)) {
                if (std::get<chain::fetch_error>(res).kind == chain::fetch_error::kind_type::cancelled) {
                    logger::warn("the state fetch has been cancelled");
                    return report::exit_cancelled;
                }
                all_ok = false;
            }
            rep.accounts.emplace_back(report::state_report::entry { s.addresses[i], std::move(res) });
        }
        os << report::render(rep, s.json ? report::format::json : report::format::text);
        os.flush();
        return all_ok ? report::exit_ok : report::exit_mismatch;
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "state";
            cmd.desc = "show balances and nonces of accounts at a single RPC endpoint";
            common::add_state_opts(cmd);
        }

        int run(const arguments &, const options &opts) const override
        {
            const auto s = common::resolve_state(opts, common::capture_environment());
            http::rpc_queue_async queue { s.max_in_flight, s.retries };
            chain::rpc_reader reader { s.rpc_a, queue, s.timeout };
            common::interrupt_guard guard { [&] { reader.cancel(); } };
            return execute(s, reader, std::cout);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
