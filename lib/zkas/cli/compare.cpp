/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <zkas/chain/rpc-reader.hpp>
#include <zkas/cli.hpp>
#include <zkas/cli/common.hpp>
#include <zkas/cli/compare.hpp>
#include <zkas/http/rpc-queue.hpp>
#include <zkas/report/builder.hpp>
#include <zkas/report/renderer.hpp>

namespace zk_account_soundness::cli::compare {
    int execute(const settings &s, zk_account_soundness::compare::comparator &cmp, std::ostream &os)
    {
        const chain::source_ref source_a { s.rpc_a, s.block_a };
        const chain::source_ref source_b { s.rpc_b, s.block_b };
        logger::info("comparing {} account(s): {} at {} vs {} at {}", s.addresses.size(), source_a.endpoint, source_a.block, source_b.endpoint, source_b.block);
        try {
            const auto summary = cmp.compare(source_a, source_b, s.addresses);
            os << report::render(summary, s.json ? report::format::json : report::format::text);
            os.flush();
            const auto cnt = summary.counts();
            logger::info("overall status: {} match: {} mismatch: {} error: {}", summary.status, cnt.match, cnt.mismatch, cnt.error);
            return report::exit_code(summary.status);
        } catch (const run_cancelled &ex) {
            logger::warn("{}", ex.what());
            return report::exit_cancelled;
        }
    }

    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "compare";
            cmd.desc = "compare balances and nonces of accounts between two RPC endpoints or two blocks";
            common::add_compare_opts(cmd);
        }

        int run(const arguments &, const options &opts) const override
        {
            const auto s = common::resolve_compare(opts, common::capture_environment());
            http::rpc_queue_async queue { s.max_in_flight, s.retries };
            chain::rpc_reader reader_a { s.rpc_a, queue, s.timeout };
            chain::rpc_reader reader_b { s.rpc_b, queue, s.timeout };
            zk_account_soundness::compare::comparator cmp { reader_a, reader_b };
            common::interrupt_guard guard { [&] { cmp.cancel(); } };
            return execute(s, cmp, std::cout);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
