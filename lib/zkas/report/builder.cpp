/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <zkas/report/builder.hpp>

namespace zk_account_soundness::report {
    compare::run_summary build(std::vector<compare::account_comparison> &&results,
        const chain::source_ref &source_a, const chain::source_ref &source_b,
        const std::chrono::system_clock::time_point timestamp, const double elapsed_seconds)
    {
        const bool all_match = std::all_of(results.begin(), results.end(), [](const auto &r) {
            return r.verdict == compare::outcome::match;
        });
        return compare::run_summary {
            source_a, source_b, std::move(results), timestamp, elapsed_seconds,
            all_match ? compare::run_status::ok : compare::run_status::mismatch
        };
    }

    int exit_code(const compare::run_status status)
    {
        switch (status) {
            case compare::run_status::ok: return exit_ok;
            case compare::run_status::mismatch: return exit_mismatch;
            default: throw error("unsupported run_status: {}", static_cast<int>(status));
        }
    }
}
