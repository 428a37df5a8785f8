/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_REPORT_BUILDER_HPP
#define ZK_ACCOUNT_SOUNDNESS_REPORT_BUILDER_HPP

#include <zkas/compare/types.hpp>

namespace zk_account_soundness::report {
    static constexpr int exit_ok = 0;
    static constexpr int exit_usage = 1;
    static constexpr int exit_mismatch = 2;
    static constexpr int exit_cancelled = 130;

    // derives the overall status: OK only when every account matches
    extern compare::run_summary build(std::vector<compare::account_comparison> &&results,
        const chain::source_ref &source_a, const chain::source_ref &source_b,
        std::chrono::system_clock::time_point timestamp=std::chrono::system_clock::now(), double elapsed_seconds=0.0);

    extern int exit_code(compare::run_status status);
}

#endif // !ZK_ACCOUNT_SOUNDNESS_REPORT_BUILDER_HPP
