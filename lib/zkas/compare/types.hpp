/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_COMPARE_TYPES_HPP
#define ZK_ACCOUNT_SOUNDNESS_COMPARE_TYPES_HPP

#include <chrono>
#include <vector>
#include <zkas/chain/types.hpp>

namespace zk_account_soundness::compare {
    enum class outcome {
        match, mismatch_balance, mismatch_nonce, mismatch_both, fetch_error
    };

    enum class run_status {
        ok, mismatch
    };

    extern const char *outcome_name(outcome o);
    extern const char *run_status_name(run_status s);

    // a pure function of the two observations
    extern outcome classify(const chain::fetch_result &a, const chain::fetch_result &b);

    struct account_comparison {
        chain::address addr {};
        chain::fetch_result state_a {};
        chain::fetch_result state_b {};
        outcome verdict = outcome::fetch_error;

        static account_comparison from_states(const chain::address &addr, chain::fetch_result &&a, chain::fetch_result &&b)
        {
            const auto v = classify(a, b);
            return { addr, std::move(a), std::move(b), v };
        }
    };

    struct outcome_counts {
        size_t match = 0;
        size_t mismatch = 0;
        size_t error = 0;

        bool operator==(const outcome_counts &o) const =default;
    };

    struct run_summary {
        chain::source_ref source_a {};
        chain::source_ref source_b {};
        // one entry per requested address, in the order of the request
        std::vector<account_comparison> results {};
        std::chrono::system_clock::time_point timestamp {};
        double elapsed_seconds = 0.0;
        run_status status = run_status::ok;

        outcome_counts counts() const;
    };
}

namespace fmt {
    template<>
    struct formatter<zk_account_soundness::compare::outcome>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", zk_account_soundness::compare::outcome_name(v));
        }
    };

    template<>
    struct formatter<zk_account_soundness::compare::run_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", zk_account_soundness::compare::run_status_name(v));
        }
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_COMPARE_TYPES_HPP
