/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <zkas/compare/types.hpp>

namespace zk_account_soundness::compare {
    const char *outcome_name(const outcome o)
    {
        switch (o) {
            case outcome::match: return "MATCH";
            case outcome::mismatch_balance: return "MISMATCH_BALANCE";
            case outcome::mismatch_nonce: return "MISMATCH_NONCE";
            case outcome::mismatch_both: return "MISMATCH_BOTH";
            case outcome::fetch_error: return "FETCH_ERROR";
            default: throw error("unsupported outcome: {}", static_cast<int>(o));
        }
    }

    const char *run_status_name(const run_status s)
    {
        switch (s) {
            case run_status::ok: return "OK";
            case run_status::mismatch: return "MISMATCH";
            default: throw error("unsupported run_status: {}", static_cast<int>(s));
        }
    }

    outcome classify(const chain::fetch_result &a, const chain::fetch_result &b)
    {
        if (!chain::ok(a) || !chain::ok(b))
            return outcome::fetch_error;
        const auto &st_a = std::get<chain::account_state>(a);
        const auto &st_b = std::get<chain::account_state>(b);
        const bool same_balance = st_a.balance == st_b.balance;
        const bool same_nonce = st_a.nonce == st_b.nonce;
        if (same_balance && same_nonce)
            return outcome::match;
        if (same_nonce)
            return outcome::mismatch_balance;
        if (same_balance)
            return outcome::mismatch_nonce;
        return outcome::mismatch_both;
    }

    outcome_counts run_summary::counts() const
    {
        outcome_counts cnt {};
        for (const auto &r: results) {
            switch (r.verdict) {
                case outcome::match: ++cnt.match; break;
                case outcome::fetch_error: ++cnt.error; break;
                default: ++cnt.mismatch; break;
            }
        }
        return cnt;
    }
}
