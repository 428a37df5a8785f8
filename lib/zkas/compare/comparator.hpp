/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_COMPARE_COMPARATOR_HPP
#define ZK_ACCOUNT_SOUNDNESS_COMPARE_COMPARATOR_HPP

#include <atomic>
#include <memory>
#include <zkas/chain/reader.hpp>
#include <zkas/compare/types.hpp>
#include <zkas/mutex.hpp>

namespace zk_account_soundness::compare {
    // Fetches every account from both sources concurrently and classifies the pairs.
    // The concurrency is bounded by the readers' transport.
    struct comparator {
        comparator(chain::reader &reader_a, chain::reader &reader_b);

        // Results follow the order of addrs, duplicates included.
        // Throws run_cancelled when the run is cancelled, a cancelled run has no summary.
        run_summary compare(const chain::source_ref &source_a, const chain::source_ref &source_b, const chain::address_list &addrs);

        // may be called from any thread, including before compare
        void cancel();

        bool cancelled() const
        {
            return _cancelled.load();
        }
    private:
        struct run_state;

        chain::reader &_reader_a;
        chain::reader &_reader_b;
        std::atomic_bool _cancelled { false };
        alignas(mutex::padding) mutex::unique_lock::mutex_type _active_mutex {};
        std::shared_ptr<run_state> _active {};
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_COMPARE_COMPARATOR_HPP
