/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <future>
#include <zkas/chain/reader-mock.hpp>
#include <zkas/common/test.hpp>
#include <zkas/compare/comparator.hpp>
#include <zkas/report/builder.hpp>

using namespace zk_account_soundness;
using namespace zk_account_soundness::chain;
using namespace zk_account_soundness::compare;

namespace {
    const auto zero_addr = address::from_hex("0x0000000000000000000000000000000000000000");
    const auto alice = address::from_hex("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    const auto bob = address::from_hex("0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359");
    const auto carol = address::from_hex("0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB");

    const fetch_error timeout_err { fetch_error::kind_type::timeout, "no response within 30000 ms during read" };

    account_state state(const address &addr, const cpp_int &balance, const uint64_t nonce)
    {
        return account_state { addr, balance, nonce };
    }

    run_summary run(reader_mock &a, reader_mock &b, const address_list &addrs,
        const block_ref &block_a=block_ref::latest(), const block_ref &block_b=block_ref::latest())
    {
        comparator cmp { a, b };
        return cmp.compare(source_ref { a.endpoint(), block_a }, source_ref { b.endpoint(), block_b }, addrs);
    }
}

suite compare_comparator_suite = [] {
    "compare::classify"_test = [] {
        test_same(outcome::match, classify(state(alice, 5, 1), state(alice, 5, 1)));
        test_same(outcome::mismatch_balance, classify(state(alice, 5, 1), state(alice, 6, 1)));
        test_same(outcome::mismatch_nonce, classify(state(alice, 5, 1), state(alice, 5, 2)));
        test_same(outcome::mismatch_both, classify(state(alice, 5, 1), state(alice, 6, 2)));
        test_same(outcome::fetch_error, classify(timeout_err, state(alice, 5, 1)));
        test_same(outcome::fetch_error, classify(state(alice, 5, 1), timeout_err));
        test_same(outcome::fetch_error, classify(timeout_err, timeout_err));
        // exact integer equality beyond the 64-bit range
        const cpp_int big { "1042000000000000000000" };
        test_same(outcome::match, classify(state(alice, big, 15), state(alice, big, 15)));
        test_same(outcome::mismatch_balance, classify(state(alice, big, 15), state(alice, big + 1, 15)));
        // idempotence
        for (size_t i = 0; i < 3; ++i)
            test_same(outcome::mismatch_nonce, classify(state(bob, 7, 3), state(bob, 7, 4)));
    };
    "compare::comparator"_test = [] {
        "zero address matches"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            const auto s = run(a, b, { zero_addr });
            test_same(size_t { 1 }, s.results.size());
            test_same(outcome::match, s.results[0].verdict);
            test_same(run_status::ok, s.status);
            test_same(report::exit_ok, report::exit_code(s.status));
        };
        "large balances match"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            const cpp_int bal { "1042000000000000000000" };
            a.set_state(alice, bal, 15);
            b.set_state(alice, bal, 15);
            const auto s = run(a, b, { alice });
            test_same(outcome::match, s.results.at(0).verdict);
            test_same(run_status::ok, s.status);
        };
        "balance mismatch"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            a.set_state(alice, 100, 3);
            b.set_state(alice, 200, 3);
            const auto s = run(a, b, { alice });
            test_same(outcome::mismatch_balance, s.results.at(0).verdict);
            test_same(run_status::mismatch, s.status);
            test_same(report::exit_mismatch, report::exit_code(s.status));
        };
        "timeout on one side is isolated"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            a.set_state(alice, 10, 1).set_state(bob, 20, 2);
            b.set_state(alice, 10, 1).set_error(bob, timeout_err);
            const auto s = run(a, b, { alice, bob });
            test_same(size_t { 2 }, s.results.size());
            test_same(outcome::match, s.results[0].verdict);
            test_same(outcome::fetch_error, s.results[1].verdict);
            expect(ok(s.results[1].state_a));
            test_same(timeout_err, std::get<fetch_error>(s.results[1].state_b));
            test_same(run_status::mismatch, s.status);
            test_same(report::exit_mismatch, report::exit_code(s.status));
            const auto cnt = s.counts();
            test_same(size_t { 1 }, cnt.match);
            test_same(size_t { 0 }, cnt.mismatch);
            test_same(size_t { 1 }, cnt.error);
        };
        "one match and one nonce mismatch"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            a.set_state(alice, 1, 1).set_state(bob, 2, 7);
            b.set_state(alice, 1, 1).set_state(bob, 2, 8);
            const auto s = run(a, b, { alice, bob });
            test_same(outcome::match, s.results[0].verdict);
            test_same(outcome::mismatch_nonce, s.results[1].verdict);
            test_same(run_status::mismatch, s.status);
        };
        "input order survives out-of-order completion"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            a.set_state(alice, 1, 1).set_delay(alice, std::chrono::milliseconds { 60 });
            a.set_state(bob, 2, 2).set_delay(bob, std::chrono::milliseconds { 30 });
            a.set_state(carol, 3, 3);
            b.set_state(alice, 1, 1);
            b.set_state(bob, 2, 2).set_delay(bob, std::chrono::milliseconds { 50 });
            b.set_state(carol, 4, 3).set_delay(carol, std::chrono::milliseconds { 10 });
            const address_list addrs { alice, bob, carol };
            const auto s = run(a, b, addrs);
            test_same(addrs.size(), s.results.size());
            for (size_t i = 0; i < addrs.size(); ++i)
                test_same(addrs[i], s.results[i].addr);
            test_same(outcome::mismatch_balance, s.results[2].verdict);
        };
        "duplicates produce independent results"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            a.set_state(alice, 9, 9);
            b.set_state(alice, 9, 9);
            const auto s = run(a, b, { alice, bob, alice });
            test_same(size_t { 3 }, s.results.size());
            test_same(alice, s.results[0].addr);
            test_same(bob, s.results[1].addr);
            test_same(alice, s.results[2].addr);
            test_same(size_t { 3 }, a.num_fetches());
            test_same(size_t { 3 }, b.num_fetches());
        };
        "blocks are forwarded per side"_test = [] {
            reader_mock a { "http://node:8545" }, b { "http://node:8545" };
            const auto s = run(a, b, { alice }, block_ref { 19000000 }, block_ref::latest());
            test_same(block_ref { 19000000 }, s.source_a.block);
            test_same(block_ref::latest(), s.source_b.block);
            test_same(block_ref { 19000000 }, a.blocks().at(0));
            test_same(block_ref::latest(), b.blocks().at(0));
        };
        "timestamp is captured at the start"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            a.set_delay(alice, std::chrono::milliseconds { 50 });
            const auto before = std::chrono::system_clock::now();
            const auto s = run(a, b, { alice });
            expect(s.timestamp >= before);
            expect(s.timestamp < before + std::chrono::milliseconds { 40 });
            expect(s.elapsed_seconds >= 0.04);
        };
        "empty address list"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            expect(throws([&] { run(a, b, {}); }));
        };
        "mismatched sources"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            comparator cmp { a, b };
            expect(throws([&] {
                cmp.compare(source_ref { "http://other:8545" }, source_ref { b.endpoint() }, { alice });
            }));
        };
        "cancellation"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            a.set_delay(alice, std::chrono::seconds { 5 });
            b.set_delay(alice, std::chrono::seconds { 5 });
            comparator cmp { a, b };
            auto f = std::async(std::launch::async, [&] {
                return cmp.compare(source_ref { a.endpoint() }, source_ref { b.endpoint() }, { alice, bob });
            });
            std::this_thread::sleep_for(std::chrono::milliseconds { 50 });
            const auto start = std::chrono::steady_clock::now();
            cmp.cancel();
            expect(throws<run_cancelled>([&] { f.get(); }));
            expect(std::chrono::steady_clock::now() - start < std::chrono::seconds { 2 });
            expect(cmp.cancelled());
        };
        "cancelled before the start"_test = [] {
            reader_mock a { "http://node-a:8545" }, b { "http://node-b:8545" };
            comparator cmp { a, b };
            cmp.cancel();
            expect(throws<run_cancelled>([&] {
                cmp.compare(source_ref { a.endpoint() }, source_ref { b.endpoint() }, { alice });
            }));
            test_same(size_t { 0 }, a.num_fetches());
        };
    };
};
