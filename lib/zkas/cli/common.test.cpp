/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <thread>
#include <zkas/cli/common.hpp>
#include <zkas/common/test.hpp>

using namespace zk_account_soundness;
using namespace zk_account_soundness::cli;

namespace {
    const std::string alice_hex { "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed" };

    options compare_opts(const arguments &args)
    {
        struct probe: command {
            void configure(cli::config &cmd) const override
            {
                cmd.name = "probe";
                common::add_compare_opts(cmd);
            }

            int run(const arguments &, const options &) const override
            {
                return 0;
            }
        };
        probe cmd {};
        cli::config cfg {};
        cmd.configure(cfg);
        return cmd.parse(cfg, args).opts;
    }

    std::string write_config(const std::string &name, const std::string &text)
    {
        const std::string tmp_dir { "./tmp/test-cli-common" };
        std::filesystem::create_directories(tmp_dir);
        const auto path = fmt::format("{}/{}", tmp_dir, name);
        std::ofstream os { path };
        os << text;
        return path;
    }
}

suite cli_common_suite = [] {
    "cli::common::resolve_compare"_test = [] {
        "defaults"_test = [] {
            const auto s = common::resolve_compare(compare_opts({ "--rpc-a=http://a:8545", "--rpc-b=https://b.example.org", "--address", alice_hex }), environment {});
            test_same(std::string { "http://a:8545" }, s.rpc_a);
            test_same(std::string { "https://b.example.org" }, s.rpc_b);
            test_same(chain::block_ref::latest(), s.block_a);
            test_same(chain::block_ref::latest(), s.block_b);
            test_same(int64_t { 30 }, static_cast<int64_t>(s.timeout.count()));
            test_same(size_t { 8 }, s.max_in_flight);
            test_same(size_t { 0 }, s.retries);
            expect(!s.json);
            test_same(size_t { 1 }, s.addresses.size());
        };
        "environment fallback"_test = [] {
            const environment env { { { "RPC_URL", "http://env-a:8545" }, { "RPC_URL_B", "http://env-b:8545" } } };
            const auto s = common::resolve_compare(compare_opts({ "--address", alice_hex }), env);
            test_same(std::string { "http://env-a:8545" }, s.rpc_a);
            test_same(std::string { "http://env-b:8545" }, s.rpc_b);
        };
        "precedence: flag over file over environment"_test = [] {
            const auto path = write_config("precedence.json", R"({
                "rpcA": "http://file-a:8545", "rpcB": "http://file-b:8545",
                "blockA": 19000000, "blockB": "finalized", "timeout": 5, "maxInFlight": 2, "retries": 1 })");
            const environment env { { { "RPC_URL", "http://env-a:8545" }, { "RPC_URL_B", "http://env-b:8545" } } };
            const auto s = common::resolve_compare(compare_opts({ "--config", path, "--rpc-b=http://flag-b:8545",
                "--timeout=7", "--address", alice_hex, "--json" }), env);
            test_same(std::string { "http://file-a:8545" }, s.rpc_a);
            test_same(std::string { "http://flag-b:8545" }, s.rpc_b);
            test_same(chain::block_ref { 19000000 }, s.block_a);
            test_same(std::string { "finalized" }, s.block_b.to_string());
            test_same(int64_t { 7 }, static_cast<int64_t>(s.timeout.count()));
            test_same(size_t { 2 }, s.max_in_flight);
            test_same(size_t { 1 }, s.retries);
            expect(s.json);
        };
        "addresses are normalized and kept in order"_test = [] {
            const auto s = common::resolve_compare(compare_opts({ "--rpc-a=http://a", "--rpc-b=http://b",
                "--address", "0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359", "--address", alice_hex,
                "--address", "0xfb6916095ca1df60bb79ce92ce3ea74c37c5d359" }), environment {});
            test_same(size_t { 3 }, s.addresses.size());
            test_same(std::string { "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359" }, s.addresses[0].to_string());
            test_same(alice_hex, s.addresses[1].to_string());
            test_same(s.addresses[0], s.addresses[2]);
        };
        "configuration errors"_test = [] {
            const auto bad = [](const arguments &args) {
                return throws<config_error>([&] { common::resolve_compare(compare_opts(args), environment {}); });
            };
            // missing endpoints
            expect(bad({ "--address", alice_hex }));
            expect(bad({ "--rpc-a=http://a", "--address", alice_hex }));
            // bad endpoints
            expect(bad({ "--rpc-a=ws://a", "--rpc-b=http://b", "--address", alice_hex }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=b.example.org", "--address", alice_hex }));
            // addresses
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", "0x1234" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", "0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed" }));
            // numbers and blocks
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--timeout=0" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--timeout=-5" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--max-in-flight=0" }));
            // values that would overflow the request deadlines or retry without end
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--timeout=10000000000000000" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--timeout=86401" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--retries=18446744073709551615" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--retries=11" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--config", write_config("huge-timeout.json", R"({"timeout": 10000000000000000})") }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--block-a=yesterday" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--block-b=-1" }));
            // config files
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--config=./tmp/test-cli-common/missing.json" }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--config", write_config("list.json", "[]") }));
            expect(bad({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex, "--config", write_config("type.json", R"({"timeout": "soon"})") }));
        };
    };
    "cli::common::resolve_compare limits"_test = [] {
        const auto s = common::resolve_compare(compare_opts({ "--rpc-a=http://a", "--rpc-b=http://b", "--address", alice_hex,
            "--timeout=86400", "--retries=10" }), environment {});
        test_same(int64_t { 86400 }, static_cast<int64_t>(s.timeout.count()));
        test_same(int64_t { 86400000 }, static_cast<int64_t>(std::chrono::milliseconds { s.timeout }.count()));
        test_same(size_t { 10 }, s.retries);
    };
    "cli::common::resolve_state"_test = [] {
        const environment env { { { "RPC_URL", "http://env-a:8545" } } };
        struct probe: command {
            void configure(cli::config &cmd) const override
            {
                cmd.name = "probe";
                common::add_state_opts(cmd);
            }

            int run(const arguments &, const options &) const override
            {
                return 0;
            }
        };
        probe cmd {};
        cli::config cfg {};
        cmd.configure(cfg);
        const auto s = common::resolve_state(cmd.parse(cfg, { "--block=0x10", "--address", alice_hex }).opts, env);
        test_same(std::string { "http://env-a:8545" }, s.rpc_a);
        test_same(chain::block_ref { 16 }, s.block_a);
        expect(s.rpc_b.empty());
    };
    "cli::common::interrupt_guard"_test = [] {
        std::atomic_size_t calls { 0 };
        {
            common::interrupt_guard guard { [&] { ++calls; } };
            expect(!guard.triggered());
            std::raise(SIGTERM);
            for (size_t i = 0; i < 200 && !guard.triggered(); ++i)
                std::this_thread::sleep_for(std::chrono::milliseconds { 5 });
            expect(guard.triggered());
        }
        test_same(size_t { 1 }, calls.load());
    };
};
