/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <zkas/cli.hpp>
#include <zkas/common/test.hpp>

using namespace zk_account_soundness;
using namespace zk_account_soundness::cli;

namespace {
    struct test_cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "test";
            cmd.desc = "a command used by the tests";
            cmd.opts.try_emplace("rpc", "an endpoint");
            cmd.opts.try_emplace("block", "a block", "latest");
            cmd.opts.try_emplace("address", "an account", std::optional<std::string> {}, false, true);
            cmd.opts.try_emplace("json", "json output", std::optional<std::string> {}, true);
            cmd.opts.try_emplace("fail", "fail during the run", std::optional<std::string> {}, true);
            cmd.opts.try_emplace("reject", "reject the configuration", std::optional<std::string> {}, true);
        }

        int run(const arguments &, const options &opts) const override
        {
            if (opt_flag(opts, "reject"))
                throw config_error("the configuration is rejected");
            if (opt_flag(opts, "fail"))
                throw error("the run has failed");
            return opt_flag(opts, "json") ? 7 : 5;
        }
    };

    parse_result parse(const arguments &args)
    {
        test_cmd cmd {};
        config cfg {};
        cmd.configure(cfg);
        return cmd.parse(cfg, args);
    }
}

suite cli_suite = [] {
    "cli::command"_test = [] {
        "both value forms"_test = [] {
            const auto pr = parse({ "--rpc=http://a:8545", "--block", "19000000" });
            test_same(std::string { "http://a:8545" }, opt_value(pr.opts, "rpc").value());
            test_same(std::string { "19000000" }, opt_value(pr.opts, "block").value());
            expect(!opt_flag(pr.opts, "json"));
        };
        "defaults are not filled in"_test = [] {
            const auto pr = parse({});
            expect(!opt_value(pr.opts, "block"));
            expect(pr.opts.empty());
        };
        "repeatable options keep their order"_test = [] {
            const auto pr = parse({ "--address", "0x01", "--address=0x02", "--json", "--address", "0x01" });
            const auto &addrs = pr.opts.at("address");
            test_same(size_t { 3 }, addrs.size());
            test_same(std::string { "0x01" }, addrs[0]);
            test_same(std::string { "0x02" }, addrs[1]);
            test_same(std::string { "0x01" }, addrs[2]);
            expect(opt_flag(pr.opts, "json"));
        };
        "usage errors"_test = [] {
            expect(throws<usage_error>([] { parse({ "--unknown=1" }); }));
            expect(throws<usage_error>([] { parse({ "--rpc" }); }));
            expect(throws<usage_error>([] { parse({ "--rpc=a", "--rpc=b" }); }));
            expect(throws<usage_error>([] { parse({ "--json=true" }); }));
            expect(throws<usage_error>([] { parse({ "--json", "--json" }); }));
            expect(throws<usage_error>([] { parse({ "positional" }); }));
            expect(throws<config_error>([] { parse({ "--unknown" }); }));
        };
        "help lists the options"_test = [] {
            test_cmd cmd {};
            config cfg {};
            cmd.configure(cfg);
            const auto help = cfg.make_help();
            expect(help.find("--block=<value> (latest by default)") != std::string::npos) << help;
            expect(help.find("--address=<value> (repeatable)") != std::string::npos) << help;
            expect(help.find("--json - json output") != std::string::npos) << help;
        };
    };
    "cli::run"_test = [] {
        const command::command_list cmds { std::make_shared<test_cmd>() };
        "exit codes of the command"_test = [&] {
            const char *argv[] = { "zkas", "test", "--json" };
            test_same(7, cli::run(3, argv, cmds));
            const char *argv2[] = { "zkas", "test", "--rpc", "x" };
            test_same(5, cli::run(4, argv2, cmds));
        };
        "usage problems exit with 1"_test = [&] {
            const char *no_cmd[] = { "zkas" };
            test_same(1, cli::run(1, no_cmd, cmds));
            const char *unknown_cmd[] = { "zkas", "unknown" };
            test_same(1, cli::run(2, unknown_cmd, cmds));
            const char *bad_opt[] = { "zkas", "test", "--bad" };
            test_same(1, cli::run(3, bad_opt, cmds));
            const char *rejected[] = { "zkas", "test", "--reject" };
            test_same(exit_usage_error, cli::run(3, rejected, cmds));
        };
        "runtime failures are not usage errors"_test = [&] {
            const char *failing[] = { "zkas", "test", "--fail" };
            test_same(exit_failure, cli::run(3, failing, cmds));
            expect(exit_failure != exit_usage_error);
        };
    };
};
