/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <optional>
#include <zkas/common/test.hpp>

using namespace zk_account_soundness;

namespace {
    template<typename E, typename F>
    void expect_throws_msg(const F &f, const std::string &match, const std::source_location &src_loc=std::source_location::current())
    {
        std::optional<std::string> msg {};
        try {
            f();
        } catch (const E &ex) {
            msg = ex.what();
        }
        expect(static_cast<bool>(msg)) << "no exception has been thrown";
        if (msg)
            expect(msg->find(match) != msg->npos) << fmt::format("'{}' does not contain '{}' from {}:{}", *msg, match, src_loc.file_name(), src_loc.line());
    }
}

suite common_error_suite = [] {
    "common::error"_test = [] {
        "no args"_test = [] {
            expect_throws_msg<error>([] { throw error("Hello!"); }, "Hello!");
        };
        "formatted"_test = [] {
            expect_throws_msg<error>([] { throw error("Hello {}!", 123); }, "Hello 123!");
            expect_throws_msg<error>([] { throw error("{} and {}", "a", std::string { "b" }); }, "a and b");
        };
        "errno"_test = [] {
            errno = 0;
            expect_throws_msg<error_sys>([] { throw error_sys("open failed"); }, "open failed errno: 0");
        };
        "hierarchy"_test = [] {
            expect(throws<error>([] { throw config_error("missing {}", "rpc-a"); }));
            expect(throws<error>([] { throw run_cancelled("the run has been cancelled"); }));
            expect_throws_msg<config_error>([] { throw config_error("missing {}", "rpc-a"); }, "missing rpc-a");
        };
    };
};
