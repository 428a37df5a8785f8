/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CLI_COMMON_HPP
#define ZK_ACCOUNT_SOUNDNESS_CLI_COMMON_HPP

#include <functional>
#include <memory>
#include <zkas/cli.hpp>
#include <zkas/config.hpp>

namespace zk_account_soundness::asio {
    struct worker;
}

namespace zk_account_soundness::cli::common {
    // the environment variables the commands take their defaults from
    static constexpr std::string_view env_rpc_a { "RPC_URL" };
    static constexpr std::string_view env_rpc_b { "RPC_URL_B" };

    extern environment capture_environment();

    extern void add_compare_opts(config &cmd);
    extern void add_state_opts(config &cmd);

    // Merges the command line, the optional --config file, and the environment, in this order
    // of precedence, then applies the defaults and validates the result.
    // Throws config_error before any network activity.
    extern settings resolve_compare(const options &opts, const environment &env);
    extern settings resolve_state(const options &opts, const environment &env);

    // Runs the action on the first SIGINT or SIGTERM received while the guard is alive
    struct interrupt_guard {
        using action_type = std::function<void()>;

        explicit interrupt_guard(const action_type &on_interrupt);
        interrupt_guard(const action_type &on_interrupt, asio::worker &asio_worker);
        ~interrupt_guard();
        bool triggered() const;
    private:
        struct impl;
        std::shared_ptr<impl> _impl;
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CLI_COMMON_HPP
