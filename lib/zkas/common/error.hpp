/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_COMMON_ERROR_HPP
#define ZK_ACCOUNT_SOUNDNESS_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#   endif
#endif
#include <fmt/core.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

namespace zk_account_soundness {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);

        template<typename A, typename... Args>
        explicit error(fmt::format_string<A, Args...> fmt, A &&a, Args&&... args):
            error { std::string_view { fmt::format(fmt, std::forward<A>(a), std::forward<Args>(args)...) } }
        {
        }
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };

    // a problem with the command line, the environment, or a config file
    struct config_error: error {
        using error::error;
    };

    struct run_cancelled: error {
        using error::error;
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_COMMON_ERROR_HPP
