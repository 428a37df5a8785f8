/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_LOGGER_HPP
#define ZK_ACCOUNT_SOUNDNESS_LOGGER_HPP

#include <exception>
#include <functional>
#include <source_location>
#include <zkas/common/error.hpp>
#include <zkas/common/format.hpp>

namespace zk_account_soundness::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    extern bool &tracing_enabled();
    extern void log(level lev, const std::string &msg);

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        log(lev, format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;

    // returns the exception thrown by the action, if any, after logging it with the caller's location
    inline std::exception_ptr run_log_errors(const action &act, const std::source_location &loc=std::source_location::current())
    {
        try {
            act();
        } catch (const std::exception &ex) {
            logger::error("{}:{} failed: {}", loc.file_name(), loc.line(), ex.what());
            return std::current_exception();
        } catch (...) {
            logger::error("{}:{} failed with a non-standard exception", loc.file_name(), loc.line());
            return std::current_exception();
        }
        return {};
    }

    inline void run_log_errors_rethrow(const action &act, const std::source_location &loc=std::source_location::current())
    {
        if (const auto ex = run_log_errors(act, loc))
            std::rethrow_exception(ex);
    }
}

#endif // !ZK_ACCOUNT_SOUNDNESS_LOGGER_HPP
