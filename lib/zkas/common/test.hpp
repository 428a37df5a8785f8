/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_COMMON_TEST_HPP
#define ZK_ACCOUNT_SOUNDNESS_COMMON_TEST_HPP

#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "format.hpp"

namespace zk_account_soundness {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            std::cerr << std::forward<T>(t);
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    // compares the values and reports both of them on a mismatch
    template<typename T>
    bool test_same(const T &expected, const T &actual, const std::source_location &loc=std::source_location::current())
    {
        const auto res = expected == actual;
        expect(res, loc) << fmt::format("expected: {} actual: {}", expected, actual);
        return res;
    }

    // the actual value is converted to the type of the expected one first
    template<typename T, typename Y>
    bool test_same(const T &expected, const Y &actual, const std::source_location &loc=std::source_location::current())
    {
        return test_same(expected, static_cast<T>(actual), loc);
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<zk_account_soundness::test_printer>> {};

#endif // !ZK_ACCOUNT_SOUNDNESS_COMMON_TEST_HPP
