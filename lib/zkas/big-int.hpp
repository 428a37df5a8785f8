/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_BIG_INT_HPP
#define ZK_ACCOUNT_SOUNDNESS_BIG_INT_HPP

#include <cstdint>
#include <limits>
#include <string_view>
#include <boost/multiprecision/cpp_int.hpp>
#include <zkas/common/bytes.hpp>
#include <zkas/common/format.hpp>

namespace zk_account_soundness {
    using boost::multiprecision::cpp_int;

    // the largest quantity a JSON-RPC node may return for a 256-bit field
    static constexpr size_t big_int_max_hex_digits = 64;

    // parses a JSON-RPC hex quantity such as 0x0 or 0x1bc16d674ec80000
    inline cpp_int big_uint_from_quantity(const std::string_view s)
    {
        if (s.size() < 3 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X'))
            throw error("a hex quantity must start with 0x and have at least one digit but got: '{}'", s);
        const auto digits = s.substr(2);
        if (digits.size() > big_int_max_hex_digits)
            throw error("hex quantities larger than {} digits are not supported but got: {}", big_int_max_hex_digits, digits.size());
        cpp_int val = 0;
        for (const char c: digits) {
            const auto d = hex_digit_value(c);
            if (d < 0)
                throw error("invalid hex digit '{}' in the quantity '{}'", c, s);
            val <<= 4;
            val += d;
        }
        return val;
    }

    inline uint64_t uint64_from_quantity(const std::string_view s)
    {
        const auto val = big_uint_from_quantity(s);
        if (val > std::numeric_limits<uint64_t>::max())
            throw error("the quantity {} does not fit into 64 bits", s);
        return static_cast<uint64_t>(val);
    }
}

namespace fmt {
    template<>
    struct formatter<zk_account_soundness::cpp_int>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.str());
        }
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_BIG_INT_HPP
