/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_COMMON_BYTES_HPP
#define ZK_ACCOUNT_SOUNDNESS_COMMON_BYTES_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "error.hpp"

namespace zk_account_soundness {
    // -1 for characters that are not hex digits
    inline int hex_digit_value(const char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    inline void init_from_hex(std::span<uint8_t> out, const std::string_view hex)
    {
        if (hex.size() != out.size() * 2)
            throw error("hex string must have {} characters but got {}: {}!", out.size() * 2, hex.size(), hex);
        for (size_t i = 0; i < out.size(); ++i) {
            const auto hi = hex_digit_value(hex[i * 2]);
            const auto lo = hex_digit_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0)
                throw error("unexpected character in a hex string: {}!", hex);
            out[i] = static_cast<uint8_t>(hi << 4 | lo);
        }
    }

    inline std::string to_hex(const std::span<const uint8_t> data)
    {
        static constexpr std::string_view digits { "0123456789abcdef" };
        std::string res {};
        res.reserve(data.size() * 2);
        for (const auto b: data) {
            res += digits[b >> 4];
            res += digits[b & 0xF];
        }
        return res;
    }
}

#endif // !ZK_ACCOUNT_SOUNDNESS_COMMON_BYTES_HPP
