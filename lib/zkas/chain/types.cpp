/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <zkas/chain/types.hpp>
#include <zkas/crypto/keccak.hpp>

namespace zk_account_soundness::chain {
    static constexpr std::array<std::string_view, 5> block_tags { "latest", "earliest", "pending", "safe", "finalized" };

    static std::string checksum_hex(const std::string &lower_hex)
    {
        const auto hash = crypto::keccak::digest(lower_hex);
        std::string res { "0x" };
        for (size_t i = 0; i < lower_hex.size(); ++i) {
            const auto c = lower_hex[i];
            const auto nibble = (i % 2 == 0) ? hash[i / 2] >> 4 : hash[i / 2] & 0xF;
            res += (c >= 'a' && nibble >= 8) ? static_cast<char>(c - 'a' + 'A') : c;
        }
        return res;
    }

    address address::from_hex(const std::string_view s)
    {
        if (s.size() != 42 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X'))
            throw error("an address must be 0x followed by 40 hex digits but got: '{}'", s);
        const auto digits = s.substr(2);
        bool has_lower = false;
        bool has_upper = false;
        std::string lower_hex {};
        lower_hex.reserve(digits.size());
        for (const char c: digits) {
            if (hex_digit_value(c) < 0)
                throw error("invalid hex digit '{}' in the address '{}'", c, s);
            if (c >= 'a' && c <= 'f')
                has_lower = true;
            else if (c >= 'A' && c <= 'F')
                has_upper = true;
            lower_hex += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (has_lower && has_upper && checksum_hex(lower_hex).substr(2) != digits)
            throw error("the address '{}' has an invalid EIP-55 checksum", s);
        address addr {};
        init_from_hex(std::span<uint8_t> { addr.data(), addr.size() }, lower_hex);
        return addr;
    }

    bool address::valid(const std::string_view s)
    {
        try {
            from_hex(s);
            return true;
        } catch (const error &) {
            return false;
        }
    }

    std::string address::to_string() const
    {
        return checksum_hex(to_hex(std::span<const uint8_t> { data(), size() }));
    }

    block_ref block_ref::from_string(const std::string_view s)
    {
        if (std::find(block_tags.begin(), block_tags.end(), s) != block_tags.end())
            return block_ref { std::string { s } };
        if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
            try {
                return block_ref { uint64_from_quantity(s) };
            } catch (const error &ex) {
                throw error("invalid block reference '{}': {}", s, ex.what());
            }
        }
        uint64_t height = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), height);
        if (s.empty() || ec != std::errc {} || ptr != s.data() + s.size())
            throw error("a block reference must be one of latest, earliest, pending, safe, finalized or a non-negative height but got: '{}'", s);
        return block_ref { height };
    }

    std::string block_ref::rpc_param() const
    {
        if (const auto *tag = std::get_if<std::string>(&_val); tag)
            return *tag;
        return fmt::format("0x{:x}", std::get<uint64_t>(_val));
    }

    std::string block_ref::to_string() const
    {
        if (const auto *tag = std::get_if<std::string>(&_val); tag)
            return *tag;
        return fmt::format("{}", std::get<uint64_t>(_val));
    }

    const char *kind_name(const fetch_error::kind_type k)
    {
        switch (k) {
            case fetch_error::kind_type::timeout: return "timeout";
            case fetch_error::kind_type::connection_refused: return "connection_refused";
            case fetch_error::kind_type::invalid_response: return "invalid_response";
            case fetch_error::kind_type::cancelled: return "cancelled";
            default: throw error("unsupported fetch_error kind: {}", static_cast<int>(k));
        }
    }
}
