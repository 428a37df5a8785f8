/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CHAIN_TYPES_HPP
#define ZK_ACCOUNT_SOUNDNESS_CHAIN_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <zkas/big-int.hpp>

namespace zk_account_soundness::chain {
    struct address: std::array<uint8_t, 20> {
        using base_type = std::array<uint8_t, 20>;

        // accepts 0x followed by 40 hex digits; a mixed-case input must carry a valid EIP-55 checksum
        static address from_hex(std::string_view s);
        static bool valid(std::string_view s);

        // EIP-55 checksummed representation
        std::string to_string() const;
    };
    using address_list = std::vector<address>;

    struct block_ref {
        static block_ref latest()
        {
            return block_ref { std::string { "latest" } };
        }

        static block_ref from_string(std::string_view s);

        block_ref() =default;

        explicit block_ref(const uint64_t height): _val { height }
        {
        }

        bool is_tag() const
        {
            return std::holds_alternative<std::string>(_val);
        }

        // the representation used as a JSON-RPC parameter: a tag or a hex quantity
        std::string rpc_param() const;
        // the human representation: a tag or a decimal height
        std::string to_string() const;

        bool operator==(const block_ref &o) const =default;
    private:
        std::variant<std::string, uint64_t> _val { std::string { "latest" } };

        explicit block_ref(std::string &&tag): _val { std::move(tag) }
        {
        }
    };

    struct account_state {
        address addr {};
        cpp_int balance {};
        uint64_t nonce = 0;

        bool operator==(const account_state &o) const =default;
    };

    struct fetch_error {
        enum class kind_type {
            timeout, connection_refused, invalid_response, cancelled
        };

        kind_type kind = kind_type::invalid_response;
        std::string message {};

        bool operator==(const fetch_error &o) const =default;
    };

    using fetch_result = std::variant<account_state, fetch_error>;

    inline bool ok(const fetch_result &r)
    {
        return std::holds_alternative<account_state>(r);
    }

    struct source_ref {
        std::string endpoint {};
        block_ref block = block_ref::latest();

        bool operator==(const source_ref &o) const =default;
    };

    extern const char *kind_name(fetch_error::kind_type k);
}

namespace fmt {
    template<>
    struct formatter<zk_account_soundness::chain::address>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<zk_account_soundness::chain::block_ref>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<zk_account_soundness::chain::fetch_error::kind_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", zk_account_soundness::chain::kind_name(v));
        }
    };

    template<>
    struct formatter<zk_account_soundness::chain::fetch_error>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}: {}", v.kind, v.message);
        }
    };

    template<>
    struct formatter<zk_account_soundness::chain::account_state>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{} balance: {} nonce: {}", v.addr, v.balance, v.nonce);
        }
    };
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CHAIN_TYPES_HPP
