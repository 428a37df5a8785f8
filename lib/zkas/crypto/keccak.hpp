/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CRYPTO_KECCAK_HPP
#define ZK_ACCOUNT_SOUNDNESS_CRYPTO_KECCAK_HPP

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace zk_account_soundness::crypto::keccak
{
    using hash_256 = std::array<uint8_t, 32>;

    extern hash_256 digest(std::span<const uint8_t> in);

    inline hash_256 digest(const std::string_view in)
    {
        return digest(std::span<const uint8_t> { reinterpret_cast<const uint8_t *>(in.data()), in.size() });
    }
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CRYPTO_KECCAK_HPP
