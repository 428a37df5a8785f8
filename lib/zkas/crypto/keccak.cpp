/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <hash-library/keccak.h>
#include <zkas/common/bytes.hpp>
#include <zkas/crypto/keccak.hpp>

namespace zk_account_soundness::crypto::keccak {
    hash_256 digest(const std::span<const uint8_t> in)
    {
        Keccak hasher { Keccak::Keccak256 };
        hasher.add(in.data(), in.size());
        // hash-library returns the digest as a lowercase hex string
        const auto hex = hasher.getHash();
        hash_256 out {};
        init_from_hex(out, hex);
        return out;
    }
}
