/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CLI_STATE_HPP
#define ZK_ACCOUNT_SOUNDNESS_CLI_STATE_HPP

#include <ostream>
#include <zkas/chain/reader.hpp>
#include <zkas/config.hpp>

namespace zk_account_soundness::cli::state {
    // fetches all accounts concurrently from a single source and returns 0 only when all fetches succeed
    extern int execute(const settings &s, chain::reader &reader, std::ostream &os);
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CLI_STATE_HPP
