/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef ZK_ACCOUNT_SOUNDNESS_CLI_COMPARE_HPP
#define ZK_ACCOUNT_SOUNDNESS_CLI_COMPARE_HPP

#include <ostream>
#include <zkas/chain/reader.hpp>
#include <zkas/compare/comparator.hpp>
#include <zkas/config.hpp>

namespace zk_account_soundness::cli::compare {
    // runs a comparison with already constructed readers, writes the report to os, and returns the exit code
    extern int execute(const settings &s, zk_account_soundness::compare::comparator &cmp, std::ostream &os);
}

#endif // !ZK_ACCOUNT_SOUNDNESS_CLI_COMPARE_HPP
