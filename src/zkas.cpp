/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <zkas/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace zk_account_soundness;
    return cli::run(argc, argv);
}
