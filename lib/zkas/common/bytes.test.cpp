/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <zkas/common/bytes.hpp>
#include <zkas/common/test.hpp>

using namespace zk_account_soundness;

suite common_bytes_suite = [] {
    "common::bytes"_test = [] {
        "hex_digit_value"_test = [] {
            test_same(0, hex_digit_value('0'));
            test_same(10, hex_digit_value('a'));
            test_same(15, hex_digit_value('F'));
            test_same(-1, hex_digit_value('g'));
            test_same(-1, hex_digit_value('x'));
        };
        "init_from_hex"_test = [] {
            std::array<uint8_t, 3> out {};
            init_from_hex(out, "00aBff");
            test_same(uint8_t { 0x00 }, out[0]);
            test_same(uint8_t { 0xAB }, out[1]);
            test_same(uint8_t { 0xFF }, out[2]);
            test_same(std::string { "00abff" }, to_hex(out));
            expect(throws<error>([&] { init_from_hex(out, "00ab"); }));
            expect(throws<error>([&] { init_from_hex(out, "00abzz"); }));
        };
    };
};
