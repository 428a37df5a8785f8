/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <zkas/config.hpp>
#include <zkas/common/test.hpp>

using namespace zk_account_soundness;

namespace {
    void my_setenv(const char *name, const char *val)
    {
        if (name == nullptr)
            throw error("my_setenv: name cannot be null!");
        if (val != nullptr)
            setenv(name, val, 1);
        else
            unsetenv(name);
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "mock"_test = [] {
            config_json cfg { json::object {
                { "rpcA", "http://127.0.0.1:8545" },
                { "timeout", 12 },
                { "retries", nullptr }
            } };
            test_same(std::string { "http://127.0.0.1:8545" }, cfg.get_string("rpcA").value());
            test_same(uint64_t { 12 }, cfg.get_uint("timeout").value());
            expect(!cfg.get_uint("retries"));
            expect(!cfg.get_string("rpcB"));
            expect(throws<config_error>([&] { (void)cfg.at("rpcB"); }));
        };
        "type errors"_test = [] {
            config_json cfg { json::object {
                { "rpcA", 5 },
                { "timeout", "soon" },
                { "retries", -1 }
            } };
            expect(throws<config_error>([&] { (void)cfg.get_string("rpcA"); }));
            expect(throws<config_error>([&] { (void)cfg.get_uint("timeout"); }));
            expect(throws<config_error>([&] { (void)cfg.get_uint("retries"); }));
        };
        "file"_test = [] {
            const std::string tmp_dir { "./tmp/test-config" };
            std::filesystem::create_directories(tmp_dir);
            const auto path = tmp_dir + "/zkas.json";
            {
                std::ofstream os { path };
                os << R"({ "rpcB": "https://rpc.example.org/v1", "maxInFlight": 4 })";
            }
            config_file cfg { path };
            test_same(std::string { "https://rpc.example.org/v1" }, cfg.get_string("rpcB").value());
            test_same(uint64_t { 4 }, cfg.get_uint("maxInFlight").value());
        };
        "missing or broken file"_test = [] {
            const std::string tmp_dir { "./tmp/test-config" };
            std::filesystem::create_directories(tmp_dir);
            const auto path = tmp_dir + "/broken.json";
            {
                std::ofstream os { path };
                os << "[1, 2,";
            }
            expect(throws<config_error>([&] { config_file cfg { path }; }));
            expect(throws<config_error>([&] { config_file cfg { tmp_dir + "/missing.json" }; }));
        };
    };
    "environment"_test = [] {
        my_setenv("ZKAS_TEST_RPC", "http://localhost:8545");
        my_setenv("ZKAS_TEST_EMPTY", "");
        const auto env = environment::capture({ "ZKAS_TEST_RPC", "ZKAS_TEST_EMPTY", "ZKAS_TEST_MISSING" });
        test_same(std::string { "http://localhost:8545" }, env.get("ZKAS_TEST_RPC").value());
        expect(!env.get("ZKAS_TEST_EMPTY"));
        expect(!env.get("ZKAS_TEST_MISSING"));
        // the snapshot does not follow later changes
        my_setenv("ZKAS_TEST_RPC", nullptr);
        expect(env.get("ZKAS_TEST_RPC").has_value());
    };
};
