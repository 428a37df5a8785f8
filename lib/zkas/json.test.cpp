/* This file is part of the zk-account-soundness project.
 * Copyright (c) 2025 zk-account-soundness contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <filesystem>
#include <fstream>
#include <zkas/common/test.hpp>
#include <zkas/json.hpp>

using namespace zk_account_soundness;

suite json_suite = [] {
    "json"_test = [] {
        "parse_text"_test = [] {
            const auto j = json::parse_text(R"({"rpcA": "http://localhost:8545", "timeout": 5})");
            test_same(size_t { 2 }, j.as_object().size());
            expect(throws<error>([] { json::parse_text("{\"rpcA\": "); }));
        };
        "load"_test = [] {
            const std::string tmp_dir { "./tmp/test-json" };
            std::filesystem::create_directories(tmp_dir);
            const auto path = tmp_dir + "/load.json";
            {
                std::ofstream os { path };
                os << R"([1, 2, 3])";
            }
            test_same(size_t { 3 }, json::load(path).as_array().size());
            expect(throws<error>([&] { json::load(tmp_dir + "/missing.json"); }));
        };
        "serialize_pretty object"_test = [] {
            const json::object j {
                { "name", "abc" },
                { "version", 123 }
            };
            test_same(std::string { "{\n  \"name\": \"abc\",\n  \"version\": 123\n}" }, json::serialize_pretty(j));
        };
        "serialize_pretty array"_test = [] {
            const json::array j { "name", 123 };
            test_same(std::string { "[\n  \"name\",\n  123\n]" }, json::serialize_pretty(j));
        };
    };
};
