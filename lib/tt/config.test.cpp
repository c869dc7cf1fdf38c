/* This file is part of TPU Turbo project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <filesystem>
#include <tt/config.hpp>
#include <tt/file.hpp>
#include <tt/test.hpp>

using namespace tpu_turbo;

suite config_suite = [] {
    "config"_test = [] {
        "default path"_test = [] {
            expect(std::getenv("TT_CONFIG") == nullptr);
            test_same(std::string { "./etc/tt.json" }, config_file::default_path());
            config_file::set_default_path("./tmp/other.json");
            test_same(std::string { "./tmp/other.json" }, config_file::default_path());
            config_file::set_default_path({});
            test_same(std::string { "./etc/tt.json" }, config_file::default_path());
        };
        "file"_test = [] {
            std::filesystem::create_directories("./tmp");
            const std::string path { "./tmp/config-test.json" };
            file::write(path, std::string_view { R"({"rpc":"http://127.0.0.1:8899","fanoutSlots":24,"websocket":null})" });
            const config_file cfg { path };
            test_same(std::string { "http://127.0.0.1:8899" }, cfg.get<std::string>("rpc", ""));
            test_same(24, cfg.get<uint64_t>("fanoutSlots", 12));
            test_same(std::string { "none" }, cfg.get<std::string>("websocket", "none"));
            test_same(60, cfg.get<int64_t>("confirmTimeoutSec", 60));
            expect(cfg.contains("rpc"));
            expect(!cfg.contains("commitment"));
            expect(throws<error>([&] { static_cast<void>(cfg.at("commitment")); }));
            std::filesystem::remove(path);
        };
        "missing file"_test = [] {
            expect(throws([] { config_file cfg { "./tmp/missing-config.json" }; }));
        };
        "mock"_test = [] {
            const config_json cfg { json::object { { "fanoutSlots", 3 }, { "commitment", "finalized" } } };
            test_same(3, cfg.get<uint64_t>("fanoutSlots", 12));
            expect(cfg.at("commitment").as_string() == std::string_view { "finalized" });
            expect(throws<error>([&] { static_cast<void>(cfg.at("rpc")); }));
        };
    };
};
